#include "display.h"
#include <cstring>
#include <stdexcept>
#include <string>

Display::Display(uint32_t scale) : scale(scale) {
    memset(pixels, 0, sizeof(pixels));
}

Display::~Display() {
    if (texture) SDL_DestroyTexture(texture);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window) SDL_DestroyWindow(window);
}

void Display::init_sdl() {
    window = SDL_CreateWindow("ChipByte", Screen::WIDTH * scale, Screen::HEIGHT * scale, 0);
    if (!window) {
        throw std::runtime_error(std::string("[SDL] Failed to create window - SDL_Error: ") + SDL_GetError());
    }

    renderer = SDL_CreateRenderer(window, nullptr);
    if (!renderer) {
        throw std::runtime_error(std::string("[SDL] Failed to create renderer - SDL_Error: ") + SDL_GetError());
    }

    texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING, Screen::WIDTH, Screen::HEIGHT);
    if (!texture) {
        throw std::runtime_error(std::string("[SDL] Failed to create texture - SDL_Error: ") + SDL_GetError());
    }
    SDL_SetTextureScaleMode(texture, SDL_SCALEMODE_NEAREST);
}

void Display::render_frame(const Screen::FrameBuffer& frame_buffer) {
    for (int y = 0; y < Screen::HEIGHT; y++) {
        for (int x = 0; x < Screen::WIDTH; x++) {
            pixels[y * Screen::WIDTH + x] = frame_buffer[y][x] ? COLOR_ON : COLOR_OFF;
        }
    }

    SDL_UpdateTexture(texture, NULL, pixels, Screen::WIDTH * sizeof(uint32_t));
    SDL_RenderClear(renderer);
    SDL_RenderTexture(renderer, texture, NULL, NULL);
    SDL_RenderPresent(renderer);
}
