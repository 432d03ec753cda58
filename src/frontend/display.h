#pragma once
#include <cstdint>
#include <SDL3/SDL.h>

#include "../core/screen.h"

// SDL window presenting the CHIP-8 frame buffer, scaled up with nearest-neighbour filtering
class Display {
    public:
        explicit Display(uint32_t scale);
        ~Display();

        Display(const Display&) = delete;
        Display& operator=(const Display&) = delete;

        // Create window, renderer and texture. Throws std::runtime_error on failure
        void init_sdl();

        // Upload the frame buffer and present it
        void render_frame(const Screen::FrameBuffer& frame_buffer);

        SDL_Window* get_window() const { return window; }
    private:
        static constexpr uint32_t COLOR_ON = 0xFFFFFFFF;
        static constexpr uint32_t COLOR_OFF = 0xFF000000;

        uint32_t scale;

        // SDL components
        SDL_Window* window = nullptr;
        SDL_Renderer* renderer = nullptr;
        SDL_Texture* texture = nullptr;

        // ARGB pixels uploaded to the texture each frame
        uint32_t pixels[Screen::WIDTH * Screen::HEIGHT];
};
