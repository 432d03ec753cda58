#include "screen.h"
#include <cstring>

Screen::Screen() {
    clear();
}

void Screen::clear() {
    memset(framebuffer, 0, sizeof(framebuffer));
}

bool Screen::draw_sprite(uint8_t x, uint8_t y, const uint8_t* sprite, size_t rows) {
    // Only the origin wraps
    int origin_x = x % WIDTH;
    int origin_y = y % HEIGHT;

    bool pixel_turned_off = false;

    for (size_t row = 0; row < rows; row++) {
        int py = origin_y + static_cast<int>(row);
        if (py >= HEIGHT) break; // clipped at the bottom edge

        uint8_t line = sprite[row];
        for (int col = 0; col < 8; col++) {
            int px = origin_x + col;
            if (px >= WIDTH) break; // clipped at the right edge

            // Leftmost pixel is the most significant bit
            if (!((line >> (7 - col)) & 0x01)) continue;

            bool was_on = framebuffer[py][px];
            framebuffer[py][px] = !was_on;
            pixel_turned_off |= was_on;
        }
    }

    return pixel_turned_off;
}

bool Screen::draw_sprite(uint8_t x, uint8_t y, const std::vector<uint8_t>& sprite) {
    return draw_sprite(x, y, sprite.data(), sprite.size());
}
