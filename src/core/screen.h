#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * @brief The 64x32 monochrome CHIP-8 display.
 *
 * Sprites are 8 pixels wide and up to 15 rows tall, one byte per row with the most significant
 * bit leftmost. Each set bit toggles its pixel (XOR). The sprite origin wraps around the screen
 * (x mod 64, y mod 32), but rows and columns that would fall off the right or bottom edge are
 * clipped, not wrapped.
 *
 * Presentation lives outside the core: the frontend pulls frame_buffer() after each frame.
 */
class Screen {
    public:
        static constexpr uint8_t WIDTH = 64;
        static constexpr uint8_t HEIGHT = 32;

        // Indexed as [y][x]
        using FrameBuffer = bool[HEIGHT][WIDTH];

        Screen();

        // Turn every pixel off
        void clear();

        // XOR-draw a sprite. Returns true if any pixel went from on to off (collision)
        bool draw_sprite(uint8_t x, uint8_t y, const uint8_t* sprite, size_t rows);
        bool draw_sprite(uint8_t x, uint8_t y, const std::vector<uint8_t>& sprite);

        const FrameBuffer& frame_buffer() const { return framebuffer; }
        bool get_pixel(uint8_t x, uint8_t y) const { return framebuffer[y][x]; }
    private:
        FrameBuffer framebuffer;
};
