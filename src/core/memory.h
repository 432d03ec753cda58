#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * @brief The CHIP-8 4 KB address space ($000-$FFF).
 *
 * Memory Map:
 *
 * Interpreter area - $000-$1FF. Unused by this interpreter apart from the font.
 * Font sprites - $050-$09F. 16 hex digit glyphs, 5 bytes each.
 * Program - $200-$FFF. Programs are loaded verbatim starting at $200.
 *
 * There is no protection between regions. Instruction words are stored big-endian (most
 * significant byte at the lower address). Any access outside $000-$FFF throws std::out_of_range.
 */
class Memory {
    public:
        static constexpr size_t SIZE = 0x1000;

        Memory();

        uint8_t read_byte(size_t address) const;
        void write_byte(size_t address, uint8_t value);

        // Big-endian 16-bit access
        uint16_t read_word(size_t address) const;
        void write_word(size_t address, uint16_t value);

        // Copy raw bytes starting at address
        void load(const uint8_t* data, size_t size, size_t address);
        void load(const std::vector<uint8_t>& data, size_t address);

        void clear();
    private:
        uint8_t ram[SIZE];

        static void check_range(size_t address, size_t size);
};
