#pragma once
#include <cstdint>
#include <optional>

/**
 * @brief The CHIP-8 hex keypad (keys 0x0-0xF).
 *
 * Layout:
 *   1 2 3 C
 *   4 5 6 D
 *   7 8 9 E
 *   A 0 B F
 *
 * Key states are kept as a 16-bit mask, bit N set = key N held. Key indices are validated by
 * the caller; only the low nibble is used.
 */
class Keypad {
    public:
        static constexpr uint8_t NUM_KEYS = 16;

        void set(uint8_t key);
        void clear(uint8_t key);
        void release_all() { key_states = 0; }

        bool is_pressed(uint8_t key) const;

        // Lowest key index currently held, if any
        std::optional<uint8_t> first_pressed() const;

        uint16_t get_key_states() const { return key_states; }
    private:
        uint16_t key_states = 0;
};
