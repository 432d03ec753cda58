#include "keypad.h"

void Keypad::set(uint8_t key) {
    key_states |= (1 << (key & 0x0F));
}

void Keypad::clear(uint8_t key) {
    key_states &= ~(1 << (key & 0x0F));
}

bool Keypad::is_pressed(uint8_t key) const {
    return (key_states & (1 << (key & 0x0F))) != 0;
}

std::optional<uint8_t> Keypad::first_pressed() const {
    for (uint8_t key = 0; key < NUM_KEYS; key++) {
        if (is_pressed(key)) return key;
    }
    return std::nullopt;
}
