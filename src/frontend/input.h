#pragma once
#include <SDL3/SDL.h>

#include "../core/keypad.h"

/**
 * @brief Maps the PC keyboard onto the CHIP-8 hex keypad.
 *
 * Keyboard        CHIP-8
 *  1 2 3 4   ->   1 2 3 C
 *  Q W E R   ->   4 5 6 D
 *  A S D F   ->   7 8 9 E
 *  Z X C V   ->   A 0 B F   (Y also maps to A for QWERTZ layouts)
 *
 * Keys stay held until their key-up event arrives. Escape or closing the window requests quit.
 * F1/F2 request a register/history dump.
 */
class Input {
    public:
        // Handle one SDL event
        void handle_sdl_event(const SDL_Event& e);

        const Keypad& get_keypad() const { return keypad; }
        bool quit_requested() const { return quit; }

        // Debug requests, cleared once read
        bool take_register_dump_request();
        bool take_history_dump_request();

        // CHIP-8 key for a keyboard key, -1 if unmapped
        static int keypad_index(SDL_Keycode key);
    private:
        Keypad keypad;
        bool quit = false;
        bool register_dump_requested = false;
        bool history_dump_requested = false;
};
