#include "input.h"

int Input::keypad_index(SDL_Keycode key) {
    switch (key) {
        case SDLK_1: return 0x1;
        case SDLK_2: return 0x2;
        case SDLK_3: return 0x3;
        case SDLK_4: return 0xC;

        case SDLK_Q: return 0x4;
        case SDLK_W: return 0x5;
        case SDLK_E: return 0x6;
        case SDLK_R: return 0xD;

        case SDLK_A: return 0x7;
        case SDLK_S: return 0x8;
        case SDLK_D: return 0x9;
        case SDLK_F: return 0xE;

        case SDLK_Z:
        case SDLK_Y: return 0xA;
        case SDLK_X: return 0x0;
        case SDLK_C: return 0xB;
        case SDLK_V: return 0xF;

        default: return -1;
    }
}

void Input::handle_sdl_event(const SDL_Event& e) {
    if (e.type == SDL_EVENT_QUIT) {
        quit = true;
        return;
    }

    if (e.type != SDL_EVENT_KEY_DOWN && e.type != SDL_EVENT_KEY_UP) return;

    bool pressed = (e.type == SDL_EVENT_KEY_DOWN);
    SDL_Keycode key = e.key.key;

    if (pressed && !e.key.repeat) {
        switch (key) {
            case SDLK_ESCAPE: quit = true; return;
            case SDLK_F1: register_dump_requested = true; return;
            case SDLK_F2: history_dump_requested = true; return;
            default: break;
        }
    }

    int index = keypad_index(key);
    if (index < 0) return;

    if (pressed) {
        keypad.set(static_cast<uint8_t>(index));
    } else {
        keypad.clear(static_cast<uint8_t>(index));
    }
}

bool Input::take_register_dump_request() {
    bool requested = register_dump_requested;
    register_dump_requested = false;
    return requested;
}

bool Input::take_history_dump_request() {
    bool requested = history_dump_requested;
    history_dump_requested = false;
    return requested;
}
