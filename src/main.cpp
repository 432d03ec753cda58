#include <iostream>
#include <SDL3/SDL.h>
#include <chrono>
#include <stdexcept>
#include <string>

#include "config.h"
#include "core/machine.h"
#include "core/rom.h"
#include "frontend/audio.h"
#include "frontend/display.h"
#include "frontend/input.h"

// Structure to hold file dialog state
struct DialogState {
    bool complete = false;
    std::string selected_path;
};

// Callback function for file dialog
void SDLCALL file_dialog_callback(void* userdata, const char* const* filelist, int filter_count) {
    DialogState* state = static_cast<DialogState*>(userdata);
    if (filelist && *filelist) {
        // filelist is a null-terminated array of strings
        state->selected_path = *filelist;
    }
    state->complete = true;
}

// Returns an empty path if the user cancelled or closed the app
static std::string ask_for_program() {
    DialogState dialog_state;
    const SDL_DialogFileFilter filters[] = {
        { "CHIP-8 program", "ch8;c8" },
        { "All files", "*" }
    };

    SDL_ShowOpenFileDialog(file_dialog_callback, &dialog_state, nullptr, filters, 2, ".", false);

    // Wait for the dialog to be closed
    while (!dialog_state.complete) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_QUIT) return "";
        }
        SDL_Delay(10);
    }

    return dialog_state.selected_path;
}

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    std::cout << "[ChipByte] Initializing ChipByte..." << std::endl;

    // Initialize SDL3, throw error if it fails
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_EVENTS)) {
        std::cerr << "[SDL] Failed to initialize - SDL_Error: " << SDL_GetError() << std::endl;
        return 1;
    }

    if (config.program_path.empty()) {
        config.program_path = ask_for_program();

        // If user cancelled the dialog, close app
        if (config.program_path.empty()) {
            SDL_Quit();
            return 0;
        }
    }

    Machine machine(config.quirks);
    machine.set_trace(config.trace);

    // Load font and program
    try {
        if (config.font_path.empty()) {
            machine.load_font(DEFAULT_FONT);
        } else {
            machine.load_font(ROM::load_font(config.font_path));
        }
        machine.load_program(ROM::load(config.program_path));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::string error_msg = std::string("Failed to load program: ") + e.what();
        SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "ChipByte - Initialization Error", error_msg.c_str(), nullptr);
        SDL_Quit();
        return 1;
    }

    int exit_code = 0;
    {
        Display display(config.screen_scale);
        Audio audio;
        Input input;

        bool running = true;
        try {
            display.init_sdl();
            audio.init_sdl();
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "ChipByte - Initialization Error", e.what(), nullptr);
            exit_code = 1;
            running = false;
        }

        if (running) {
            std::cout << "[ChipByte] Running " << config.program_path << " at " << config.frames_per_second << " FPS" << std::endl;
        }

        const uint64_t frame_time_ns = 1'000'000'000ULL / config.frames_per_second;
        uint64_t last_frame = SDL_GetTicksNS();
        bool halted = false;

        // Main emulation loop
        while (running) {
            uint64_t start_time = SDL_GetTicksNS();

            SDL_Event e;
            while (SDL_PollEvent(&e)) {
                input.handle_sdl_event(e);
            }
            if (input.quit_requested()) break;

            // Debug keys
            if (input.take_register_dump_request()) machine.dump_registers();
            if (input.take_history_dump_request()) machine.dump_history();

            if (!halted) {
                machine.load_keypad(input.get_keypad());

                try {
                    machine.run_frame(std::chrono::nanoseconds(start_time - last_frame));
                } catch (const std::exception& ex) {
                    std::cerr << "[ChipByte] Emulation error at PC 0x" << std::hex << machine.program_counter() << std::dec << std::endl;
                    std::cerr << ex.what() << std::endl;
                    machine.dump_history();
                    SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "ChipByte - Execution Error", ex.what(), display.get_window());
                    exit_code = 1;
                    running = false; // Stop on error
                    break;
                }

                if (machine.reached_end_of_program()) {
                    std::cout << "[ChipByte] Reached end of program" << std::endl;
                    halted = true;
                }
            }
            last_frame = start_time;

            audio.set_playing(!halted && machine.playing_sound());
            display.render_frame(machine.frame_buffer());

            // Timing synchronization
            uint64_t elapsed_ns = SDL_GetTicksNS() - start_time;
            if (elapsed_ns < frame_time_ns) {
                // Sleep for the remaining time
                SDL_DelayNS(frame_time_ns - elapsed_ns);
            }
        }
    }

    SDL_Quit();
    return exit_code;
}
