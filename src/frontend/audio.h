#pragma once
#include <SDL3/SDL.h>

/**
 * @brief Beeper for the CHIP-8 sound timer.
 *
 * Plays a 440 Hz square wave on a mono 44.1 kHz float stream while enabled. Samples are generated
 * on SDL's audio thread through the stream callback.
 */
class Audio {
    public:
        Audio() = default;
        ~Audio();

        Audio(const Audio&) = delete;
        Audio& operator=(const Audio&) = delete;

        // Open the default playback device (starts paused). Throws std::runtime_error on failure
        void init_sdl();

        // Resume or pause the tone. No-op if the state doesn't change
        void set_playing(bool enabled);
    private:
        static constexpr int SAMPLE_RATE = 44100;
        static constexpr float TONE_FREQUENCY = 440.0f;
        static constexpr float VOLUME = 0.05f;

        SDL_AudioStream* stream = nullptr;
        bool playing = false;

        // Square wave phase in [0, 1)
        float phase = 0.0f;

        static void SDLCALL feed(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);
};
