#include "audio.h"
#include <stdexcept>
#include <string>

Audio::~Audio() {
    if (stream) SDL_DestroyAudioStream(stream);
}

void Audio::init_sdl() {
    SDL_AudioSpec spec;
    spec.format = SDL_AUDIO_F32;
    spec.channels = 1;
    spec.freq = SAMPLE_RATE;

    stream = SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, &Audio::feed, this);
    if (!stream) {
        throw std::runtime_error(std::string("[SDL] Failed to open audio device - SDL_Error: ") + SDL_GetError());
    }
}

void Audio::set_playing(bool enabled) {
    if (!stream || enabled == playing) return;

    if (enabled) {
        SDL_ResumeAudioStreamDevice(stream);
    } else {
        SDL_PauseAudioStreamDevice(stream);
    }
    playing = enabled;
}

void SDLCALL Audio::feed(void* userdata, SDL_AudioStream* stream, int additional_amount, int /*total_amount*/) {
    Audio* audio = static_cast<Audio*>(userdata);
    const float phase_inc = TONE_FREQUENCY / SAMPLE_RATE;

    float samples[256];
    int remaining = additional_amount / static_cast<int>(sizeof(float));

    while (remaining > 0) {
        int count = remaining < 256 ? remaining : 256;
        for (int n = 0; n < count; n++) {
            samples[n] = (audio->phase <= 0.5f) ? VOLUME : -VOLUME;
            audio->phase += phase_inc;
            if (audio->phase >= 1.0f) audio->phase -= 1.0f;
        }
        SDL_PutAudioStreamData(stream, samples, count * static_cast<int>(sizeof(float)));
        remaining -= count;
    }
}
