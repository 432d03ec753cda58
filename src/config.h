#pragma once
#include <cstdint>
#include <string>

#include "core/machine.h"

// Frontend settings, filled from the command line
struct AppConfig {
    uint32_t screen_scale = 20;
    uint32_t frames_per_second = 60;
    std::string font_path;    // empty = built-in font
    std::string program_path; // empty = ask with a file dialog
    Quirks quirks;
    bool trace = false;
    bool show_help = false;
};

// Throws std::invalid_argument on unknown options or malformed values
AppConfig parse_args(int argc, const char* const* argv);

std::string usage(const std::string& argv0);
