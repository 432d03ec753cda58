#include "config.h"
#include <sstream>
#include <stdexcept>

static uint32_t parse_positive(const std::string& option, const std::string& value) {
    size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("[Config] " + option + " expects an integer from 1 to 1000, got '" + value + "'");
    }

    if (consumed != value.size() || parsed == 0 || parsed > 1000 || value[0] == '-') {
        throw std::invalid_argument("[Config] " + option + " expects an integer from 1 to 1000, got '" + value + "'");
    }
    return static_cast<uint32_t>(parsed);
}

AppConfig parse_args(int argc, const char* const* argv) {
    AppConfig config;

    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];

        // Options that take a value
        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("[Config] Missing value for " + a);
            }
            return argv[++i];
        };

        if (a == "--help" || a == "-h") {
            config.show_help = true;
        } else if (a == "--scale") {
            config.screen_scale = parse_positive(a, next_value());
        } else if (a == "--fps") {
            config.frames_per_second = parse_positive(a, next_value());
        } else if (a == "--font") {
            config.font_path = next_value();
        } else if (a == "--shift-uses-vy") {
            config.quirks.assign_before_shift = true;
        } else if (a == "--index-overflow-flag") {
            config.quirks.set_flag_on_index_overflow = true;
        } else if (a == "--increment-index") {
            config.quirks.modify_index_on_dump_or_load = true;
        } else if (a == "--trace") {
            config.trace = true;
        } else if (!a.empty() && a[0] == '-') {
            throw std::invalid_argument("[Config] Unknown option: " + a);
        } else if (!config.program_path.empty()) {
            throw std::invalid_argument("[Config] Only one program may be given (got '" +
                                        config.program_path + "' and '" + a + "')");
        } else {
            config.program_path = a;
        }
    }

    return config;
}

std::string usage(const std::string& argv0) {
    std::ostringstream oss;
    oss << "Usage: " << argv0 << " [options] [program.ch8]\n"
        << "\n"
        << "Options:\n"
        << "  --scale N              window pixels per CHIP-8 pixel (default 20)\n"
        << "  --fps N                frames per second (default 60)\n"
        << "  --font PATH            80-byte font file (default: built-in)\n"
        << "  --shift-uses-vy        8XY6/8XYE copy VY into VX before shifting\n"
        << "  --index-overflow-flag  FX1E sets VF when I goes past 0x1000\n"
        << "  --increment-index      FX55/FX65 advance I past the registers\n"
        << "  --trace                print every executed instruction\n"
        << "  --help                 show this message\n"
        << "\n"
        << "Without a program path a file dialog is opened.\n";
    return oss.str();
}
