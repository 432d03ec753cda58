#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Reads CHIP-8 program and font files from disk
class ROM {
    public:
        // Programs are loaded at $200, so at most $E00 bytes fit
        static constexpr size_t MAX_PROGRAM_SIZE = 0x1000 - 0x200;
        static constexpr size_t FONT_FILE_SIZE = 80;

        // Throws std::runtime_error if the file can't be read, is empty or too large
        static std::vector<uint8_t> load(const std::string& filename);

        // Throws std::runtime_error unless the file is exactly FONT_FILE_SIZE bytes
        static std::vector<uint8_t> load_font(const std::string& filename);
    private:
        static std::vector<uint8_t> read_file(const std::string& filename);
};
