#include "rom.h"
#include <cstdio>
#include <stdexcept>

std::vector<uint8_t> ROM::read_file(const std::string& filename) {
    // Open file
    FILE* file = fopen(filename.c_str(), "rb");
    if (!file) {
        throw std::runtime_error("[ROM] Failed to open file: " + filename);
    }

    // Get file size
    long size = -1;
    if (fseek(file, 0, SEEK_END) == 0) {
        size = ftell(file);
    }
    if (size < 0 || fseek(file, 0, SEEK_SET) != 0) {
        fclose(file);
        throw std::runtime_error("[ROM] Failed to determine size of file: " + filename);
    }

    // Allocate memory and read file
    std::vector<uint8_t> data(static_cast<size_t>(size));
    size_t read_count = data.empty() ? 0 : fread(data.data(), 1, data.size(), file);
    fclose(file);

    if (read_count != data.size()) {
        throw std::runtime_error("[ROM] Failed to read file: " + filename);
    }

    return data;
}

std::vector<uint8_t> ROM::load(const std::string& filename) {
    std::vector<uint8_t> data = read_file(filename);

    if (data.empty()) {
        throw std::runtime_error("[ROM] Program file is empty: " + filename);
    }

    if (data.size() > MAX_PROGRAM_SIZE) {
        throw std::runtime_error("[ROM] Program file is too large (" + std::to_string(data.size()) +
                                 " bytes, max " + std::to_string(MAX_PROGRAM_SIZE) + "): " + filename);
    }

    printf("[ROM] Successfully loaded ROM: %s\n", filename.c_str());
    printf("[ROM] ROM size: %zu bytes\n", data.size());

    return data;
}

std::vector<uint8_t> ROM::load_font(const std::string& filename) {
    std::vector<uint8_t> data = read_file(filename);

    if (data.size() != FONT_FILE_SIZE) {
        throw std::runtime_error("[ROM] Font file must be exactly " + std::to_string(FONT_FILE_SIZE) +
                                 " bytes (got " + std::to_string(data.size()) + "): " + filename);
    }

    printf("[ROM] Loaded font: %s\n", filename.c_str());

    return data;
}
