#include "memory.h"
#include <cstring>
#include <stdexcept>
#include <sstream>
#include <iomanip>

Memory::Memory() {
    clear();
}

void Memory::check_range(size_t address, size_t size) {
    if (address + size > SIZE) {
        std::ostringstream oss;
        oss << "[Memory] Access out of range: 0x" << std::hex << std::uppercase
            << std::setw(4) << std::setfill('0') << address
            << " (+" << std::dec << size << " bytes)";
        throw std::out_of_range(oss.str());
    }
}

uint8_t Memory::read_byte(size_t address) const {
    check_range(address, 1);
    return ram[address];
}

void Memory::write_byte(size_t address, uint8_t value) {
    check_range(address, 1);
    ram[address] = value;
}

uint16_t Memory::read_word(size_t address) const {
    check_range(address, 2);
    return (static_cast<uint16_t>(ram[address]) << 8) | ram[address + 1];
}

void Memory::write_word(size_t address, uint16_t value) {
    check_range(address, 2);
    ram[address] = (value >> 8) & 0xFF;
    ram[address + 1] = value & 0xFF;
}

void Memory::load(const uint8_t* data, size_t size, size_t address) {
    check_range(address, size);
    if (size > 0) {
        memcpy(ram + address, data, size);
    }
}

void Memory::load(const std::vector<uint8_t>& data, size_t address) {
    load(data.data(), data.size(), address);
}

void Memory::clear() {
    memset(ram, 0, sizeof(ram));
}
