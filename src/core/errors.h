#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>
#include <iomanip>

/**
 * @brief Raised when a fetched word matches no known CHIP-8 instruction pattern.
 *
 * Carries the raw opcode and the address it was fetched from, so the embedder can report
 * exactly where execution stopped.
 */
class UnimplementedInstruction : public std::runtime_error {
    public:
        UnimplementedInstruction(uint16_t opcode, uint16_t address)
            : std::runtime_error(format(opcode, address)), opcode_(opcode), address_(address) {}

        uint16_t opcode() const { return opcode_; }
        uint16_t address() const { return address_; }

    private:
        uint16_t opcode_;
        uint16_t address_;

        static std::string format(uint16_t opcode, uint16_t address) {
            std::ostringstream oss;
            oss << std::hex << std::uppercase << std::setfill('0')
                << "[Machine] Unimplemented instruction 0x" << std::setw(4) << opcode
                << " at address 0x" << std::setw(4) << address;
            return oss.str();
        }
};

// Call depth exceeded the stack capacity
class StackOverflow : public std::runtime_error {
    public:
        explicit StackOverflow(uint16_t return_address)
            : std::runtime_error(format(return_address)) {}

    private:
        static std::string format(uint16_t return_address) {
            std::ostringstream oss;
            oss << std::hex << std::uppercase << std::setfill('0')
                << "[Stack] Stack overflow while pushing return address 0x" << std::setw(4) << return_address;
            return oss.str();
        }
};

// Return executed with no saved address
class StackUnderflow : public std::runtime_error {
    public:
        StackUnderflow() : std::runtime_error("[Stack] Stack underflow: return with empty stack") {}
};
