#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <random>
#include <vector>

#include "font.h"
#include "keypad.h"
#include "memory.h"
#include "screen.h"
#include "stack.h"

/**
 * @brief Interpreter dialect switches, fixed when the Machine is built.
 *
 * assign_before_shift - 8XY6/8XYE copy VY into VX before shifting (COSMAC VIP behaviour).
 * set_flag_on_index_overflow - FX1E sets VF to 1 when I ends up above $1000 (Amiga behaviour).
 * modify_index_on_dump_or_load - FX55/FX65 leave I pointing past the last register written/read.
 */
struct Quirks {
    bool assign_before_shift = false;
    bool set_flag_on_index_overflow = false;
    bool modify_index_on_dump_or_load = false;
};

/**
 * @brief The CHIP-8 virtual machine: register file, memory, timers and the fetch-decode-execute engine.
 *
 * 16 8-bit General Purpose Registers - V0 through VF. VF doubles as the flag register: carry,
 * borrow, shifted-out bit and sprite collision are all written to it, and it is dumped/loaded by
 * FX55/FX65 like any other register.
 *
 * 16-bit Index Register (I) - used for memory addressing (sprites, font glyphs, register dumps).
 *
 * 16-bit Program Counter - starts at $200 and is advanced by 2 after every fetch, before the
 * instruction executes. Jumps, calls, returns and skips modify it again afterwards.
 *
 * Delay and Sound Timers - decremented once per frame by run_frame(). Sound plays while the sound
 * timer is above 1.
 *
 * Instructions execute at a fixed rate of ~700 Hz regardless of the frame rate: run_frame() adds
 * the elapsed time to an execution debt and executes instructions until the debt is paid off.
 */
class Machine {
    public:
        static constexpr uint16_t FONT_START_ADDRESS = 0x050;
        static constexpr uint16_t PROGRAM_START_ADDRESS = 0x200;
        static constexpr uint8_t NUM_REGISTERS = 16;
        static constexpr uint8_t FLAG_REGISTER = 0xF;

        // 1/700th of a second
        static constexpr std::chrono::nanoseconds INSTRUCTION_DURATION{1'428'571};

        static constexpr size_t HISTORY_SIZE = 32;

        // Fields of a fetched instruction word
        struct Opcode {
            uint16_t raw;
            uint8_t group;    // bits 15-12
            uint8_t x;        // bits 11-8
            uint8_t y;        // bits 7-4
            uint8_t n;        // bits 3-0 (subgroup / nibble constant)
            uint8_t nn;       // bits 7-0
            uint16_t nnn;     // bits 11-0
        };

        // Instruction handling
        struct Instruction {
            const char* name;
            void (Machine::*operate)(const Opcode&);
        };

        explicit Machine(const Quirks& quirks = Quirks());

        // Split a raw instruction word into its fields
        static Opcode decode_fields(uint16_t raw);

        // Select the handler for an opcode. Unknown patterns map to XXX
        const Instruction& decode(const Opcode& op) const;

        // Fetch, decode and execute one instruction
        void step();

        // Advance one frame: tick timers once, then execute instructions for the elapsed time
        void run_frame(std::chrono::nanoseconds elapsed);

        // Replace the keypad state (once per frame, before run_frame)
        void load_keypad(const Keypad& new_keypad) { keypad = new_keypad; }

        /**
         * Loading / injection
         */
        void load_bytes(const std::vector<uint8_t>& bytes, uint16_t address);
        void load_program(const std::vector<uint8_t>& program);
        void load_font(const std::array<uint8_t, FONT_SIZE>& font);
        void load_font(const std::vector<uint8_t>& font);
        void load_opcode(uint16_t opcode, uint16_t address);
        void load_opcodes(const std::vector<uint16_t>& opcodes, uint16_t address);
        void load_register(uint8_t reg, uint8_t value);
        void load_registers(const std::array<uint8_t, NUM_REGISTERS>& values);
        void load_index(uint16_t address) { i = address; }

        void seed_random(uint32_t seed) { rng.seed(seed); }
        void set_trace(bool enabled) { trace = enabled; }

        // Back to the start of the program. Memory (program + font) is kept
        void reset();

        /**
         * State access
         */
        uint8_t register_value(uint8_t reg) const { return v[reg & 0x0F]; }
        uint16_t index() const { return i; }
        uint16_t program_counter() const { return pc; }
        uint8_t delay_timer() const { return delay; }
        uint8_t sound_timer() const { return sound; }
        size_t stack_depth() const { return stack.depth(); }
        bool playing_sound() const { return sound_playing; }
        bool reached_end_of_program() const { return reached_end; }
        std::chrono::nanoseconds execution_debt() const { return exec_debt; }
        const Quirks& get_quirks() const { return quirks; }

        const Memory& get_memory() const { return memory; }
        const Screen& get_screen() const { return screen; }
        const Keypad& get_keypad() const { return keypad; }
        const Screen::FrameBuffer& frame_buffer() const { return screen.frame_buffer(); }

        // Debug output
        void dump_registers() const;
        void dump_history() const;
    private:
        const Quirks quirks;

        Memory memory;
        Stack stack;
        Screen screen;
        Keypad keypad;

        uint8_t v[NUM_REGISTERS];
        uint16_t i = 0;
        uint16_t pc = PROGRAM_START_ADDRESS;

        uint8_t delay = 0;
        uint8_t sound = 0;
        bool sound_playing = false;

        bool reached_end = false;
        std::chrono::nanoseconds exec_debt{0};

        std::mt19937 rng;
        bool trace = false;

        // Ring buffer of the last executed instructions
        struct HistoryEntry {
            uint16_t address;
            uint16_t opcode;
        };
        std::array<HistoryEntry, HISTORY_SIZE> history{};
        size_t history_next = 0;
        size_t history_count = 0;

        void record_history(uint16_t address, uint16_t opcode);

        // Decrement delay/sound timers, called once per frame
        void tick_timers();

        // Second-level dispatch for groups that need more than the top nibble
        const Instruction& decode_system(const Opcode& op) const;     // 0___
        const Instruction& decode_arithmetic(const Opcode& op) const; // 8XY_
        const Instruction& decode_key(const Opcode& op) const;        // EX__
        const Instruction& decode_misc(const Opcode& op) const;       // FX__

        // Opcode Implementations

        // Unknown opcode, throws UnimplementedInstruction
        void XXX(const Opcode& op);

        // End of program sentinel (0000)
        void END(const Opcode& op);

        // Clear the display (00E0)
        void CLS(const Opcode& op);

        // Return from subroutine (00EE)
        void RET(const Opcode& op);

        // Jump to NNN (1NNN)
        void JP_addr(const Opcode& op);

        // Call subroutine at NNN (2NNN)
        void CALL_addr(const Opcode& op);

        // Skip group
        void SE_Vx_byte(const Opcode& op);  // 3XNN
        void SNE_Vx_byte(const Opcode& op); // 4XNN
        void SE_Vx_Vy(const Opcode& op);    // 5XY0
        void SNE_Vx_Vy(const Opcode& op);   // 9XY0

        // VX = NN (6XNN)
        void LD_Vx_byte(const Opcode& op);

        // VX += NN, no carry flag (7XNN)
        void ADD_Vx_byte(const Opcode& op);

        // Register-register ALU group
        void LD_Vx_Vy(const Opcode& op);   // 8XY0
        void OR_Vx_Vy(const Opcode& op);   // 8XY1
        void AND_Vx_Vy(const Opcode& op);  // 8XY2
        void XOR_Vx_Vy(const Opcode& op);  // 8XY3
        void ADD_Vx_Vy(const Opcode& op);  // 8XY4
        void SUB_Vx_Vy(const Opcode& op);  // 8XY5
        void SHR_Vx_Vy(const Opcode& op);  // 8XY6
        void SUBN_Vx_Vy(const Opcode& op); // 8XY7
        void SHL_Vx_Vy(const Opcode& op);  // 8XYE

        // I = NNN (ANNN)
        void LD_I_addr(const Opcode& op);

        // Jump to NNN + V0 (BNNN)
        void JP_V0_addr(const Opcode& op);

        // VX = random byte AND NN (CXNN)
        void RND_Vx_byte(const Opcode& op);

        // Draw N-row sprite from I at (VX, VY), VF = 1 on collision (DXYN)
        void DRW_Vx_Vy_n(const Opcode& op);

        // Keypad skips
        void SKP_Vx(const Opcode& op);  // EX9E
        void SKNP_Vx(const Opcode& op); // EXA1

        // Timers
        void LD_Vx_DT(const Opcode& op); // FX07
        void LD_DT_Vx(const Opcode& op); // FX15
        void LD_ST_Vx(const Opcode& op); // FX18

        // Wait for a key press, store it in VX (FX0A)
        void LD_Vx_K(const Opcode& op);

        // Index register group
        void ADD_I_Vx(const Opcode& op); // FX1E
        void LD_F_Vx(const Opcode& op);  // FX29
        void LD_B_Vx(const Opcode& op);  // FX33
        void LD_I_Vx(const Opcode& op);  // FX55
        void LD_Vx_I(const Opcode& op);  // FX65
};
