#include "machine.h"
#include "errors.h"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cstring>

Machine::Machine(const Quirks& quirks) : quirks(quirks), rng(std::random_device{}()) {
    memset(v, 0, sizeof(v));
}

Machine::Opcode Machine::decode_fields(uint16_t raw) {
    Opcode op;
    op.raw = raw;
    op.group = (raw & 0xF000) >> 12;
    op.x = (raw & 0x0F00) >> 8;
    op.y = (raw & 0x00F0) >> 4;
    op.n = raw & 0x000F;
    op.nn = raw & 0x00FF;
    op.nnn = raw & 0x0FFF;
    return op;
}

const Machine::Instruction& Machine::decode(const Opcode& op) const {
    static const Instruction unknown = { "???", &Machine::XXX };

    switch (op.group) {
        case 0x0: return decode_system(op);
        case 0x1: { static const Instruction instr = { "JP addr", &Machine::JP_addr }; return instr; }
        case 0x2: { static const Instruction instr = { "CALL addr", &Machine::CALL_addr }; return instr; }
        case 0x3: { static const Instruction instr = { "SE Vx, byte", &Machine::SE_Vx_byte }; return instr; }
        case 0x4: { static const Instruction instr = { "SNE Vx, byte", &Machine::SNE_Vx_byte }; return instr; }
        case 0x5: {
            static const Instruction instr = { "SE Vx, Vy", &Machine::SE_Vx_Vy };
            return (op.n == 0x0) ? instr : unknown;
        }
        case 0x6: { static const Instruction instr = { "LD Vx, byte", &Machine::LD_Vx_byte }; return instr; }
        case 0x7: { static const Instruction instr = { "ADD Vx, byte", &Machine::ADD_Vx_byte }; return instr; }
        case 0x8: return decode_arithmetic(op);
        case 0x9: {
            static const Instruction instr = { "SNE Vx, Vy", &Machine::SNE_Vx_Vy };
            return (op.n == 0x0) ? instr : unknown;
        }
        case 0xA: { static const Instruction instr = { "LD I, addr", &Machine::LD_I_addr }; return instr; }
        case 0xB: { static const Instruction instr = { "JP V0, addr", &Machine::JP_V0_addr }; return instr; }
        case 0xC: { static const Instruction instr = { "RND Vx, byte", &Machine::RND_Vx_byte }; return instr; }
        case 0xD: { static const Instruction instr = { "DRW Vx, Vy, n", &Machine::DRW_Vx_Vy_n }; return instr; }
        case 0xE: return decode_key(op);
        case 0xF: return decode_misc(op);
    }
    return unknown;
}

const Machine::Instruction& Machine::decode_system(const Opcode& op) const {
    static const Instruction end = { "END", &Machine::END };
    static const Instruction cls = { "CLS", &Machine::CLS };
    static const Instruction ret = { "RET", &Machine::RET };
    static const Instruction unknown = { "???", &Machine::XXX };

    switch (op.raw) {
        case 0x0000: return end;
        case 0x00E0: return cls;
        case 0x00EE: return ret;
        default: return unknown; // 0NNN machine code routines are not supported
    }
}

const Machine::Instruction& Machine::decode_arithmetic(const Opcode& op) const {
    // Indexed by the low nibble
    static const Instruction table[16] = {
        { "LD Vx, Vy",   &Machine::LD_Vx_Vy },   // 0
        { "OR Vx, Vy",   &Machine::OR_Vx_Vy },   // 1
        { "AND Vx, Vy",  &Machine::AND_Vx_Vy },  // 2
        { "XOR Vx, Vy",  &Machine::XOR_Vx_Vy },  // 3
        { "ADD Vx, Vy",  &Machine::ADD_Vx_Vy },  // 4
        { "SUB Vx, Vy",  &Machine::SUB_Vx_Vy },  // 5
        { "SHR Vx, Vy",  &Machine::SHR_Vx_Vy },  // 6
        { "SUBN Vx, Vy", &Machine::SUBN_Vx_Vy }, // 7
        { "???", &Machine::XXX },                // 8
        { "???", &Machine::XXX },                // 9
        { "???", &Machine::XXX },                // A
        { "???", &Machine::XXX },                // B
        { "???", &Machine::XXX },                // C
        { "???", &Machine::XXX },                // D
        { "SHL Vx, Vy",  &Machine::SHL_Vx_Vy },  // E
        { "???", &Machine::XXX },                // F
    };
    return table[op.n];
}

const Machine::Instruction& Machine::decode_key(const Opcode& op) const {
    static const Instruction skp = { "SKP Vx", &Machine::SKP_Vx };
    static const Instruction sknp = { "SKNP Vx", &Machine::SKNP_Vx };
    static const Instruction unknown = { "???", &Machine::XXX };

    switch (op.nn) {
        case 0x9E: return skp;
        case 0xA1: return sknp;
        default: return unknown;
    }
}

const Machine::Instruction& Machine::decode_misc(const Opcode& op) const {
    static const Instruction ld_vx_dt = { "LD Vx, DT", &Machine::LD_Vx_DT };
    static const Instruction ld_vx_k  = { "LD Vx, K",  &Machine::LD_Vx_K };
    static const Instruction ld_dt_vx = { "LD DT, Vx", &Machine::LD_DT_Vx };
    static const Instruction ld_st_vx = { "LD ST, Vx", &Machine::LD_ST_Vx };
    static const Instruction add_i_vx = { "ADD I, Vx", &Machine::ADD_I_Vx };
    static const Instruction ld_f_vx  = { "LD F, Vx",  &Machine::LD_F_Vx };
    static const Instruction ld_b_vx  = { "LD B, Vx",  &Machine::LD_B_Vx };
    static const Instruction ld_i_vx  = { "LD [I], Vx", &Machine::LD_I_Vx };
    static const Instruction ld_vx_i  = { "LD Vx, [I]", &Machine::LD_Vx_I };
    static const Instruction unknown  = { "???", &Machine::XXX };

    switch (op.nn) {
        case 0x07: return ld_vx_dt;
        case 0x0A: return ld_vx_k;
        case 0x15: return ld_dt_vx;
        case 0x18: return ld_st_vx;
        case 0x1E: return add_i_vx;
        case 0x29: return ld_f_vx;
        case 0x33: return ld_b_vx;
        case 0x55: return ld_i_vx;
        case 0x65: return ld_vx_i;
        default: return unknown;
    }
}

void Machine::step() {
    uint16_t address = pc;
    Opcode op = decode_fields(memory.read_word(address));
    pc += 2;

    record_history(address, op.raw);

    const Instruction& instruction = decode(op);

    if (trace) {
        std::cout << "[Machine] " << std::hex << std::uppercase << std::setfill('0')
                  << std::setw(4) << address << ": " << std::setw(4) << op.raw
                  << "  " << instruction.name << std::dec << std::endl;
    }

    (this->*instruction.operate)(op);
}

void Machine::run_frame(std::chrono::nanoseconds elapsed) {
    // Timers run at the frame rate, before any instruction of this frame
    tick_timers();

    exec_debt += elapsed;

    while (exec_debt >= INSTRUCTION_DURATION) {
        step();
        exec_debt -= INSTRUCTION_DURATION;

        // Leftover debt is kept for the next frame
        if (reached_end) break;
    }
}

void Machine::tick_timers() {
    if (delay > 0) delay--;

    if (sound <= 1) {
        sound = 0;
        sound_playing = false;
    } else {
        sound--;
        sound_playing = true;
    }
}

void Machine::record_history(uint16_t address, uint16_t opcode) {
    history[history_next] = { address, opcode };
    history_next = (history_next + 1) % HISTORY_SIZE;
    if (history_count < HISTORY_SIZE) history_count++;
}

void Machine::load_bytes(const std::vector<uint8_t>& bytes, uint16_t address) {
    memory.load(bytes, address);
}

void Machine::load_program(const std::vector<uint8_t>& program) {
    memory.load(program, PROGRAM_START_ADDRESS);
}

void Machine::load_font(const std::array<uint8_t, FONT_SIZE>& font) {
    memory.load(font.data(), font.size(), FONT_START_ADDRESS);
}

void Machine::load_font(const std::vector<uint8_t>& font) {
    if (font.size() != FONT_SIZE) {
        std::ostringstream oss;
        oss << "[Machine] Font data must be " << FONT_SIZE << " bytes, got " << font.size();
        throw std::invalid_argument(oss.str());
    }
    memory.load(font, FONT_START_ADDRESS);
}

void Machine::load_opcode(uint16_t opcode, uint16_t address) {
    memory.write_word(address, opcode);
}

void Machine::load_opcodes(const std::vector<uint16_t>& opcodes, uint16_t address) {
    for (uint16_t opcode : opcodes) {
        load_opcode(opcode, address);
        address += 2;
    }
}

void Machine::load_register(uint8_t reg, uint8_t value) {
    v[reg & 0x0F] = value;
}

void Machine::load_registers(const std::array<uint8_t, NUM_REGISTERS>& values) {
    for (uint8_t reg = 0; reg < NUM_REGISTERS; reg++) {
        v[reg] = values[reg];
    }
}

void Machine::reset() {
    memset(v, 0, sizeof(v));
    i = 0;
    pc = PROGRAM_START_ADDRESS;
    stack.clear();
    delay = 0;
    sound = 0;
    sound_playing = false;
    reached_end = false;
    exec_debt = std::chrono::nanoseconds::zero();
    history_next = 0;
    history_count = 0;
}

void Machine::dump_registers() const {
    std::cout << "[Machine] ==== REGISTERS ====" << std::endl;
    std::cout << std::hex << std::uppercase << std::setfill('0');
    for (uint8_t reg = 0; reg < NUM_REGISTERS; reg++) {
        std::cout << "  V" << static_cast<int>(reg) << ": 0x" << std::setw(2) << static_cast<int>(v[reg])
                  << " = " << std::dec << std::setfill(' ') << std::setw(3) << static_cast<int>(v[reg])
                  << std::hex << std::setfill('0') << std::endl;
    }
    std::cout << "  I:  0x" << std::setw(4) << i << std::endl;
    std::cout << "  PC: 0x" << std::setw(4) << pc << std::endl;
    std::cout << std::dec;
    std::cout << "  SP: " << stack.depth() << std::endl;
    std::cout << "  DT: " << static_cast<int>(delay) << "  ST: " << static_cast<int>(sound)
              << (sound_playing ? " (playing)" : "") << std::endl;
}

void Machine::dump_history() const {
    std::cout << "[Machine] ==== LAST " << history_count << " INSTRUCTIONS ====" << std::endl;

    // Oldest first
    size_t start = (history_next + HISTORY_SIZE - history_count) % HISTORY_SIZE;
    std::cout << std::hex << std::uppercase << std::setfill('0');
    for (size_t n = 0; n < history_count; n++) {
        const HistoryEntry& entry = history[(start + n) % HISTORY_SIZE];
        std::cout << "  " << std::setw(4) << entry.address << ": " << std::setw(4) << entry.opcode
                  << "  " << decode(decode_fields(entry.opcode)).name << std::endl;
    }
    std::cout << std::dec << std::setfill(' ');
}

/**
 * Opcode implementations
 */

void Machine::XXX(const Opcode& op) {
    throw UnimplementedInstruction(op.raw, static_cast<uint16_t>(pc - 2));
}

void Machine::END(const Opcode&) {
    reached_end = true;
}

void Machine::CLS(const Opcode&) {
    screen.clear();
}

void Machine::RET(const Opcode&) {
    pc = stack.pop();
}

void Machine::JP_addr(const Opcode& op) {
    pc = op.nnn;
}

void Machine::CALL_addr(const Opcode& op) {
    // pc already points at the instruction after the call
    stack.push(pc);
    pc = op.nnn;
}

void Machine::SE_Vx_byte(const Opcode& op) {
    if (v[op.x] == op.nn) pc += 2;
}

void Machine::SNE_Vx_byte(const Opcode& op) {
    if (v[op.x] != op.nn) pc += 2;
}

void Machine::SE_Vx_Vy(const Opcode& op) {
    if (v[op.x] == v[op.y]) pc += 2;
}

void Machine::SNE_Vx_Vy(const Opcode& op) {
    if (v[op.x] != v[op.y]) pc += 2;
}

void Machine::LD_Vx_byte(const Opcode& op) {
    v[op.x] = op.nn;
}

void Machine::ADD_Vx_byte(const Opcode& op) {
    v[op.x] = static_cast<uint8_t>(v[op.x] + op.nn);
}

void Machine::LD_Vx_Vy(const Opcode& op) {
    v[op.x] = v[op.y];
}

void Machine::OR_Vx_Vy(const Opcode& op) {
    v[op.x] |= v[op.y];
}

void Machine::AND_Vx_Vy(const Opcode& op) {
    v[op.x] &= v[op.y];
}

void Machine::XOR_Vx_Vy(const Opcode& op) {
    v[op.x] ^= v[op.y];
}

// The flag is written after the result, so VF ends up holding the flag when X is F
void Machine::ADD_Vx_Vy(const Opcode& op) {
    uint16_t result = v[op.x] + v[op.y];
    v[op.x] = result & 0xFF;
    v[FLAG_REGISTER] = (result > 0xFF) ? 1 : 0;
}

void Machine::SUB_Vx_Vy(const Opcode& op) {
    uint8_t no_borrow = (v[op.x] >= v[op.y]) ? 1 : 0;
    v[op.x] = static_cast<uint8_t>(v[op.x] - v[op.y]);
    v[FLAG_REGISTER] = no_borrow;
}

void Machine::SUBN_Vx_Vy(const Opcode& op) {
    uint8_t no_borrow = (v[op.y] >= v[op.x]) ? 1 : 0;
    v[op.x] = static_cast<uint8_t>(v[op.y] - v[op.x]);
    v[FLAG_REGISTER] = no_borrow;
}

void Machine::SHR_Vx_Vy(const Opcode& op) {
    if (quirks.assign_before_shift) v[op.x] = v[op.y];

    // Flag is written before the shift, so 8FF6 leaves the shifted value in VF
    v[FLAG_REGISTER] = v[op.x] & 0x01;
    v[op.x] >>= 1;
}

void Machine::SHL_Vx_Vy(const Opcode& op) {
    if (quirks.assign_before_shift) v[op.x] = v[op.y];

    v[FLAG_REGISTER] = (v[op.x] & 0x80) >> 7;
    v[op.x] = static_cast<uint8_t>(v[op.x] << 1);
}

void Machine::LD_I_addr(const Opcode& op) {
    i = op.nnn;
}

void Machine::JP_V0_addr(const Opcode& op) {
    pc = op.nnn + v[0x0];
}

void Machine::RND_Vx_byte(const Opcode& op) {
    std::uniform_int_distribution<int> byte_dist(0x00, 0xFF);
    v[op.x] = static_cast<uint8_t>(byte_dist(rng)) & op.nn;
}

void Machine::DRW_Vx_Vy_n(const Opcode& op) {
    uint8_t sprite[15];
    for (uint8_t row = 0; row < op.n; row++) {
        sprite[row] = memory.read_byte(i + row);
    }

    // VF is only touched on a collision
    if (screen.draw_sprite(v[op.x], v[op.y], sprite, op.n)) {
        v[FLAG_REGISTER] = 1;
    }
}

void Machine::SKP_Vx(const Opcode& op) {
    if (keypad.is_pressed(v[op.x])) pc += 2;
}

void Machine::SKNP_Vx(const Opcode& op) {
    if (!keypad.is_pressed(v[op.x])) pc += 2;
}

void Machine::LD_Vx_DT(const Opcode& op) {
    v[op.x] = delay;
}

void Machine::LD_DT_Vx(const Opcode& op) {
    delay = v[op.x];
}

void Machine::LD_ST_Vx(const Opcode& op) {
    sound = v[op.x];
}

void Machine::LD_Vx_K(const Opcode& op) {
    std::optional<uint8_t> key = keypad.first_pressed();
    if (key) {
        v[op.x] = *key;
    } else {
        // No key yet: refetch this instruction next cycle
        pc -= 2;
    }
}

void Machine::ADD_I_Vx(const Opcode& op) {
    i += v[op.x];

    if (quirks.set_flag_on_index_overflow && i > 0x1000) {
        v[FLAG_REGISTER] = 1;
    }
}

void Machine::LD_F_Vx(const Opcode& op) {
    i = FONT_START_ADDRESS + (v[op.x] & 0x0F) * GLYPH_HEIGHT;
}

void Machine::LD_B_Vx(const Opcode& op) {
    uint8_t value = v[op.x];
    memory.write_byte(i, value / 100);
    memory.write_byte(i + 1, (value / 10) % 10);
    memory.write_byte(i + 2, value % 10);
}

void Machine::LD_I_Vx(const Opcode& op) {
    for (uint8_t reg = 0; reg <= op.x; reg++) {
        memory.write_byte(i + reg, v[reg]);
    }

    if (quirks.modify_index_on_dump_or_load) i += op.x + 1;
}

void Machine::LD_Vx_I(const Opcode& op) {
    for (uint8_t reg = 0; reg <= op.x; reg++) {
        v[reg] = memory.read_byte(i + reg);
    }

    if (quirks.modify_index_on_dump_or_load) i += op.x + 1;
}
