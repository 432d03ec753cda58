#include <gtest/gtest.h>
#include <stdexcept>

#include "core/memory.h"

TEST(MemoryTest, StartsZeroed) {
    Memory memory;
    for (size_t address = 0; address < Memory::SIZE; address += 0x111) {
        EXPECT_EQ(memory.read_byte(address), 0);
    }
}

TEST(MemoryTest, WordsAreBigEndian) {
    Memory memory;
    memory.write_word(0x200, 0x6005);
    EXPECT_EQ(memory.read_byte(0x200), 0x60);
    EXPECT_EQ(memory.read_byte(0x201), 0x05);
    EXPECT_EQ(memory.read_word(0x200), 0x6005);
}

TEST(MemoryTest, LoadCopiesBytesVerbatim) {
    Memory memory;
    std::vector<uint8_t> bytes = { 0x12, 0x34, 0x56 };
    memory.load(bytes, 0x300);
    EXPECT_EQ(memory.read_byte(0x300), 0x12);
    EXPECT_EQ(memory.read_byte(0x301), 0x34);
    EXPECT_EQ(memory.read_byte(0x302), 0x56);
    EXPECT_EQ(memory.read_byte(0x303), 0x00);
}

TEST(MemoryTest, LastByteIsAddressable) {
    Memory memory;
    memory.write_byte(0xFFF, 0xAB);
    EXPECT_EQ(memory.read_byte(0xFFF), 0xAB);
    memory.write_word(0xFFE, 0xCDEF);
    EXPECT_EQ(memory.read_word(0xFFE), 0xCDEF);
}

TEST(MemoryTest, OutOfRangeAccessThrows) {
    Memory memory;
    EXPECT_THROW(memory.read_byte(0x1000), std::out_of_range);
    EXPECT_THROW(memory.write_byte(0x1000, 1), std::out_of_range);
    EXPECT_THROW(memory.read_word(0xFFF), std::out_of_range);
    EXPECT_THROW(memory.write_word(0xFFF, 0x1234), std::out_of_range);

    std::vector<uint8_t> too_long(0x10, 0xFF);
    EXPECT_THROW(memory.load(too_long, 0xFF8), std::out_of_range);
    // Nothing was written by the rejected load
    EXPECT_EQ(memory.read_byte(0xFF8), 0x00);
}

TEST(MemoryTest, ClearZeroesEverything) {
    Memory memory;
    memory.write_byte(0x050, 0xF0);
    memory.write_byte(0x800, 0x12);
    memory.clear();
    EXPECT_EQ(memory.read_byte(0x050), 0);
    EXPECT_EQ(memory.read_byte(0x800), 0);
}
