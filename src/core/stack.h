#pragma once
#include <cstdint>
#include <cstddef>

/**
 * @brief Fixed-depth store for subroutine return addresses.
 *
 * Only CALL (2NNN) and RET (00EE) touch it. Strict LIFO, no peek. Pushing past capacity
 * throws StackOverflow and popping an empty stack throws StackUnderflow; in both cases the
 * stored addresses and pointer are left as they were.
 */
class Stack {
    public:
        static constexpr size_t CAPACITY = 24;

        Stack();

        void push(uint16_t return_address);
        uint16_t pop();

        // Number of addresses currently stored
        size_t depth() const { return stack_pointer; }

        void clear();
    private:
        uint16_t memory[CAPACITY];
        size_t stack_pointer = 0;
};
