#include "stack.h"
#include "errors.h"
#include <cstring>

Stack::Stack() {
    clear();
}

void Stack::push(uint16_t return_address) {
    if (stack_pointer >= CAPACITY) {
        throw StackOverflow(return_address);
    }

    memory[stack_pointer++] = return_address;
}

uint16_t Stack::pop() {
    if (stack_pointer == 0) {
        throw StackUnderflow();
    }

    return memory[--stack_pointer];
}

void Stack::clear() {
    memset(memory, 0, sizeof(memory));
    stack_pointer = 0;
}
