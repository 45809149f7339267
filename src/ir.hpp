#pragma once

#include <cstddef>
#include <iostream>

enum class IROpCode {
    RIGHT,    // ++dp
    LEFT,     // --dp
    INC,      // ++bfMem[dp]
    DEC,      // --bfMem[dp]
    IN,       // bfMem[dp] = getchar()
    OUT,      // putchar(bfMem[dp])
    LOOP,     // Start of loop a_
    END_LOOP, // End of loop a_
    INVALID   // Not a valid instruction
};

std::ostream &operator<<(std::ostream &os, IROpCode code);

// 1-based location of an instruction in the source text
struct SourcePosition {
    size_t line{};
    size_t column{};
};

std::ostream &operator<<(std::ostream &os, SourcePosition pos);

struct Instruction {
    IROpCode code_{};
    // Loop number, only meaningful for LOOP and END_LOOP
    size_t a_{};
    SourcePosition pos_{};
    Instruction() : code_{IROpCode::INVALID} {}
    Instruction(IROpCode code) : code_(code) {}
    Instruction(IROpCode code, SourcePosition pos) : code_(code), pos_(pos) {}
    Instruction(IROpCode code, size_t a, SourcePosition pos) : code_(code), a_(a), pos_(pos) {}
    bool isLoopBoundary() const { return code_ == IROpCode::LOOP || code_ == IROpCode::END_LOOP; }
    friend std::ostream &operator<<(std::ostream &os, const Instruction &ins);
};
