#pragma once

#include <cstddef>
#include <vector>

#include "arguments.hpp"
#include "program.hpp"

struct Tape {
    std::vector<unsigned char> cells;
    size_t dp{};
    explicit Tape(size_t length) : cells(length, 0) {}
};

// Runs prog on tape, reading std::cin and writing std::cout.
// Throws RuntimeError and leaves the tape as it was at the failing instruction.
void interpret(const Program &prog, Tape &tape, const Arguments &args);
