#pragma once

#include <string_view>
#include <vector>

#include "ir.hpp"

// Maps one source character to its opcode, INVALID for anything that isn't an instruction
IROpCode toOpCode(char c);

// Every non-instruction character is a comment and is dropped
std::vector<Instruction> lex(std::string_view source);
