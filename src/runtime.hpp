#pragma once

#include "arguments.hpp"

// Read one byte from std::cin. The argument is the current cell, returns EOF only when the
// eof behaviour is EOF_IS_ERROR and input is exhausted
using GetCharFunc = int (*)(int);
// Write one byte to std::cout, returns EOF on failure
using PutCharFunc = int (*)(int);

int mgetchar_0_on_eof(int);
int mgetchar_255_on_eof(int);
int mgetchar_nothing_on_eof(int current_cell);
int mgetchar_error_on_eof(int);
int mputchar(int c);
int mputchar_noflush(int c);

GetCharFunc getCharFunc(const Arguments &args);
PutCharFunc putCharFunc(const Arguments &args);
