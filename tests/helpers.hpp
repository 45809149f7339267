#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include "arguments.hpp"
#include "interpreter.hpp"
#include "parser.hpp"

// Points std::cin/std::cout at string streams for the lifetime of the object
struct RedirectedIO {
    std::istringstream in;
    std::ostringstream out;
    std::streambuf *cinbuf;
    std::streambuf *coutbuf;
    explicit RedirectedIO(const std::string &input) : in(input) {
        cinbuf = std::cin.rdbuf(in.rdbuf());
        coutbuf = std::cout.rdbuf(out.rdbuf());
        std::cin.clear();
    }
    ~RedirectedIO() {
        std::cin.rdbuf(cinbuf);
        std::cout.rdbuf(coutbuf);
    }
};

inline std::string run(const std::string &code, Tape &tape, const std::string &input = "",
                       const Arguments &args = Arguments{}) {
    auto prog = parse(code, args);
    RedirectedIO io(input);
    interpret(prog, tape, args);
    return io.out.str();
}
