#pragma once

#include <stack>
#include <string_view>
#include <vector>

#include "arguments.hpp"
#include "error.hpp"
#include "ir.hpp"
#include "program.hpp"

// Resolves loop structure over a lexed instruction stream
class Parser {
  public:
    Parser() = delete;
    explicit Parser(const Arguments &args);
    void checkNotFinished() const;
    // Throws SyntaxError on a ] without an open [
    void feed(const std::vector<Instruction> &instructions);
    // Throws SyntaxError naming every [ still open
    Program compile();

  private:
    std::vector<Instruction> outStream_;
    std::vector<LoopPair> loops_;
    std::stack<size_t> loopStack_;
    bool compiled_{false};
    bool verbose_;
};

// lex + feed + compile
Program parse(std::string_view source, const Arguments &args);
