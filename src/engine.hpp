#pragma once

#include <string>
#include <vector>

#include "arguments.hpp"
#include "error.hpp"
#include "interpreter.hpp"
#include "program.hpp"

class Engine {
  public:
    Engine() = delete;
    explicit Engine(const Arguments &args);
    void run();
    const Tape &tape() const { return tape_; }

  private:
    std::string readSource();
    void runInterpreter(const Program &prog);
    void runCodeGenerator(const Program &prog);

    static constexpr size_t RDBUF_SIZE = 256 * 1024;
    std::vector<char> rdbuf_;
    const Arguments &arguments_;
    Tape tape_;
};

// Runs one Engine over args, reporting any failure on std::cerr. Returns the process exit status.
int runEngine(const Arguments &args);
