#pragma once

#include <cstddef>
#include <vector>

#include "ir.hpp"

struct LoopPair {
    size_t start;
    size_t end;
};

// A validated instruction sequence with every loop resolved, indexed by loop number.
// Built once by the Parser and only read afterwards.
class Program {
  public:
    Program() = delete;
    Program(std::vector<Instruction> instructions, std::vector<LoopPair> loops);
    Program(const Program &) = delete;
    Program &operator=(const Program &) = delete;
    Program(Program &&) = default;
    Program &operator=(Program &&) = default;

    size_t size() const { return instructions_.size(); }
    bool empty() const { return instructions_.empty(); }
    const Instruction &operator[](size_t i) const { return instructions_[i]; }
    std::vector<Instruction>::const_iterator begin() const { return instructions_.begin(); }
    std::vector<Instruction>::const_iterator end() const { return instructions_.end(); }

    size_t loopCount() const { return loops_.size(); }
    const LoopPair &loop(size_t loopNumber) const { return loops_[loopNumber]; }
    const std::vector<LoopPair> &loops() const { return loops_; }
    // Pre: instructions_[startIndex] is a LOOP
    size_t matchingEnd(size_t startIndex) const { return loops_[instructions_[startIndex].a_].end; }
    // Pre: instructions_[endIndex] is an END_LOOP
    size_t matchingStart(size_t endIndex) const { return loops_[instructions_[endIndex].a_].start; }

  private:
    void validate() const;

    std::vector<Instruction> instructions_;
    std::vector<LoopPair> loops_;
};

std::ostream &operator<<(std::ostream &os, const Program &prog);
