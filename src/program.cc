#include "program.hpp"
#include "error.hpp"

Program::Program(std::vector<Instruction> instructions, std::vector<LoopPair> loops)
    : instructions_{std::move(instructions)}, loops_{std::move(loops)} {
    validate();
}

void Program::validate() const {
    size_t seenLoops = 0;
    for (auto i = 0u; i < instructions_.size(); ++i) {
        const auto &ins = instructions_[i];
        switch (ins.code_) {
        case IROpCode::LOOP:
            if (ins.a_ != seenLoops) {
                throw BFError("ICE: loop at instruction ", i, " numbered ", ins.a_, ", expected ", seenLoops);
            }
            if (ins.a_ >= loops_.size() || loops_[ins.a_].start != i) {
                throw BFError("ICE: loop ", ins.a_, " does not start at instruction ", i);
            }
            ++seenLoops;
            break;
        case IROpCode::END_LOOP:
            if (ins.a_ >= loops_.size() || loops_[ins.a_].end != i) {
                throw BFError("ICE: loop ", ins.a_, " does not end at instruction ", i);
            }
            break;
        case IROpCode::INVALID:
            throw BFError("ICE: invalid instruction at ", i);
        default:
            break;
        }
    }
    if (seenLoops != loops_.size()) {
        throw BFError("ICE: ", loops_.size(), " loops recorded, ", seenLoops, " present");
    }
    // Starts are ascending by construction, so a pair interleaves with an earlier one
    // exactly when it starts inside that one and ends outside it
    std::vector<size_t> open;
    for (auto k = 0u; k < loops_.size(); ++k) {
        const auto &pair = loops_[k];
        if (pair.start >= pair.end || pair.end >= instructions_.size()) {
            throw BFError("ICE: loop ", k, " spans invalid range [", pair.start, ", ", pair.end, "]");
        }
        const auto &close = instructions_[pair.end];
        if (close.code_ != IROpCode::END_LOOP || close.a_ != k) {
            throw BFError("ICE: loop ", k, " is not closed at instruction ", pair.end);
        }
        while (!open.empty() && loops_[open.back()].end < pair.start) {
            open.pop_back();
        }
        if (!open.empty() && loops_[open.back()].end < pair.end) {
            throw BFError("ICE: loops ", open.back(), " and ", k, " interleave");
        }
        open.push_back(k);
    }
}

std::ostream &operator<<(std::ostream &os, const Program &prog) {
    size_t i = 0;
    for (const auto &ins : prog) {
        os << i++ << ": " << ins << '\n';
    }
    return os;
}
