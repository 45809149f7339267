#include <cstdio>
#include <vector>

#include "arguments.hpp"
#include "error.hpp"
#include "interpreter.hpp"
#include "ir.hpp"
#include "runtime.hpp"

void interpret(const Program &prog, Tape &tape, const Arguments &args) {
    auto &bfMem = tape.cells;
    auto &dp = tape.dp;
    const size_t BFMEM_LENGTH = bfMem.size();
    const bool wrap = args.boundsBehaviour == BoundsBehaviour::WRAP;
    const auto mgetchar = getCharFunc(args);
    const auto mputchar = putCharFunc(args);

    if (dp >= BFMEM_LENGTH) {
        throw BFError("Tape pointer ", dp, " starts outside a tape of ", BFMEM_LENGTH, " cells");
    }
    for (size_t i = 0; i < prog.size(); ++i) {
        const auto &ins = prog[i];
        switch (ins.code_) {
        case IROpCode::RIGHT:
            if (dp + 1 == BFMEM_LENGTH) {
                if (!wrap) {
                    throw RuntimeError(RuntimeErrorKind::TAPE_BOUNDS_EXCEEDED, i, ins.pos_);
                }
                dp = 0;
            } else {
                ++dp;
            }
            break;
        case IROpCode::LEFT:
            if (dp == 0) {
                if (!wrap) {
                    throw RuntimeError(RuntimeErrorKind::TAPE_BOUNDS_EXCEEDED, i, ins.pos_);
                }
                dp = BFMEM_LENGTH - 1;
            } else {
                --dp;
            }
            break;
        case IROpCode::INC:
            ++bfMem[dp];
            break;
        case IROpCode::DEC:
            --bfMem[dp];
            break;
        case IROpCode::IN: {
            const int c = mgetchar(bfMem[dp]);
            if (c == EOF) {
                throw RuntimeError(RuntimeErrorKind::INPUT_EXHAUSTED, i, ins.pos_);
            }
            bfMem[dp] = c;
        } break;
        case IROpCode::OUT:
            if (mputchar(bfMem[dp]) == EOF) {
                throw RuntimeError(RuntimeErrorKind::IO_ERROR, i, ins.pos_);
            }
            break;
        case IROpCode::LOOP:
            if (bfMem[dp] == 0) {
                i = prog.matchingEnd(i);
            }
            break;
        case IROpCode::END_LOOP:
            i = prog.matchingStart(i) - 1;
            break;
        default:
            throw BFError("ICE: Unhandled instruction");
        }
    }
}
