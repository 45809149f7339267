#include "ir.hpp"

std::ostream &operator<<(std::ostream &os, IROpCode code) {
    const char *op = nullptr;
    switch (code) {
    case IROpCode::RIGHT:
        op = "RIGHT";
        break;
    case IROpCode::LEFT:
        op = "LEFT";
        break;
    case IROpCode::INC:
        op = "INC";
        break;
    case IROpCode::DEC:
        op = "DEC";
        break;
    case IROpCode::IN:
        op = "IN";
        break;
    case IROpCode::OUT:
        op = "OUT";
        break;
    case IROpCode::LOOP:
        op = "LOOP";
        break;
    case IROpCode::END_LOOP:
        op = "END_LOOP";
        break;
    case IROpCode::INVALID:
        op = "INVALID";
        break;
    }
    return os << op;
}

std::ostream &operator<<(std::ostream &os, SourcePosition pos) { return os << pos.line << ':' << pos.column; }

std::ostream &operator<<(std::ostream &os, const Instruction &ins) {
    os << ins.code_;
    if (ins.isLoopBoundary()) {
        os << ' ' << ins.a_;
    }
    return os << " @" << ins.pos_;
}
