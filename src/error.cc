#include "error.hpp"

static std::string describeSyntaxError(SyntaxErrorKind kind, const std::vector<size_t> &indices,
                                       SourcePosition position) {
    std::stringstream ss;
    ss << "Unmatched " << (kind == SyntaxErrorKind::UNMATCHED_LOOP_END ? ']' : '[') << " at instruction";
    if (indices.size() > 1) {
        ss << 's';
    }
    for (auto i = 0u; i < indices.size(); ++i) {
        ss << (i == 0 ? " " : ", ") << indices[i];
    }
    ss << " (" << position << ')';
    return ss.str();
}

SyntaxError::SyntaxError(SyntaxErrorKind kind, std::vector<size_t> indices, SourcePosition position)
    : BFError(describeSyntaxError(kind, indices, position)), kind_{kind}, indices_{std::move(indices)},
      position_{position} {}

RuntimeError::RuntimeError(RuntimeErrorKind kind, size_t index, SourcePosition position)
    : BFError(concat(kind, " at instruction ", index, " (", position, ')')), kind_{kind}, index_{index},
      position_{position} {}

std::ostream &operator<<(std::ostream &os, SyntaxErrorKind kind) {
    switch (kind) {
    case SyntaxErrorKind::UNMATCHED_LOOP_END:
        return os << "UnmatchedLoopEnd";
    case SyntaxErrorKind::UNMATCHED_LOOP_START:
        return os << "UnmatchedLoopStart";
    }
    return os;
}

std::ostream &operator<<(std::ostream &os, RuntimeErrorKind kind) {
    switch (kind) {
    case RuntimeErrorKind::TAPE_BOUNDS_EXCEEDED:
        return os << "Tape pointer moved off the tape";
    case RuntimeErrorKind::INPUT_EXHAUSTED:
        return os << "Read past end of input";
    case RuntimeErrorKind::IO_ERROR:
        return os << "I/O failure";
    }
    return os;
}
