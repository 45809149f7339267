#include "lexer.hpp"

IROpCode toOpCode(char c) {
    switch (c) {
    case '>':
        return IROpCode::RIGHT;
    case '<':
        return IROpCode::LEFT;
    case '+':
        return IROpCode::INC;
    case '-':
        return IROpCode::DEC;
    case ',':
        return IROpCode::IN;
    case '.':
        return IROpCode::OUT;
    case '[':
        return IROpCode::LOOP;
    case ']':
        return IROpCode::END_LOOP;
    default:
        return IROpCode::INVALID;
    }
}

std::vector<Instruction> lex(std::string_view source) {
    std::vector<Instruction> outStream;
    SourcePosition pos{1, 0};
    for (auto c : source) {
        if (c == '\n') {
            ++pos.line;
            pos.column = 0;
            continue;
        }
        ++pos.column;
        const auto code = toOpCode(c);
        if (code != IROpCode::INVALID) {
            outStream.emplace_back(code, pos);
        }
    }
    return outStream;
}
