#include <algorithm>
#include <iostream>

#include "arguments.hpp"
#include "error.hpp"
#include "ir.hpp"
#include "lexer.hpp"
#include "parser.hpp"

Parser::Parser(const Arguments &args) : verbose_{args.verbose} {}

void Parser::checkNotFinished() const {
    if (compiled_) {
        throw BFError("Parser used after compilation");
    }
}

void Parser::feed(const std::vector<Instruction> &instructions) {
    checkNotFinished();
    for (auto ins : instructions) {
        const auto index = outStream_.size();
        switch (ins.code_) {
        case IROpCode::LOOP:
            ins.a_ = loops_.size();
            loops_.push_back({index, index});
            loopStack_.push(ins.a_);
            break;
        case IROpCode::END_LOOP:
            if (loopStack_.empty()) {
                compiled_ = true;
                throw SyntaxError(SyntaxErrorKind::UNMATCHED_LOOP_END, {index}, ins.pos_);
            }
            ins.a_ = loopStack_.top();
            loops_[ins.a_].end = index;
            loopStack_.pop();
            break;
        case IROpCode::INVALID:
            continue;
        default:
            break;
        }
        outStream_.emplace_back(std::move(ins));
    }
}

Program Parser::compile() {
    checkNotFinished();
    if (!loopStack_.empty()) {
        // Loop numbers grow with position, so the bottom of the stack is the leftmost open [
        std::vector<size_t> unclosed;
        while (!loopStack_.empty()) {
            unclosed.push_back(loops_[loopStack_.top()].start);
            loopStack_.pop();
        }
        std::reverse(unclosed.begin(), unclosed.end());
        const auto firstPos = outStream_[unclosed.front()].pos_;
        compiled_ = true;
        throw SyntaxError(SyntaxErrorKind::UNMATCHED_LOOP_START, std::move(unclosed), firstPos);
    }
    if (verbose_) {
        std::cout << "Resolved " << loops_.size() << " loops over " << outStream_.size() << " instructions\n";
    }
    compiled_ = true;
    return Program(std::move(outStream_), std::move(loops_));
}

Program parse(std::string_view source, const Arguments &args) {
    Parser parser(args);
    parser.feed(lex(source));
    return parser.compile();
}
