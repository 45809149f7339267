#include <cassert>
#include <string>
#include <vector>

#include "arguments.hpp"
#include "error.hpp"
#include "lexer.hpp"
#include "parser.hpp"

static SyntaxError expectSyntaxError(const std::string &code) {
    try {
        parse(code, Arguments{});
    } catch (SyntaxError &e) {
        return e;
    }
    assert(false && "expected a SyntaxError");
    throw BFError("unreachable");
}

static void test_empty() {
    auto prog = parse("", Arguments{});
    assert(prog.empty());
    assert(prog.loopCount() == 0);
}

static void test_simple_loop() {
    auto prog = parse("+[-]", Arguments{});
    assert(prog.size() == 4);
    assert(prog.loopCount() == 1);
    assert(prog.loop(0).start == 1);
    assert(prog.loop(0).end == 3);
    assert(prog.matchingEnd(1) == 3);
    assert(prog.matchingStart(3) == 1);
}

static void test_nested_loops() {
    // indices:        0123456789
    auto prog = parse("[[-]>[+]]<", Arguments{});
    assert(prog.loopCount() == 3);
    assert(prog.loop(0).start == 0 && prog.loop(0).end == 8);
    assert(prog.loop(1).start == 1 && prog.loop(1).end == 3);
    assert(prog.loop(2).start == 5 && prog.loop(2).end == 7);
    for (auto i = 0u; i < prog.size(); ++i) {
        if (prog[i].isLoopBoundary()) {
            const auto &pair = prog.loop(prog[i].a_);
            assert(pair.start == i || pair.end == i);
        }
    }
}

static void test_pairs_are_properly_nested() {
    auto prog = parse("[[][[]]][[[]]][]", Arguments{});
    for (const auto &a : prog.loops()) {
        assert(a.start < a.end);
        for (const auto &b : prog.loops()) {
            const bool disjoint = a.end < b.start || b.end < a.start;
            const bool aInsideB = b.start < a.start && a.end < b.end;
            const bool bInsideA = a.start < b.start && b.end < a.end;
            const bool same = a.start == b.start && a.end == b.end;
            assert(disjoint || aInsideB || bInsideA || same);
        }
    }
}

static void test_comments_do_not_shift_indices() {
    auto prog = parse("loop: [ body - ] done", Arguments{});
    assert(prog.size() == 3);
    assert(prog.matchingEnd(0) == 2);
    assert(prog[0].pos_.column == 7);
}

static void test_unmatched_loop_end() {
    auto e = expectSyntaxError("]");
    assert(e.kind() == SyntaxErrorKind::UNMATCHED_LOOP_END);
    assert(e.indices() == std::vector<size_t>{0});
    assert(e.position().line == 1 && e.position().column == 1);

    e = expectSyntaxError("+[-]]+");
    assert(e.kind() == SyntaxErrorKind::UNMATCHED_LOOP_END);
    assert(e.indices() == std::vector<size_t>{4});
    assert(std::string(e.what()) == "Unmatched ] at instruction 4 (1:5)");
}

static void test_unmatched_loop_start() {
    auto e = expectSyntaxError("[");
    assert(e.kind() == SyntaxErrorKind::UNMATCHED_LOOP_START);
    assert(e.indices() == std::vector<size_t>{0});

    e = expectSyntaxError("[+\n[[-]");
    assert(e.kind() == SyntaxErrorKind::UNMATCHED_LOOP_START);
    assert((e.indices() == std::vector<size_t>{0, 2}));
    assert(e.position().line == 1 && e.position().column == 1);
    assert(std::string(e.what()) == "Unmatched [ at instructions 0, 2 (1:1)");
}

static void test_single_use() {
    Parser parser{Arguments{}};
    parser.feed(lex("+"));
    auto prog = parser.compile();
    assert(prog.size() == 1);
    bool threw = false;
    try {
        parser.feed(lex("-"));
    } catch (BFError &) {
        threw = true;
    }
    assert(threw);
}

static void test_unusable_after_syntax_error() {
    Parser parser{Arguments{}};
    bool threw = false;
    try {
        parser.feed(lex("+]"));
    } catch (SyntaxError &e) {
        threw = e.kind() == SyntaxErrorKind::UNMATCHED_LOOP_END;
    }
    assert(threw);

    threw = false;
    try {
        parser.compile();
    } catch (BFError &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        parser.feed(lex("-"));
    } catch (BFError &) {
        threw = true;
    }
    assert(threw);
}

static void test_incremental_feed() {
    Parser parser{Arguments{}};
    parser.feed(lex("+["));
    parser.feed(lex(">+<-"));
    parser.feed(lex("]"));
    auto prog = parser.compile();
    assert(prog.size() == 7);
    assert(prog.matchingEnd(1) == 6);
}

int main() {
    test_empty();
    test_simple_loop();
    test_nested_loops();
    test_pairs_are_properly_nested();
    test_comments_do_not_shift_indices();
    test_unmatched_loop_end();
    test_unmatched_loop_start();
    test_single_use();
    test_unusable_after_syntax_error();
    test_incremental_feed();
    return 0;
}
