#include <cassert>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>

#include "engine.hpp"
#include "error.hpp"
#include "helpers.hpp"

static void writeFile(const char *fname, const std::string &contents) {
    std::ofstream f(fname);
    f << contents;
}

static std::string readFile(const char *fname) {
    std::ifstream f(fname);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

static void test_interpret_file() {
    const char *fname = "engine_test_program.bf";
    writeFile(fname, "read one byte , and echo it .\n");
    Arguments args;
    args.fileName = fname;
    args.useInterpreter = true;
    Engine engine(args);
    {
        RedirectedIO io("A");
        engine.run();
        assert(io.out.str() == "A");
    }
    assert(engine.tape().cells[0] == 'A');
    std::remove(fname);
}

static void test_compile_file() {
    const char *fname = "engine_test_program.bf";
    const char *outName = "engine_test_program.ll";
    writeFile(fname, "+[-]");
    Arguments args;
    args.fileName = fname;
    args.outputFileName = outName;
    Engine engine(args);
    engine.run();
    const auto module = readFile(outName);
    assert(module.find("source_filename = \"engine_test_program.bf\"") != std::string::npos);
    assert(module.find("loop.0.exit:") != std::string::npos);
    std::remove(fname);
    std::remove(outName);
}

static void test_syntax_error_writes_nothing() {
    const char *fname = "engine_test_program.bf";
    const char *outName = "engine_test_unwritten.ll";
    std::remove(outName);
    writeFile(fname, "+[");
    Arguments args;
    args.fileName = fname;
    args.outputFileName = outName;
    Engine engine(args);
    bool threw = false;
    try {
        engine.run();
    } catch (SyntaxError &e) {
        threw = e.kind() == SyntaxErrorKind::UNMATCHED_LOOP_START;
    }
    assert(threw);
    assert(!std::ifstream(outName).good());
    std::remove(fname);
}

static void test_missing_file() {
    Arguments args;
    args.fileName = "engine_test_does_not_exist.bf";
    Engine engine(args);
    bool threw = false;
    try {
        engine.run();
    } catch (BFError &) {
        threw = true;
    }
    assert(threw);
}

static void test_run_engine_reports_failures() {
    const char *fname = "engine_test_program.bf";
    writeFile(fname, "+.");
    Arguments args;
    args.fileName = fname;
    args.useInterpreter = true;
    {
        RedirectedIO io("");
        assert(runEngine(args) == 0);
        assert(io.out.str() == "\x01");
    }

    // A tape that can't be allocated fails with a standard exception rather than a BFError
    args.bfMemLength = std::numeric_limits<size_t>::max();
    assert(runEngine(args) == 1);

    args.bfMemLength = 16;
    args.fileName = "engine_test_does_not_exist.bf";
    assert(runEngine(args) == 1);
    std::remove(fname);
}

int main() {
    test_interpret_file();
    test_compile_file();
    test_syntax_error_writes_nothing();
    test_missing_file();
    test_run_engine_reports_failures();
    return 0;
}
