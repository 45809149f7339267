#include <algorithm>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>

#include "arguments.hpp"
#include "code_generator.hpp"
#include "engine.hpp"
#include "interpreter.hpp"
#include "parser.hpp"

Engine::Engine(const Arguments &arguments)
    : rdbuf_(RDBUF_SIZE, 0), arguments_{arguments}, tape_(arguments_.bfMemLength) {}

static double time() {
    static std::clock_t startTime = std::clock();
    std::clock_t now = std::clock();
    double duration = (now - startTime) / (double)CLOCKS_PER_SEC;
    startTime = now;
    return duration;
}

std::string Engine::readSource() {
    std::ifstream in;
    in.rdbuf()->pubsetbuf(rdbuf_.data(), RDBUF_SIZE);
    in.open(arguments_.fileName, std::ios::binary);
    if (!in.good()) {
        throw BFError("Failed to open file \"", arguments_.fileName, "\"");
    }
    std::string source((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw BFError("Failed to read file \"", arguments_.fileName, "\"");
    }
    return source;
}

void Engine::run() {
    time();
    auto prog = parse(readSource(), arguments_);
    if (arguments_.verbose) {
        std::cout << "Parsed in " << time() << " seconds\n";
    }
    if (arguments_.dumpProgram) {
        std::cout << prog;
    }
    if (arguments_.useInterpreter) {
        runInterpreter(prog);
    } else {
        runCodeGenerator(prog);
    }
}

void Engine::runInterpreter(const Program &prog) {
    time();
    interpret(prog, tape_, arguments_);
    if (arguments_.verbose) {
        std::cout << '\n';
        std::cout << "Executed in " << time() << " seconds\n";
    }
    if (arguments_.dumpMem) {
        std::cout << "Mem: ";
        for (auto i = 0u; i < std::min((size_t)32, tape_.cells.size()); ++i) {
            std::cout << (int)tape_.cells[i] << ' ';
        }
        std::cout << '\n';
    }
}

void Engine::runCodeGenerator(const Program &prog) {
    std::ofstream out(arguments_.outputFileName);
    if (!out.good()) {
        throw BFError("Failed to open output file \"", arguments_.outputFileName, "\"");
    }
    time();
    CodeGenerator codeGenerator(arguments_);
    codeGenerator.compile(prog, out);
    if (arguments_.verbose) {
        std::cout << "Generated in " << time() << " seconds\n";
        std::cout << "Wrote " << codeGenerator.generatedLength() << " bytes of IR to " << arguments_.outputFileName
                  << '\n';
        std::cout << "Tape length: " << arguments_.bfMemLength << " cells\n";
    }
}

int runEngine(const Arguments &args) {
    try {
        Engine engine(args);
        engine.run();
    } catch (BFError &e) {
        std::cout.flush();
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    } catch (std::exception &e) {
        std::cout.flush();
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
