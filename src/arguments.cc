#include <cstdlib>
#include <cxxopts.hpp>
#include <iostream>

#include "arguments.hpp"

Arguments::Arguments(int argc, const char *const argv[]) {
    cxxopts::Options options("bfir", "Compiles brainfuck to LLVM IR, or interprets it");
    const auto eofBehavioursParseType = cxxopts::value<std::string>()->default_value("return-0");
    const auto eofBehaviourOptionDescription = "Behaviour on eof (one of return-0, return-255, dont-modify, error)";
    const auto boundsParseType = cxxopts::value<std::string>()->default_value("error");
    const auto boundsOptionDescription = "Behaviour when the pointer leaves the tape (one of error, wrap)";
    // clang-format off
    options.add_options()
        .operator()("m,mem-size", "Number of memory cells", cxxopts::value<size_t>()->default_value("30000"))
        .operator()("o,output", "Output file for the generated IR", cxxopts::value<std::string>()->default_value("out.ll"))
        .operator()("file-names", "BF source file name", cxxopts::value<std::vector<std::string>>())
        .operator()("b,bounds", boundsOptionDescription, boundsParseType)
        .operator()("d,dump-program", "Dump the resolved instructions")
        .operator()("dump-mem", "Dump the first 32 cells of memory after interpreting")
        .operator()("e,eof-behaviour", eofBehaviourOptionDescription, eofBehavioursParseType)
        .operator()("h,help", "Print help")
        .operator()("n,no-flush", "Don't flush after each character")
        .operator()("opaque-pointers", "Emit opaque ptr types (LLVM 15 and later)")
        .operator()("use-interpreter", "Don't generate IR, just interpret the program")
        .operator()("v,verbose", "Print more information");
    // clang-format on
    options.positional_help("[input file]").show_positional_help();
    options.parse_positional({"file-names"});
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << '\n';
            exit(0);
        }
        verbose = result.count("verbose");
        dumpProgram = result.count("dump-program");
        dumpMem = result.count("dump-mem");
        noFlush = result.count("no-flush");
        opaquePointers = result.count("opaque-pointers");
        useInterpreter = result.count("use-interpreter");
        outputFileName = result["output"].as<std::string>();
        bfMemLength = result["mem-size"].as<size_t>();
        if (bfMemLength == 0) {
            throw cxxopts::OptionException("Memory size must be at least 1 cell");
        }
        if (result.count("eof-behaviour")) {
            const auto behaviour = result["eof-behaviour"].as<std::string>();
            if (behaviour == "return-0") {
                getCharBehaviour = GetCharBehaviour::EOF_RETURNS_0;
            } else if (behaviour == "return-255") {
                getCharBehaviour = GetCharBehaviour::EOF_RETURNS_255;
            } else if (behaviour == "dont-modify") {
                getCharBehaviour = GetCharBehaviour::EOF_DOESNT_MODIFY;
            } else if (behaviour == "error") {
                getCharBehaviour = GetCharBehaviour::EOF_IS_ERROR;
            } else {
                throw cxxopts::OptionException("Invalid argument for eof-behaviour");
            }
        }
        if (result.count("bounds")) {
            const auto behaviour = result["bounds"].as<std::string>();
            if (behaviour == "error") {
                boundsBehaviour = BoundsBehaviour::ERROR;
            } else if (behaviour == "wrap") {
                boundsBehaviour = BoundsBehaviour::WRAP;
            } else {
                throw cxxopts::OptionException("Invalid argument for bounds");
            }
        }
        if (!result.count("file-names")) {
            throw cxxopts::OptionException("No source file specified");
        }
        const auto fileNames = result["file-names"].as<std::vector<std::string>>();
        if (fileNames.size() != 1) {
            throw cxxopts::OptionException("Exactly one source file is supported");
        }
        fileName = fileNames.front();
    } catch (cxxopts::OptionException &e) {
        std::cout << options.help() << '\n';
        std::cout << "Failed to parse args: " << e.what() << '\n';
        exit(1);
    }
}
