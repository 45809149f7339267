#pragma once
#include <cstddef>
#include <string>

enum class GetCharBehaviour { EOF_RETURNS_0, EOF_RETURNS_255, EOF_DOESNT_MODIFY, EOF_IS_ERROR };

enum class BoundsBehaviour { ERROR, WRAP };

struct Arguments {
    size_t bfMemLength{30000};
    std::string fileName;
    std::string outputFileName{"out.ll"};
    bool verbose{false};
    bool dumpProgram{false};
    bool dumpMem{false};
    bool useInterpreter{false};
    bool noFlush{false};
    bool opaquePointers{false};
    GetCharBehaviour getCharBehaviour{GetCharBehaviour::EOF_RETURNS_0};
    BoundsBehaviour boundsBehaviour{BoundsBehaviour::ERROR};

    Arguments() = default;
    Arguments(int argc, const char *const argv[]);
};
