#include <cstdio>
#include <iostream>

#include "error.hpp"
#include "runtime.hpp"

// Goes through the streambuf so std::cin can be redirected
static int nextByte() {
    const auto c = std::cin.rdbuf()->sbumpc();
    return c == std::char_traits<char>::eof() ? EOF : static_cast<unsigned char>(c);
}

int mgetchar_0_on_eof(int) {
    int c = nextByte();
    return c == EOF ? 0 : c;
}

int mgetchar_255_on_eof(int) {
    int c = nextByte();
    return c == EOF ? 255 : c;
}

int mgetchar_nothing_on_eof(int current_cell) {
    int c = nextByte();
    return c == EOF ? current_cell : c;
}

int mgetchar_error_on_eof(int) { return nextByte(); }

int mputchar(int c) {
    std::cout.put(static_cast<char>(c));
    std::cout.flush();
    return std::cout.good() ? c : EOF;
}

int mputchar_noflush(int c) {
    std::cout.put(static_cast<char>(c));
    return std::cout.good() ? c : EOF;
}

GetCharFunc getCharFunc(const Arguments &args) {
    switch (args.getCharBehaviour) {
    case GetCharBehaviour::EOF_RETURNS_0:
        return mgetchar_0_on_eof;
    case GetCharBehaviour::EOF_RETURNS_255:
        return mgetchar_255_on_eof;
    case GetCharBehaviour::EOF_DOESNT_MODIFY:
        return mgetchar_nothing_on_eof;
    case GetCharBehaviour::EOF_IS_ERROR:
        return mgetchar_error_on_eof;
    default:
        throw BFError("Unknown GetCharBehaviour variant: ", (int)args.getCharBehaviour);
    }
}

PutCharFunc putCharFunc(const Arguments &args) {
    if (args.noFlush) {
        return mputchar_noflush;
    } else {
        return mputchar;
    }
}
