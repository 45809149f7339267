#pragma once

#include <iostream>
#include <string>

#include "arguments.hpp"
#include "error.hpp"
#include "irbuf.hpp"
#include "ir.hpp"
#include "program.hpp"

// Emits a textual LLVM IR module implementing a Program. The module defines @main,
// which returns 0 on success and a non-zero status on a runtime failure:
//   1 tape pointer left the tape (bounds == error)
//   2 read past end of input (eof-behaviour == error)
//   3 putchar failed
class CodeGenerator {
  private:
    void generatePrelude(const Program &prog);
    void generateInsMove(size_t index, int step);
    void generateInsAdd(int step);
    void generateInsIn(size_t index);
    void generateInsOut(size_t index);
    void generateInsLoop(size_t loopNumber);
    void generateInsEndLoop(size_t loopNumber);
    void generateEpilogue();
    // Leaves the address of bfMem[dp] in the returned temporary
    std::string generateCellAddress();
    std::string ptrType(const std::string &pointee) const;
    std::string tapeType() const;

    IRBuf buf_;
    std::string lastText_;
    const size_t BFMEM_LENGTH;
    const std::string moduleName_;
    const GetCharBehaviour getCharBehaviour_;
    const BoundsBehaviour boundsBehaviour_;
    const bool opaquePointers_;

  public:
    explicit CodeGenerator(const Arguments &args)
        : BFMEM_LENGTH{args.bfMemLength}, moduleName_{args.fileName.empty() ? "bfir" : args.fileName},
          getCharBehaviour_{args.getCharBehaviour}, boundsBehaviour_{args.boundsBehaviour},
          opaquePointers_{args.opaquePointers} {}
    // Writes the whole module to sink. Compiling the same Program again produces the same text.
    void compile(const Program &prog, std::ostream &sink);
    std::string lastModuleText() const { return lastText_; }
    size_t generatedLength() const { return lastText_.size(); }
};
