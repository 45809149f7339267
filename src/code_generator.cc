#include <cstdio>
#include <iostream>
#include <string>

#include "code_generator.hpp"

// Module layout:
//   @tape  [BFMEM_LENGTH x i8], zero initialized
//   @dp    i64 index into @tape
//   @main  one straight-line body, each loop k split into blocks
//          loop.k.cond (test bfMem[dp]), loop.k.body, loop.k.exit
// Every instruction reloads @dp and recomputes the cell address, llc's mem2reg/GVN clean it up.

static const std::string TAPE_ERROR_LABEL = "tape.error";
static const std::string INPUT_ERROR_LABEL = "input.error";
static const std::string OUTPUT_ERROR_LABEL = "output.error";

static std::string loopLabel(size_t loopNumber, const char *part) {
    return "loop." + std::to_string(loopNumber) + '.' + part;
}

// Escapes a string for use inside an IR "..." literal
static std::string escapeString(const std::string &s) {
    static const char hexDigits[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (c == '"' || c == '\\' || c < 0x20 || c >= 0x7f) {
            out += '\\';
            out += hexDigits[c >> 4];
            out += hexDigits[c & 0xf];
        } else {
            out += c;
        }
    }
    return out;
}

void CodeGenerator::compile(const Program &prog, std::ostream &sink) {
    buf_.reset();
    generatePrelude(prog);
    for (auto i = 0u; i < prog.size(); ++i) {
        const auto &ins = prog[i];
        switch (ins.code_) {
        case IROpCode::RIGHT:
            generateInsMove(i, 1);
            break;
        case IROpCode::LEFT:
            generateInsMove(i, -1);
            break;
        case IROpCode::INC:
            generateInsAdd(1);
            break;
        case IROpCode::DEC:
            generateInsAdd(-1);
            break;
        case IROpCode::IN:
            generateInsIn(i);
            break;
        case IROpCode::OUT:
            generateInsOut(i);
            break;
        case IROpCode::LOOP:
            generateInsLoop(ins.a_);
            break;
        case IROpCode::END_LOOP:
            generateInsEndLoop(ins.a_);
            break;
        default:
            throw BFError("ICE: Unhandled instruction");
        }
    }
    generateEpilogue();
    buf_.finish();
    lastText_ = buf_.text();
    sink << lastText_;
    if (!sink.good()) {
        throw BFError("Failed to write generated IR");
    }
}

std::string CodeGenerator::ptrType(const std::string &pointee) const {
    return opaquePointers_ ? "ptr" : pointee + '*';
}

std::string CodeGenerator::tapeType() const { return "[" + std::to_string(BFMEM_LENGTH) + " x i8]"; }

void CodeGenerator::generatePrelude(const Program &prog) {
    buf_.write_global("; ModuleID = '", escapeString(moduleName_), "'");
    buf_.write_global("source_filename = \"", escapeString(moduleName_), "\"");
    buf_.write_global("");
    buf_.write_global("; ", prog.size(), " instructions, ", prog.loopCount(), " loops");
    buf_.write_global("@tape = internal global ", tapeType(), " zeroinitializer");
    buf_.write_global("@dp = internal global i64 0");
    buf_.write_global("");
    buf_.write_global("declare i32 @getchar()");
    buf_.write_global("declare i32 @putchar(i32)");
    buf_.write_global("");
    buf_.write_global("define i32 @main() {");
    buf_.begin_block("entry");
}

std::string CodeGenerator::generateCellAddress() {
    const auto dp = buf_.temp();
    buf_.write_ins(dp, " = load i64, ", ptrType("i64"), " @dp");
    const auto addr = buf_.temp();
    buf_.write_ins(addr, " = getelementptr inbounds ", tapeType(), ", ", ptrType(tapeType()), " @tape, i64 0, i64 ",
                   dp);
    return addr;
}

void CodeGenerator::generateInsMove(size_t index, int step) {
    const auto dp = buf_.temp();
    buf_.write_ins(dp, " = load i64, ", ptrType("i64"), " @dp");
    const auto moved = buf_.temp();
    buf_.write_ins(moved, " = ", step > 0 ? "add" : "sub", " i64 ", dp, ", 1");
    auto result = moved;
    if (boundsBehaviour_ == BoundsBehaviour::ERROR) {
        /// dp - 1 wraps to 2^64 - 1 at the left edge, so one unsigned compare covers both ends
        const auto outside = buf_.temp();
        buf_.write_ins(outside, " = icmp uge i64 ", moved, ", ", BFMEM_LENGTH);
        const auto okLabel = "move." + std::to_string(index) + ".ok";
        buf_.write_terminator("br i1 ", outside, ", ", buf_.label_ref(TAPE_ERROR_LABEL), ", ",
                              buf_.label_ref(okLabel));
        buf_.begin_block(okLabel);
    } else {
        const auto atEdge = buf_.temp();
        result = buf_.temp();
        if (step > 0) {
            buf_.write_ins(atEdge, " = icmp eq i64 ", moved, ", ", BFMEM_LENGTH);
            buf_.write_ins(result, " = select i1 ", atEdge, ", i64 0, i64 ", moved);
        } else {
            buf_.write_ins(atEdge, " = icmp eq i64 ", dp, ", 0");
            buf_.write_ins(result, " = select i1 ", atEdge, ", i64 ", BFMEM_LENGTH - 1, ", i64 ", moved);
        }
    }
    buf_.write_ins("store i64 ", result, ", ", ptrType("i64"), " @dp");
}

void CodeGenerator::generateInsAdd(int step) {
    const auto addr = generateCellAddress();
    const auto value = buf_.temp();
    buf_.write_ins(value, " = load i8, ", ptrType("i8"), ' ', addr);
    const auto sum = buf_.temp();
    /// i8 arithmetic wraps modulo 256
    buf_.write_ins(sum, " = add i8 ", value, ", ", step);
    buf_.write_ins("store i8 ", sum, ", ", ptrType("i8"), ' ', addr);
}

void CodeGenerator::generateInsIn(size_t index) {
    const auto c = buf_.temp();
    buf_.write_ins(c, " = call i32 @getchar()");
    const auto isEof = buf_.temp();
    buf_.write_ins(isEof, " = icmp eq i32 ", c, ", ", EOF);
    if (getCharBehaviour_ == GetCharBehaviour::EOF_IS_ERROR) {
        const auto okLabel = "read." + std::to_string(index) + ".ok";
        buf_.write_terminator("br i1 ", isEof, ", ", buf_.label_ref(INPUT_ERROR_LABEL), ", ",
                              buf_.label_ref(okLabel));
        buf_.begin_block(okLabel);
    }
    const auto addr = generateCellAddress();
    const auto byte = buf_.temp();
    buf_.write_ins(byte, " = trunc i32 ", c, " to i8");
    auto stored = byte;
    switch (getCharBehaviour_) {
    case GetCharBehaviour::EOF_RETURNS_0:
        stored = buf_.temp();
        buf_.write_ins(stored, " = select i1 ", isEof, ", i8 0, i8 ", byte);
        break;
    case GetCharBehaviour::EOF_RETURNS_255:
        /// trunc of EOF (-1) is already 255
        break;
    case GetCharBehaviour::EOF_DOESNT_MODIFY: {
        const auto old = buf_.temp();
        buf_.write_ins(old, " = load i8, ", ptrType("i8"), ' ', addr);
        stored = buf_.temp();
        buf_.write_ins(stored, " = select i1 ", isEof, ", i8 ", old, ", i8 ", byte);
    } break;
    case GetCharBehaviour::EOF_IS_ERROR:
        break;
    }
    buf_.write_ins("store i8 ", stored, ", ", ptrType("i8"), ' ', addr);
}

void CodeGenerator::generateInsOut(size_t index) {
    const auto addr = generateCellAddress();
    const auto value = buf_.temp();
    buf_.write_ins(value, " = load i8, ", ptrType("i8"), ' ', addr);
    const auto arg = buf_.temp();
    buf_.write_ins(arg, " = zext i8 ", value, " to i32");
    const auto rc = buf_.temp();
    buf_.write_ins(rc, " = call i32 @putchar(i32 ", arg, ")");
    const auto failed = buf_.temp();
    buf_.write_ins(failed, " = icmp eq i32 ", rc, ", ", EOF);
    const auto okLabel = "write." + std::to_string(index) + ".ok";
    buf_.write_terminator("br i1 ", failed, ", ", buf_.label_ref(OUTPUT_ERROR_LABEL), ", ", buf_.label_ref(okLabel));
    buf_.begin_block(okLabel);
}

void CodeGenerator::generateInsLoop(size_t loopNumber) {
    // loop.k.exit is referenced here and defined by the matching END_LOOP
    const auto condLabel = loopLabel(loopNumber, "cond");
    buf_.write_terminator("br ", buf_.label_ref(condLabel));
    buf_.begin_block(condLabel);
    const auto addr = generateCellAddress();
    const auto value = buf_.temp();
    buf_.write_ins(value, " = load i8, ", ptrType("i8"), ' ', addr);
    const auto isZero = buf_.temp();
    buf_.write_ins(isZero, " = icmp eq i8 ", value, ", 0");
    const auto bodyLabel = loopLabel(loopNumber, "body");
    buf_.write_terminator("br i1 ", isZero, ", ", buf_.label_ref(loopLabel(loopNumber, "exit")), ", ",
                          buf_.label_ref(bodyLabel));
    buf_.begin_block(bodyLabel);
}

void CodeGenerator::generateInsEndLoop(size_t loopNumber) {
    buf_.write_terminator("br ", buf_.label_ref(loopLabel(loopNumber, "cond")));
    buf_.begin_block(loopLabel(loopNumber, "exit"));
}

void CodeGenerator::generateEpilogue() {
    buf_.write_terminator("ret i32 0");
    int status = 1;
    for (const auto &label : {TAPE_ERROR_LABEL, INPUT_ERROR_LABEL, OUTPUT_ERROR_LABEL}) {
        if (buf_.is_referenced(label)) {
            buf_.begin_block(label);
            buf_.write_terminator("ret i32 ", status);
        }
        ++status;
    }
    buf_.write_global("}");
}
