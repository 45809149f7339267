#pragma once
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ir.hpp"

// Main error type for bfir, everything thrown by the pipeline derives from it
class BFError : public std::runtime_error {
    template <typename T, typename... R>
    static void append_strs(std::stringstream &ss, const T &first, const R &...rest) {
        ss << first;
        append_strs(ss, rest...);
    }
    static void append_strs(std::stringstream &) {}

  protected:
    explicit BFError(const std::string &message) : std::runtime_error(message) {}
    template <typename... R> static std::string concat(const R &...il) {
        std::stringstream ss;
        append_strs(ss, il...);
        return ss.str();
    }

  public:
    template <typename... R>
    explicit BFError(const char *first, const R &...rest) : std::runtime_error(concat(first, rest...)) {}
};

enum class SyntaxErrorKind { UNMATCHED_LOOP_END, UNMATCHED_LOOP_START };

// Loop structure errors, raised before any code is generated or executed
class SyntaxError : public BFError {
  public:
    SyntaxError(SyntaxErrorKind kind, std::vector<size_t> indices, SourcePosition position);
    SyntaxErrorKind kind() const { return kind_; }
    const std::vector<size_t> &indices() const { return indices_; }
    SourcePosition position() const { return position_; }

  private:
    SyntaxErrorKind kind_;
    std::vector<size_t> indices_;
    SourcePosition position_;
};

enum class RuntimeErrorKind { TAPE_BOUNDS_EXCEEDED, INPUT_EXHAUSTED, IO_ERROR };

// Execution errors, execution halts at instruction index()
class RuntimeError : public BFError {
  public:
    RuntimeError(RuntimeErrorKind kind, size_t index, SourcePosition position);
    RuntimeErrorKind kind() const { return kind_; }
    size_t index() const { return index_; }
    SourcePosition position() const { return position_; }

  private:
    RuntimeErrorKind kind_;
    size_t index_;
    SourcePosition position_;
};

std::ostream &operator<<(std::ostream &os, SyntaxErrorKind kind);
std::ostream &operator<<(std::ostream &os, RuntimeErrorKind kind);
