#pragma once
#include "error.hpp"
#include <cstddef>
#include <set>
#include <sstream>
#include <string>

// Text buffer for one LLVM IR module. Hands out SSA temporaries and keeps track of block
// labels, so a finished module never branches to a block it doesn't define.
class IRBuf {
    std::ostringstream data;
    size_t next_temp{};
    bool in_block{false};
    std::set<std::string> defined_labels;
    std::set<std::string> referenced_labels;

    template <typename T, typename... R> void append(const T &first, const R &...rest) {
        data << first;
        append(rest...);
    }
    void append() {}

  public:
    IRBuf() = default;
    IRBuf(const IRBuf &other) = delete;
    IRBuf &operator=(const IRBuf &other) = delete;
    void reset() {
        data.str("");
        data.clear();
        next_temp = 0;
        in_block = false;
        defined_labels.clear();
        referenced_labels.clear();
    }

    // Top level text outside any function body
    template <typename... R> void write_global(const R &...parts) {
        if (in_block) {
            throw BFError("ICE: global written inside a block");
        }
        append(parts...);
        data << '\n';
    }
    // One instruction inside the current block
    template <typename... R> void write_ins(const R &...parts) {
        if (!in_block) {
            throw BFError("ICE: instruction written outside a block");
        }
        data << "  ";
        append(parts...);
        data << '\n';
    }
    // Terminator: ends the current block
    template <typename... R> void write_terminator(const R &...parts) {
        write_ins(parts...);
        in_block = false;
    }
    void begin_block(const std::string &label) {
        if (in_block) {
            throw BFError("ICE: block ", label, " started before the previous one was terminated");
        }
        if (!defined_labels.insert(label).second) {
            throw BFError("ICE: block ", label, " defined twice");
        }
        data << label << ":\n";
        in_block = true;
    }
    // "label %name", recording the reference
    std::string label_ref(const std::string &label) {
        referenced_labels.insert(label);
        return "label %" + label;
    }
    std::string temp() { return "%t" + std::to_string(next_temp++); }
    bool is_referenced(const std::string &label) const { return referenced_labels.count(label) > 0; }
    void finish() {
        if (in_block) {
            throw BFError("ICE: unterminated block at end of function");
        }
        for (const auto &label : referenced_labels) {
            if (!defined_labels.count(label)) {
                throw BFError("ICE: branch to undefined block ", label);
            }
        }
    }
    std::string text() const { return data.str(); }
};
