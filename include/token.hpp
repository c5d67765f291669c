#pragma once

#include <string>

#include "SourceManager.hpp"

// Small struct for a node's location / span in source.
// The external parser fills these in; nodes built by hand default to "<ast>":1:1.
struct TokenLocation {
   public:
    std::string filename = "<ast>";  // source filename (or "<ast>" for hand-built trees)
    int line = 1;                    // 1-based
    int col = 1;                     // 1-based column of token start
    int length = 0;                  // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Source anchor carried by every AST node: the raw lexeme plus where it came from.
struct Token {
    std::string value;  // raw text of the construct, when the parser provides it
    TokenLocation loc;

    Token() = default;
    Token(const std::string& v, const TokenLocation& l)
        : value(v), loc(l) {}
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col, length);
}
