#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Every failure a script run can end with. None of them is recoverable inside the language.
enum class ErrorKind {
    AssertionFailure,
    UnboundNameError,
    KeyNotFoundError,
    MemberNotFoundError,
    ArityError,
    RedefinitionError,
    StackOverflow,
    TypeError,
    IndexError,
    ArithmeticError
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AssertionFailure:
            return "AssertionFailure";
        case ErrorKind::UnboundNameError:
            return "UnboundNameError";
        case ErrorKind::KeyNotFoundError:
            return "KeyNotFoundError";
        case ErrorKind::MemberNotFoundError:
            return "MemberNotFoundError";
        case ErrorKind::ArityError:
            return "ArityError";
        case ErrorKind::RedefinitionError:
            return "RedefinitionError";
        case ErrorKind::StackOverflow:
            return "StackOverflow";
        case ErrorKind::TypeError:
            return "TypeError";
        case ErrorKind::IndexError:
            return "IndexError";
        case ErrorKind::ArithmeticError:
            return "ArithmeticError";
    }
    return "Error";
}

class ScriptError : public std::runtime_error {
   public:
    ScriptError(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(kind, message, loc)),
                                    kind_(kind),
                                    message_(message),
                                    loc_(loc) {}

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }

   private:
    ErrorKind kind_;
    std::string message_;
    TokenLocation loc_;

    static std::string format_message(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc) {
        return std::string(error_kind_name(kind)) + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};

// Raised by `assert <expr>;` when <expr> is falsy.
class AssertionFailure : public ScriptError {
   public:
    AssertionFailure(const std::string& source_text,
        const std::string& value_snapshot,
        const TokenLocation& loc) : ScriptError(ErrorKind::AssertionFailure,
                                        "Assertion `" + source_text + "` failed (value was " + value_snapshot + ").",
                                        loc),
                                    source_text_(source_text),
                                    value_snapshot_(value_snapshot) {}

    const std::string& source_text() const { return source_text_; }
    const std::string& value_snapshot() const { return value_snapshot_; }

   private:
    std::string source_text_;
    std::string value_snapshot_;
};
