#pragma once
#include <iostream>
#include <optional>
#include <string>

#include "ScriptError.hpp"
#include "ast.hpp"
#include "evaluator.hpp"

// Host-facing side of a script run: turns the exceptions a run ends with into a result.

enum class RunStatus {
    Ok,
    AssertionFailed,
    RuntimeError,
    StackOverflow
};

const char* run_status_name(RunStatus status);

struct FailureInfo {
    ErrorKind kind;
    std::string message;
    TokenLocation location;
    std::string rendered;  // full what() text
    // set only for AssertionFailure
    std::string source_text;
    std::string value_snapshot;
};

struct RunResult {
    RunStatus status = RunStatus::Ok;
    Value value;  // entry point's return value, null on failure
    std::optional<FailureInfo> error;

    bool ok() const { return status == RunStatus::Ok; }
};

// Ok -> 0, AssertionFailed -> 1, RuntimeError -> 2, StackOverflow -> 3
int exit_code(RunStatus status);

RunStatus status_for(ErrorKind kind);

// Load `program` into a fresh evaluator and call the entry point. Script failures never
// escape; they come back in RunResult::error.
RunResult run_program(const ProgramNode& program, RuntimeOptions options = RuntimeOptions());

void report_failure(const ScriptError& err, std::ostream& os = std::cerr);
void report_failure(const FailureInfo& info, std::ostream& os = std::cerr);

// `assert <expr>;` semantics: no-op when truthy, AssertionFailure otherwise.
// Only false and null are falsy, so the snapshot is always one of those two words.
void assert_truthy(const Value& value, const std::string& source_text, const TokenLocation& loc);
