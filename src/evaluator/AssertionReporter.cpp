// src/evaluator/AssertionReporter.cpp
#include "AssertionReporter.hpp"

#include "colors.hpp"

const char* run_status_name(RunStatus status) {
    switch (status) {
        case RunStatus::Ok:
            return "Ok";
        case RunStatus::AssertionFailed:
            return "AssertionFailed";
        case RunStatus::RuntimeError:
            return "RuntimeError";
        case RunStatus::StackOverflow:
            return "StackOverflow";
    }
    return "Unknown";
}

int exit_code(RunStatus status) {
    switch (status) {
        case RunStatus::Ok:
            return 0;
        case RunStatus::AssertionFailed:
            return 1;
        case RunStatus::RuntimeError:
            return 2;
        case RunStatus::StackOverflow:
            return 3;
    }
    return 2;
}

RunStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AssertionFailure:
            return RunStatus::AssertionFailed;
        case ErrorKind::StackOverflow:
            return RunStatus::StackOverflow;
        default:
            return RunStatus::RuntimeError;
    }
}

void assert_truthy(const Value& value, const std::string& source_text, const TokenLocation& loc) {
    if (is_truthy(value)) return;
    std::string snapshot = std::holds_alternative<bool>(value) ? "false" : "null";
    throw AssertionFailure(source_text, snapshot, loc);
}

static FailureInfo to_failure_info(const ScriptError& err) {
    FailureInfo info;
    info.kind = err.kind();
    info.message = err.message();
    info.location = err.location();
    info.rendered = err.what();
    if (auto af = dynamic_cast<const AssertionFailure*>(&err)) {
        info.source_text = af->source_text();
        info.value_snapshot = af->value_snapshot();
    }
    return info;
}

RunResult run_program(const ProgramNode& program, RuntimeOptions options) {
    RunResult result;
    Evaluator evaluator(std::move(options));
    try {
        evaluator.load(program);
        result.value = evaluator.run();
    } catch (const ScriptError& err) {
        result.status = status_for(err.kind());
        result.error = to_failure_info(err);
        result.value = std::monostate{};
        // the run unwound mid-way: anything it built is garbage now
        evaluator.break_cycles();
    }
    return result;
}

void report_failure(const ScriptError& err, std::ostream& os) {
    report_failure(to_failure_info(err), os);
}

void report_failure(const FailureInfo& info, std::ostream& os) {
    bool use_color = Color::supports_color(os);
    os << Color::paint("Error: ", Color::bright_red, use_color)
       << Color::paint(info.rendered, Color::bright_black, use_color) << std::endl;
}
