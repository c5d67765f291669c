//src/evaluator/Environment.cpp
#include "ScriptError.hpp"
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

bool Environment::has(const std::string& name) const {
    auto it = values.find(name);
    if (it != values.end()) return true;
    if (parent) return parent->has(name);
    return false;
}

bool Environment::has_own(const std::string& name) const {
    return values.find(name) != values.end();
}

void Environment::define(const std::string& name, const Value& value, const Token& token) {
    auto it = values.find(name);
    if (it != values.end()) {
        throw ScriptError(ErrorKind::RedefinitionError,
            "'" + name + "' is already defined in this scope (first defined at " + it->second.token.loc.to_string() + ").",
            token.loc);
    }
    values.emplace(name, Variable{value, token});
}

Environment::Variable& Environment::get(const std::string& name, const Token& token) {
    Environment* env = this;
    while (env) {
        auto it = env->values.find(name);
        if (it != env->values.end()) return it->second;
        env = env->parent.get();
    }
    throw ScriptError(ErrorKind::UnboundNameError, "Undefined variable '" + name + "'.", token.loc);
}

void Environment::set(const std::string& name, const Value& value, const Token& token) {
    Environment* env = this;
    while (env) {
        auto it = env->values.find(name);
        if (it != env->values.end()) {
            it->second.value = value;
            return;
        }
        env = env->parent.get();
    }
    throw ScriptError(ErrorKind::UnboundNameError,
        "Cannot assign to '" + name + "': no variable with that name is in scope. Declare it first with 'var'.",
        token.loc);
}
