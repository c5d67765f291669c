#pragma once
#include <memory>
#include <string>

#include "ast.hpp"
#include "evaluator.hpp"

// One active function or method invocation.
struct CallFrame {
    FunctionPtr function;
    std::shared_ptr<Environment> env;
    Token call_token;
    std::string label;
    // For methods: the class whose table the function came from, and the bound
    // instance. `self` stays null for class-qualified calls.
    ClassPtr klass;
    InstancePtr self;
};
using CallFramePtr = std::shared_ptr<CallFrame>;
