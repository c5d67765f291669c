// src/evaluator/FunctionCall.cpp
#include <sstream>

#include "ClassRuntime.hpp"
#include "Frame.hpp"
#include "ScriptError.hpp"
#include "evaluator.hpp"

std::vector<Value> Evaluator::evaluate_arguments(const std::vector<std::unique_ptr<ExpressionNode>>& args, EnvPtr env) {
    std::vector<Value> out;
    out.reserve(args.size());
    for (const auto& a : args) {
        out.push_back(evaluate_expression(a.get(), env));
    }
    return out;
}

// Call dispatch. The three call shapes resolve differently:
//   m(args)        enclosing class's method (self carried over from the current frame),
//                  else whatever callable `m` names in scope
//   inst.m(args)   the instance's class method with self bound, else a function-valued field
//   Cls.m(args)    the class method with no self
// Anything else evaluates the callee to a value and calls that.
Value Evaluator::evaluate_call(CallExpressionNode* call, EnvPtr env) {
    if (auto id = dynamic_cast<IdentifierNode*>(call->callee.get())) {
        CallFramePtr frame = current_frame();
        if (frame && frame->klass) {
            if (FunctionPtr method = frame->klass->find_method(id->name)) {
                InstancePtr self = frame->self;
                auto args = evaluate_arguments(call->arguments, env);
                return call_function(method, self, args, call->token);
            }
        }
        Value callee = env->get(id->name, id->token).value;
        auto args = evaluate_arguments(call->arguments, env);
        return call_value(callee, args, call->token);
    }

    if (auto mem = dynamic_cast<MemberExpressionNode*>(call->callee.get())) {
        Value receiver = evaluate_expression(mem->object.get(), env);

        if (auto ip = std::get_if<InstancePtr>(&receiver)) {
            InstancePtr inst = *ip;
            if (FunctionPtr method = inst->klass->find_method(mem->property)) {
                auto args = evaluate_arguments(call->arguments, env);
                return call_function(method, inst, args, call->token);
            }
            if (const Value* field = inst->fields.find(mem->property)) {
                if (!std::holds_alternative<FunctionPtr>(*field)) {
                    throw ScriptError(ErrorKind::TypeError,
                        "Field '" + mem->property + "' of " + print_value(receiver) + " holds a " + type_name(*field) + ", not a function.",
                        mem->token.loc);
                }
                Value callee = *field;
                auto args = evaluate_arguments(call->arguments, env);
                return call_value(callee, args, call->token);
            }
            throw ScriptError(ErrorKind::MemberNotFoundError,
                "Instance of '" + inst->klass->name + "' has no method or field '" + mem->property + "'.",
                mem->token.loc);
        }

        if (auto cp = std::get_if<ClassPtr>(&receiver)) {
            ClassPtr cls = *cp;
            FunctionPtr method = cls->find_method(mem->property);
            if (!method) {
                throw ScriptError(ErrorKind::MemberNotFoundError,
                    "Class '" + cls->name + "' has no method '" + mem->property + "'.",
                    mem->token.loc);
            }
            auto args = evaluate_arguments(call->arguments, env);
            return call_function(method, nullptr, args, call->token);
        }

        // dicts (and type errors for everything else) go through the normal member protocol
        Value callee = get_member(receiver, mem->property, mem->token);
        auto args = evaluate_arguments(call->arguments, env);
        return call_value(callee, args, call->token);
    }

    Value callee = evaluate_expression(call->callee.get(), env);
    auto args = evaluate_arguments(call->arguments, env);
    return call_value(callee, args, call->token);
}

Value Evaluator::call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken) {
    if (auto fp = std::get_if<FunctionPtr>(&callee)) {
        FunctionPtr fn = *fp;
        return call_function(fn, fn ? fn->receiver : nullptr, args, callToken);
    }
    if (auto cp = std::get_if<ClassPtr>(&callee)) {
        throw ScriptError(ErrorKind::TypeError,
            "Class '" + (*cp)->name + "' is not callable; use 'new " + (*cp)->name + "(...)' to create an instance.",
            callToken.loc);
    }
    throw ScriptError(ErrorKind::TypeError,
        "Value of type `" + type_name(callee) + "` is not callable.",
        callToken.loc);
}

Value Evaluator::call_function(FunctionPtr fn, InstancePtr self, const std::vector<Value>& args, const Token& callToken) {
    if (!fn || !fn->declaration) {
        throw ScriptError(ErrorKind::TypeError, "Attempt to call a null function.", callToken.loc);
    }

    const std::string label = fn->qualified_name();

    if (call_stack_.size() >= options_.max_call_depth) {
        throw ScriptError(ErrorKind::StackOverflow,
            "Maximum call depth of " + std::to_string(options_.max_call_depth) +
                " exceeded while calling '" + label + "'. Check for unbounded recursion.",
            callToken.loc);
    }

    if (args.size() != fn->arity()) {
        std::ostringstream ss;
        ss << "Function '" << label << "' expects " << fn->arity()
           << " argument(s) but got " << args.size() << ".";
        throw ScriptError(ErrorKind::ArityError, ss.str(), callToken.loc);
    }

    auto frame = std::make_shared<CallFrame>();
    frame->function = fn;
    frame->call_token = callToken;
    frame->label = label;
    frame->klass = fn->owner.lock();
    frame->self = self;

    // call scopes hang off the global scope: no access to the caller's locals
    auto local = std::make_shared<Environment>(global_env);
    frame->env = local;

    for (size_t i = 0; i < fn->declaration->parameters.size(); ++i) {
        const auto& p = fn->declaration->parameters[i];
        local->define(p->name, args[i], p->token);
    }

    if (options_.trace) {
        std::string shown;
        for (size_t i = 0; i < args.size(); ++i) {
            if (i) shown += ", ";
            shown += print_value(args[i]);
        }
        trace_line("-> " + label + "(" + shown + ")");
    }

    push_frame(frame);
    Value ret_val = std::monostate{};
    bool did_return = false;

    try {
        execute_statements(fn->declaration->body, local, &ret_val, &did_return);
    } catch (...) {
        pop_frame();
        throw;
    }
    pop_frame();

    if (!did_return) ret_val = std::monostate{};
    if (options_.trace) trace_line("<- " + label + " = " + print_value(ret_val));
    return ret_val;
}
