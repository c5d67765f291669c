// src/evaluator/ExpressionEval.cpp
#include "ClassRuntime.hpp"
#include "Frame.hpp"
#include "ScriptError.hpp"
#include "evaluator.hpp"

Value Evaluator::evaluate_expression(ExpressionNode* expr, EnvPtr env) {
    if (!expr) return std::monostate{};

    if (dynamic_cast<NullLiteralNode*>(expr)) {
        return std::monostate{};
    }
    if (auto n = dynamic_cast<IntegerLiteralNode*>(expr)) {
        return n->value;
    }
    if (auto n = dynamic_cast<FloatLiteralNode*>(expr)) {
        return n->value;
    }
    if (auto s = dynamic_cast<StringLiteralNode*>(expr)) {
        return s->value;
    }
    if (auto b = dynamic_cast<BooleanLiteralNode*>(expr)) {
        return b->value;
    }

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        return env->get(id->name, id->token).value;
    }

    if (dynamic_cast<SelfExpressionNode*>(expr)) {
        CallFramePtr frame = current_frame();
        if (!frame || !frame->self) {
            throw ScriptError(ErrorKind::UnboundNameError,
                "'self' is not bound here: " +
                    (frame ? "'" + frame->label + "' was called without an instance." : std::string("not inside a method.")),
                expr->token.loc);
        }
        return frame->self;
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(expr)) {
        Value operand = evaluate_expression(u->operand.get(), env);
        return unary_op(u->op, operand, u->token);
    }

    if (auto b = dynamic_cast<BinaryExpressionNode*>(expr)) {
        Value left = evaluate_expression(b->left.get(), env);
        Value right = evaluate_expression(b->right.get(), env);
        return binary_op(b->op, left, right, b->token);
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        return evaluate_call(call, env);
    }

    if (auto mem = dynamic_cast<MemberExpressionNode*>(expr)) {
        Value object = evaluate_expression(mem->object.get(), env);
        return get_member(object, mem->property, mem->token);
    }

    if (auto ie = dynamic_cast<IndexExpressionNode*>(expr)) {
        Value object = evaluate_expression(ie->object.get(), env);
        Value index = evaluate_expression(ie->index.get(), env);
        return get_index(object, index, ie->token);
    }

    if (auto ln = dynamic_cast<ListExpressionNode*>(expr)) {
        std::vector<Value> elements;
        elements.reserve(ln->elements.size());
        for (const auto& e : ln->elements) {
            elements.push_back(evaluate_expression(e.get(), env));
        }
        return make_list(std::move(elements));
    }

    if (auto dn = dynamic_cast<DictExpressionNode*>(expr)) {
        DictPtr dict = make_dict();
        for (const auto& entry : dn->entries) {
            dict->set(entry->key, evaluate_expression(entry->value.get(), env));
        }
        return dict;
    }

    if (auto ne = dynamic_cast<NewExpressionNode*>(expr)) {
        ClassPtr cls = classes_->get(ne->class_name, ne->token);
        auto args = evaluate_arguments(ne->arguments, env);
        return instantiate(cls, args, ne->token);
    }

    if (auto fe = dynamic_cast<FunctionExpressionNode*>(expr)) {
        FunctionPtr fn = std::make_shared<FunctionValue>("", fe->declaration);
        fn->token = fe->token;
        return fn;
    }

    throw ScriptError(ErrorKind::TypeError,
        "Unsupported expression '" + expr->to_string() + "'.",
        expr->token.loc);
}

// ----------------- Member / index protocol -----------------

Value Evaluator::get_member(const Value& obj, const std::string& key, const Token& token) {
    if (auto dp = std::get_if<DictPtr>(&obj)) {
        const Value* v = (*dp)->find(key);
        if (!v) {
            throw ScriptError(ErrorKind::KeyNotFoundError,
                "Key '" + key + "' not found in dictionary.",
                token.loc);
        }
        return *v;
    }

    if (auto ip = std::get_if<InstancePtr>(&obj)) {
        const InstancePtr& inst = *ip;
        // fields shadow methods
        if (const Value* v = inst->fields.find(key)) return *v;
        if (FunctionPtr method = inst->klass->find_method(key)) return method->bind(inst);
        throw ScriptError(ErrorKind::MemberNotFoundError,
            "Instance of '" + inst->klass->name + "' has no field or method '" + key + "'.",
            token.loc);
    }

    if (auto cp = std::get_if<ClassPtr>(&obj)) {
        if (FunctionPtr method = (*cp)->find_method(key)) return method;
        throw ScriptError(ErrorKind::MemberNotFoundError,
            "Class '" + (*cp)->name + "' has no method '" + key + "'.",
            token.loc);
    }

    throw ScriptError(ErrorKind::TypeError,
        "Cannot read member '" + key + "' of a value of type `" + type_name(obj) + "`.",
        token.loc);
}

void Evaluator::set_member(const Value& obj, const std::string& key, const Value& value, const Token& token) {
    if (auto dp = std::get_if<DictPtr>(&obj)) {
        (*dp)->set(key, value);
        return;
    }

    if (auto ip = std::get_if<InstancePtr>(&obj)) {
        (*ip)->fields.set(key, value);
        return;
    }

    if (auto cp = std::get_if<ClassPtr>(&obj)) {
        throw ScriptError(ErrorKind::TypeError,
            "Cannot assign '" + key + "' on class '" + (*cp)->name + "': classes are immutable after load.",
            token.loc);
    }

    throw ScriptError(ErrorKind::TypeError,
        "Cannot set member '" + key + "' on a value of type `" + type_name(obj) + "`.",
        token.loc);
}

size_t Evaluator::checked_list_index(const ListPtr& list, const Value& index, const Token& token) {
    auto ip = std::get_if<int64_t>(&index);
    if (!ip) {
        throw ScriptError(ErrorKind::TypeError,
            "List index must be an integer, got a value of type `" + type_name(index) + "`.",
            token.loc);
    }
    int64_t i = *ip;
    if (i < 0 || static_cast<uint64_t>(i) >= list->elements.size()) {
        throw ScriptError(ErrorKind::IndexError,
            "List index " + std::to_string(i) + " out of range (length " + std::to_string(list->elements.size()) + ").",
            token.loc);
    }
    return static_cast<size_t>(i);
}

Value Evaluator::get_index(const Value& obj, const Value& index, const Token& token) {
    if (auto lp = std::get_if<ListPtr>(&obj)) {
        size_t i = checked_list_index(*lp, index, token);
        return (*lp)->elements[i];
    }

    if (std::holds_alternative<DictPtr>(obj) || std::holds_alternative<InstancePtr>(obj)) {
        auto key = std::get_if<std::string>(&index);
        if (!key) {
            throw ScriptError(ErrorKind::TypeError,
                "Keys must be strings, got a value of type `" + type_name(index) + "`.",
                token.loc);
        }
        return get_member(obj, *key, token);
    }

    throw ScriptError(ErrorKind::TypeError,
        "Cannot index a value of type `" + type_name(obj) + "`.",
        token.loc);
}

void Evaluator::set_index(const Value& obj, const Value& index, const Value& value, const Token& token) {
    if (auto lp = std::get_if<ListPtr>(&obj)) {
        size_t i = checked_list_index(*lp, index, token);
        (*lp)->elements[i] = value;
        return;
    }

    if (std::holds_alternative<DictPtr>(obj) || std::holds_alternative<InstancePtr>(obj)) {
        auto key = std::get_if<std::string>(&index);
        if (!key) {
            throw ScriptError(ErrorKind::TypeError,
                "Keys must be strings, got a value of type `" + type_name(index) + "`.",
                token.loc);
        }
        set_member(obj, *key, value, token);
        return;
    }

    throw ScriptError(ErrorKind::TypeError,
        "Cannot index-assign into a value of type `" + type_name(obj) + "`.",
        token.loc);
}
