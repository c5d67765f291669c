// src/evaluator/StatementEval.cpp
#include "AssertionReporter.hpp"
#include "ScriptError.hpp"
#include "evaluator.hpp"

void Evaluator::execute_statements(const StatementList& body, EnvPtr env, Value* return_value, bool* did_return) {
    for (const auto& stmt : body) {
        evaluate_statement(stmt.get(), env, return_value, did_return);
        if (*did_return) return;
    }
}

void Evaluator::execute_block(const StatementList& body, EnvPtr parent, Value* return_value, bool* did_return) {
    auto scope = std::make_shared<Environment>(parent);
    execute_statements(body, scope, return_value, did_return);
}

void Evaluator::evaluate_assignment(AssignmentNode* an, EnvPtr env) {
    ExpressionNode* target = an->target.get();

    if (auto id = dynamic_cast<IdentifierNode*>(target)) {
        Value v = evaluate_expression(an->value.get(), env);
        env->set(id->name, v, id->token);
        return;
    }

    // containers left to right: the object, then the key, then the right-hand side
    if (auto mem = dynamic_cast<MemberExpressionNode*>(target)) {
        Value object = evaluate_expression(mem->object.get(), env);
        Value v = evaluate_expression(an->value.get(), env);
        set_member(object, mem->property, v, mem->token);
        return;
    }

    if (auto ie = dynamic_cast<IndexExpressionNode*>(target)) {
        Value object = evaluate_expression(ie->object.get(), env);
        Value index = evaluate_expression(ie->index.get(), env);
        Value v = evaluate_expression(an->value.get(), env);
        set_index(object, index, v, ie->token);
        return;
    }

    throw ScriptError(ErrorKind::TypeError,
        "Invalid assignment target '" + (target ? target->to_string() : std::string("<null>")) + "'.",
        an->token.loc);
}

void Evaluator::evaluate_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return) {
    if (!stmt) return;

    if (auto vd = dynamic_cast<VariableDeclarationNode*>(stmt)) {
        Value v = vd->value ? evaluate_expression(vd->value.get(), env) : Value{std::monostate{}};
        env->define(vd->identifier, v, vd->token);
        return;
    }

    if (auto an = dynamic_cast<AssignmentNode*>(stmt)) {
        evaluate_assignment(an, env);
        return;
    }

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        evaluate_expression(es->expression.get(), env);
        return;
    }

    if (auto as = dynamic_cast<AssertStatementNode*>(stmt)) {
        Value v = evaluate_expression(as->expression.get(), env);
        assert_truthy(v, as->expression_text(), as->token.loc);
        if (options_.trace) trace_line("assert ok: " + as->expression_text());
        return;
    }

    if (auto ps = dynamic_cast<PrintStatementNode*>(stmt)) {
        Value v = evaluate_expression(ps->expression.get(), env);
        if (options_.out) *options_.out << value_to_string(v) << "\n";
        return;
    }

    if (auto is = dynamic_cast<IfStatementNode*>(stmt)) {
        Value cond = evaluate_expression(is->condition.get(), env);
        if (is_truthy(cond)) {
            execute_block(is->then_body, env, return_value, did_return);
        } else if (is->has_else) {
            execute_block(is->else_body, env, return_value, did_return);
        }
        return;
    }

    if (auto ws = dynamic_cast<WhileStatementNode*>(stmt)) {
        while (is_truthy(evaluate_expression(ws->condition.get(), env))) {
            execute_block(ws->body, env, return_value, did_return);
            if (*did_return) return;
        }
        return;
    }

    if (auto fs = dynamic_cast<ForInStatementNode*>(stmt)) {
        execute_for_in(fs, env, return_value, did_return);
        return;
    }

    if (auto fr = dynamic_cast<ForRangeStatementNode*>(stmt)) {
        execute_for_range(fr, env, return_value, did_return);
        return;
    }

    if (auto rs = dynamic_cast<ReturnStatementNode*>(stmt)) {
        *return_value = rs->value ? evaluate_expression(rs->value.get(), env) : Value{std::monostate{}};
        *did_return = true;
        return;
    }

    throw ScriptError(ErrorKind::TypeError,
        "Unsupported statement '" + stmt->to_string() + "'.",
        stmt->token.loc);
}

// for x in list  -> elements as they were when the loop started
// for k in dict  -> keys in insertion order, same snapshot rule
void Evaluator::execute_for_in(ForInStatementNode* fs, EnvPtr env, Value* return_value, bool* did_return) {
    Value iterable = evaluate_expression(fs->iterable.get(), env);

    std::vector<Value> items;
    if (auto lp = std::get_if<ListPtr>(&iterable)) {
        items = (*lp)->elements;
    } else if (auto dp = std::get_if<DictPtr>(&iterable)) {
        items.reserve((*dp)->keys.size());
        for (const auto& k : (*dp)->keys) items.push_back(k);
    } else {
        throw ScriptError(ErrorKind::TypeError,
            "Cannot iterate over a value of type `" + type_name(iterable) + "`.",
            fs->token.loc);
    }

    for (const auto& item : items) {
        auto scope = std::make_shared<Environment>(env);
        scope->define(fs->variable, item, fs->token);
        execute_statements(fs->body, scope, return_value, did_return);
        if (*did_return) return;
    }
}

// for i = from to to [step s]: inclusive on both ends
void Evaluator::execute_for_range(ForRangeStatementNode* fr, EnvPtr env, Value* return_value, bool* did_return) {
    Value from = evaluate_expression(fr->from.get(), env);
    Value to = evaluate_expression(fr->to.get(), env);
    Value step = fr->step ? evaluate_expression(fr->step.get(), env) : Value{int64_t{1}};

    for (const Value* bound : {&from, &to, &step}) {
        if (!std::holds_alternative<int64_t>(*bound) && !std::holds_alternative<double>(*bound)) {
            throw ScriptError(ErrorKind::TypeError,
                "Range bounds and step must be numbers, got a value of type `" + type_name(*bound) + "`.",
                fr->token.loc);
        }
    }

    auto run_body = [&](const Value& current) {
        auto scope = std::make_shared<Environment>(env);
        scope->define(fr->variable, current, fr->token);
        execute_statements(fr->body, scope, return_value, did_return);
    };

    auto ia = std::get_if<int64_t>(&from);
    auto ib = std::get_if<int64_t>(&to);
    auto is = std::get_if<int64_t>(&step);
    if (ia && ib && is) {
        int64_t s = *is;
        if (s == 0) {
            throw ScriptError(ErrorKind::ArithmeticError, "Range step cannot be zero.", fr->token.loc);
        }
        int64_t i = *ia;
        while (s > 0 ? i <= *ib : i >= *ib) {
            run_body(Value{i});
            if (*did_return) return;
            if (__builtin_add_overflow(i, s, &i)) break;
        }
        return;
    }

    auto as_double = [](const Value& v) {
        if (auto p = std::get_if<int64_t>(&v)) return static_cast<double>(*p);
        return std::get<double>(v);
    };
    double a = as_double(from);
    double b = as_double(to);
    double s = as_double(step);
    if (s == 0.0) {
        throw ScriptError(ErrorKind::ArithmeticError, "Range step cannot be zero.", fr->token.loc);
    }
    // x = a + k*s, so x keeps advancing even where s is below the spacing of doubles near a
    for (int64_t k = 0;; ++k) {
        double x = a + static_cast<double>(k) * s;
        if (!(s > 0 ? x <= b : x >= b)) break;
        run_body(Value{x});
        if (*did_return) return;
    }
}
