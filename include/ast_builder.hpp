#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "SourceManager.hpp"
#include "ast.hpp"

// Helpers for building program trees by hand, as the external parser would.
//
//   auto prog = program(
//       klass("Test",
//           function("main", {}, block(
//               var("x", integer(1)),
//               assertion(binary(ident("x"), "==", integer(1)))))));
namespace AstBuilder {

using ExprPtr = std::unique_ptr<ExpressionNode>;
using StmtPtr = std::unique_ptr<StatementNode>;
using FieldPtr = std::unique_ptr<ClassFieldNode>;

namespace detail {
template <typename T, typename... Args>
void push_all(std::vector<std::unique_ptr<T>>& out, Args&&... args) {
    (out.emplace_back(std::forward<Args>(args)), ...);
}

inline void add_member(ClassDeclarationNode& cls, FieldPtr field) {
    cls.fields.push_back(std::move(field));
}
inline void add_member(ClassDeclarationNode& cls, FunctionDeclPtr method) {
    cls.methods.push_back(std::move(method));
}

inline void add_decl(ProgramNode& prog, ClassDeclPtr cls) {
    prog.classes.push_back(std::move(cls));
}
inline void add_decl(ProgramNode& prog, FunctionDeclPtr fn) {
    prog.functions.push_back(std::move(fn));
}
}  // namespace detail

// ---------- expressions ----------

inline ExprPtr integer(int64_t v) {
    auto n = std::make_unique<IntegerLiteralNode>();
    n->value = v;
    n->token.value = n->to_string();
    return n;
}

inline ExprPtr number(double v) {
    auto n = std::make_unique<FloatLiteralNode>();
    n->value = v;
    n->token.value = n->to_string();
    return n;
}

inline ExprPtr str(const std::string& s) {
    auto n = std::make_unique<StringLiteralNode>();
    n->value = s;
    n->token.value = n->to_string();
    return n;
}

inline ExprPtr boolean(bool b) {
    auto n = std::make_unique<BooleanLiteralNode>();
    n->value = b;
    n->token.value = n->to_string();
    return n;
}

inline ExprPtr null() {
    return std::make_unique<NullLiteralNode>();
}

inline ExprPtr ident(const std::string& name) {
    auto n = std::make_unique<IdentifierNode>();
    n->name = name;
    n->token.value = name;
    return n;
}

inline ExprPtr self() {
    auto n = std::make_unique<SelfExpressionNode>();
    n->token.value = "self";
    return n;
}

inline ExprPtr unary(const std::string& op, ExprPtr operand) {
    auto n = std::make_unique<UnaryExpressionNode>();
    n->op = op;
    n->operand = std::move(operand);
    n->token.value = op;
    return n;
}

inline ExprPtr binary(ExprPtr left, const std::string& op, ExprPtr right) {
    auto n = std::make_unique<BinaryExpressionNode>();
    n->op = op;
    n->left = std::move(left);
    n->right = std::move(right);
    n->token.value = op;
    return n;
}

inline ExprPtr member(ExprPtr object, const std::string& property) {
    auto n = std::make_unique<MemberExpressionNode>();
    n->object = std::move(object);
    n->property = property;
    n->token.value = property;
    return n;
}

// path("d", {"a", "b"})  ->  d.a.b
inline ExprPtr path(const std::string& root, const std::vector<std::string>& keys) {
    ExprPtr e = ident(root);
    for (const auto& k : keys) e = member(std::move(e), k);
    return e;
}

inline ExprPtr index(ExprPtr object, ExprPtr idx) {
    auto n = std::make_unique<IndexExpressionNode>();
    n->object = std::move(object);
    n->index = std::move(idx);
    return n;
}

template <typename... Args>
ExprPtr call(ExprPtr callee, Args&&... args) {
    auto n = std::make_unique<CallExpressionNode>();
    n->callee = std::move(callee);
    detail::push_all(n->arguments, std::forward<Args>(args)...);
    n->token.value = n->callee->to_string();
    return n;
}

// bare m(args...)
template <typename... Args>
ExprPtr call_name(const std::string& name, Args&&... args) {
    return call(ident(name), std::forward<Args>(args)...);
}

// obj.m(args...)
template <typename... Args>
ExprPtr method_call(ExprPtr object, const std::string& method, Args&&... args) {
    return call(member(std::move(object), method), std::forward<Args>(args)...);
}

template <typename... Args>
ExprPtr list(Args&&... elements) {
    auto n = std::make_unique<ListExpressionNode>();
    detail::push_all(n->elements, std::forward<Args>(elements)...);
    return n;
}

inline std::unique_ptr<DictEntryNode> entry(const std::string& key, ExprPtr value) {
    auto n = std::make_unique<DictEntryNode>();
    n->key = key;
    n->value = std::move(value);
    n->token.value = key;
    return n;
}

template <typename... Entries>
ExprPtr dict(Entries&&... entries) {
    auto n = std::make_unique<DictExpressionNode>();
    detail::push_all(n->entries, std::forward<Entries>(entries)...);
    return n;
}

template <typename... Args>
ExprPtr construct(const std::string& class_name, Args&&... args) {
    auto n = std::make_unique<NewExpressionNode>();
    n->class_name = class_name;
    detail::push_all(n->arguments, std::forward<Args>(args)...);
    n->token.value = "new";
    return n;
}

// ---------- statements ----------

inline StmtPtr var(const std::string& name, ExprPtr value) {
    auto n = std::make_unique<VariableDeclarationNode>();
    n->identifier = name;
    n->value = std::move(value);
    n->token.value = name;
    return n;
}

inline StmtPtr assign(ExprPtr target, ExprPtr value) {
    auto n = std::make_unique<AssignmentNode>();
    n->target = std::move(target);
    n->value = std::move(value);
    n->token.value = "=";
    return n;
}

inline StmtPtr expr_stmt(ExprPtr e) {
    auto n = std::make_unique<ExpressionStatementNode>();
    n->expression = std::move(e);
    return n;
}

// source_text defaults to the expression rebuilt from the tree
inline StmtPtr assertion(ExprPtr e, const std::string& source_text = "") {
    auto n = std::make_unique<AssertStatementNode>();
    n->expression = std::move(e);
    n->source_text = source_text;
    n->token.value = "assert";
    return n;
}

inline StmtPtr print(ExprPtr e) {
    auto n = std::make_unique<PrintStatementNode>();
    n->expression = std::move(e);
    n->token.value = "print";
    return n;
}

inline StmtPtr ret(ExprPtr e = nullptr) {
    auto n = std::make_unique<ReturnStatementNode>();
    n->value = std::move(e);
    n->token.value = "return";
    return n;
}

template <typename... Stmts>
StatementList block(Stmts&&... stmts) {
    StatementList body;
    detail::push_all(body, std::forward<Stmts>(stmts)...);
    return body;
}

inline StmtPtr if_stmt(ExprPtr condition, StatementList then_body) {
    auto n = std::make_unique<IfStatementNode>();
    n->condition = std::move(condition);
    n->then_body = std::move(then_body);
    n->token.value = "if";
    return n;
}

inline StmtPtr if_else(ExprPtr condition, StatementList then_body, StatementList else_body) {
    auto n = std::make_unique<IfStatementNode>();
    n->condition = std::move(condition);
    n->then_body = std::move(then_body);
    n->else_body = std::move(else_body);
    n->has_else = true;
    n->token.value = "if";
    return n;
}

inline StmtPtr while_stmt(ExprPtr condition, StatementList body) {
    auto n = std::make_unique<WhileStatementNode>();
    n->condition = std::move(condition);
    n->body = std::move(body);
    n->token.value = "while";
    return n;
}

inline StmtPtr for_in(const std::string& variable, ExprPtr iterable, StatementList body) {
    auto n = std::make_unique<ForInStatementNode>();
    n->variable = variable;
    n->iterable = std::move(iterable);
    n->body = std::move(body);
    n->token.value = "for";
    return n;
}

inline StmtPtr for_range(const std::string& variable, ExprPtr from, ExprPtr to, StatementList body, ExprPtr step = nullptr) {
    auto n = std::make_unique<ForRangeStatementNode>();
    n->variable = variable;
    n->from = std::move(from);
    n->to = std::move(to);
    n->step = std::move(step);
    n->body = std::move(body);
    n->token.value = "for";
    return n;
}

// ---------- declarations ----------

inline FunctionDeclPtr function(const std::string& name, const std::vector<std::string>& params, StatementList body) {
    auto fn = std::make_shared<FunctionDeclarationNode>();
    fn->name = name;
    for (const auto& p : params) {
        auto pn = std::make_unique<ParameterNode>();
        pn->name = p;
        pn->token.value = p;
        fn->parameters.push_back(std::move(pn));
    }
    fn->body = std::move(body);
    fn->token.value = name;
    return fn;
}

inline ExprPtr lambda(const std::vector<std::string>& params, StatementList body) {
    auto n = std::make_unique<FunctionExpressionNode>();
    n->declaration = function("", params, std::move(body));
    n->token.value = "function";
    return n;
}

inline FieldPtr field(const std::string& name, ExprPtr initializer = nullptr) {
    auto n = std::make_unique<ClassFieldNode>();
    n->name = name;
    n->initializer = std::move(initializer);
    n->token.value = name;
    return n;
}

// members are fields (FieldPtr) and methods (FunctionDeclPtr) in any order
template <typename... Members>
ClassDeclPtr klass(const std::string& name, Members&&... members) {
    auto cls = std::make_shared<ClassDeclarationNode>();
    cls->name = name;
    cls->token.value = name;
    (detail::add_member(*cls, std::forward<Members>(members)), ...);
    return cls;
}

// declarations are classes (ClassDeclPtr) and free functions (FunctionDeclPtr)
template <typename... Decls>
std::unique_ptr<ProgramNode> program(Decls&&... decls) {
    auto prog = std::make_unique<ProgramNode>();
    (detail::add_decl(*prog, std::forward<Decls>(decls)), ...);
    return prog;
}

// Give a node a source position, as the parser would.
template <typename NodePtr>
NodePtr located(NodePtr node, int line, int col, int length = 1, const SourceManager* src = nullptr, const std::string& filename = "<test>") {
    node->token.loc = TokenLocation(filename, line, col, length, src);
    return node;
}

}  // namespace AstBuilder
