#pragma once
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "token.hpp"

// The tree below is what the external parser produces. The evaluator never mutates it.

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {};

struct NullLiteralNode : public ExpressionNode {
    std::string to_string() const override {
        return "null";
    }
};

struct IntegerLiteralNode : public ExpressionNode {
    int64_t value = 0;
    std::string to_string() const override {
        return std::to_string(value);
    }
};

struct FloatLiteralNode : public ExpressionNode {
    double value = 0.0;
    std::string to_string() const override {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        return "\"" + value + "\"";
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "true" : "false";
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
};

// `self` inside a method body
struct SelfExpressionNode : public ExpressionNode {
    std::string to_string() const override {
        return "self";
    }
};

struct UnaryExpressionNode : public ExpressionNode {
    std::string op;  // "!" or "-"
    std::unique_ptr<ExpressionNode> operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return op + opnd;
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // + - * / ^ == != < <= > >=
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + op + " " + r + ")";
    }
};

struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string c = callee ? callee->to_string() : "<null>";
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return c + "(" + args + ")";
    }
};

// Member expression: obj.key (one segment of a path expression)
struct MemberExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        return o + "." + property;
    }
};

// Index expression: list[i] or dict["key"]
struct IndexExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::unique_ptr<ExpressionNode> index;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        std::string i = index ? index->to_string() : "<null>";
        return o + "[" + i + "]";
    }
};

struct ListExpressionNode : public ExpressionNode {
    std::vector<std::unique_ptr<ExpressionNode>> elements;

    std::string to_string() const override {
        std::string s = "[";
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i) s += ", ";
            s += elements[i] ? elements[i]->to_string() : "<null>";
        }
        return s + "]";
    }
};

// "key": value inside a dict literal
struct DictEntryNode : public Node {
    std::string key;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return "\"" + key + "\": " + (value ? value->to_string() : "<null>");
    }
};

struct DictExpressionNode : public ExpressionNode {
    std::vector<std::unique_ptr<DictEntryNode>> entries;

    std::string to_string() const override {
        std::string s = "{";
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i) s += ", ";
            s += entries[i]->to_string();
        }
        return s + "}";
    }
};

// new ClassName(args...)
struct NewExpressionNode : public ExpressionNode {
    std::string class_name;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return "new " + class_name + "(" + args + ")";
    }
};

// Statements
struct StatementNode : public Node {};

using StatementList = std::vector<std::unique_ptr<StatementNode>>;

// var name = value;
struct VariableDeclarationNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return "var " + identifier + " = " + (value ? value->to_string() : "null");
    }
};

// target = value;  target is an IdentifierNode, MemberExpressionNode or IndexExpressionNode
struct AssignmentNode : public StatementNode {
    std::unique_ptr<ExpressionNode> target;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return (target ? target->to_string() : "<null>") + " = " + (value ? value->to_string() : "<null>");
    }
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return expression ? expression->to_string() : "<null>";
    }
};

struct AssertStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;
    // literal source text of the asserted expression; empty -> rebuilt from the tree
    std::string source_text;

    std::string expression_text() const {
        if (!source_text.empty()) return source_text;
        return expression ? expression->to_string() : "<null>";
    }
    std::string to_string() const override {
        return "assert " + expression_text();
    }
};

struct PrintStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return "print " + (expression ? expression->to_string() : "<null>");
    }
};

struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    StatementList then_body;
    StatementList else_body;
    bool has_else = false;
};

struct WhileStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    StatementList body;
};

// for item in iterable { ... }
struct ForInStatementNode : public StatementNode {
    std::string variable;
    std::unique_ptr<ExpressionNode> iterable;
    StatementList body;
};

// for i = from to to [step s] { ... }   (inclusive)
struct ForRangeStatementNode : public StatementNode {
    std::string variable;
    std::unique_ptr<ExpressionNode> from;
    std::unique_ptr<ExpressionNode> to;
    std::unique_ptr<ExpressionNode> step;  // optional, defaults to 1
    StatementList body;
};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // optional

    std::string to_string() const override {
        return "return" + (value ? " " + value->to_string() : std::string());
    }
};

struct ParameterNode : public Node {
    std::string name;

    std::string to_string() const override {
        return name;
    }
};

struct FunctionDeclarationNode : public Node {
    std::string name;
    std::vector<std::unique_ptr<ParameterNode>> parameters;
    StatementList body;

    std::string to_string() const override {
        std::string ps;
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (i) ps += ", ";
            ps += parameters[i]->name;
        }
        return "function " + name + "(" + ps + ")";
    }
};

using FunctionDeclPtr = std::shared_ptr<FunctionDeclarationNode>;

// Anonymous function literal: function(a, b) { ... }
struct FunctionExpressionNode : public ExpressionNode {
    FunctionDeclPtr declaration;

    std::string to_string() const override {
        return declaration ? declaration->to_string() : "function()";
    }
};

// var name = initializer;  inside a class body; evaluated per instance on `new`
struct ClassFieldNode : public Node {
    std::string name;
    std::unique_ptr<ExpressionNode> initializer;  // optional, null when absent

    std::string to_string() const override {
        return "var " + name;
    }
};

struct ClassDeclarationNode : public Node {
    std::string name;
    std::vector<std::unique_ptr<ClassFieldNode>> fields;
    std::vector<FunctionDeclPtr> methods;

    std::string to_string() const override {
        return "class " + name;
    }
};

using ClassDeclPtr = std::shared_ptr<ClassDeclarationNode>;

// What the parser hands over: ordered class declarations plus any free functions.
struct ProgramNode : public Node {
    std::vector<ClassDeclPtr> classes;
    std::vector<FunctionDeclPtr> functions;
};
