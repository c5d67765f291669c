#pragma once

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "memory_tracking.hpp"
#include "token.hpp"

// Forward declaration
class Environment;
using EnvPtr = std::shared_ptr<Environment>;

// Containers are shared by reference: copying a Value copies the handle, never the storage.
struct ListValue;
using ListPtr = std::shared_ptr<ListValue>;

struct DictValue;
using DictPtr = std::shared_ptr<DictValue>;

struct InstanceValue;
using InstancePtr = std::shared_ptr<InstanceValue>;

struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct ClassValue;
using ClassPtr = std::shared_ptr<ClassValue>;

class ClassRegistry;

struct CallFrame;
using CallFramePtr = std::shared_ptr<CallFrame>;

// NOTE: build integers as int64_t{...} and strings as std::string{...};
// a bare literal would pick the wrong alternative.
using Value = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    ListPtr,
    DictPtr,
    InstancePtr,
    FunctionPtr,
    ClassPtr>;

struct ListValue {
    std::vector<Value> elements;

    ListValue() { MemoryTracking::g_list_count++; }
    ListValue(const ListValue&) = delete;
    ListValue& operator=(const ListValue&) = delete;
    ~ListValue() { MemoryTracking::g_list_count--; }
};

// String-keyed table that remembers insertion order.
struct DictValue {
    std::vector<std::string> keys;
    std::unordered_map<std::string, Value> entries;

    DictValue() { MemoryTracking::g_dict_count++; }
    DictValue(const DictValue&) = delete;
    DictValue& operator=(const DictValue&) = delete;
    ~DictValue() { MemoryTracking::g_dict_count--; }

    bool has(const std::string& key) const { return entries.count(key) != 0; }

    Value* find(const std::string& key) {
        auto it = entries.find(key);
        return it == entries.end() ? nullptr : &it->second;
    }
    const Value* find(const std::string& key) const {
        auto it = entries.find(key);
        return it == entries.end() ? nullptr : &it->second;
    }

    // creates the key if absent, overwrites in place otherwise
    void set(const std::string& key, Value value) {
        auto it = entries.find(key);
        if (it != entries.end()) {
            it->second = std::move(value);
            return;
        }
        keys.push_back(key);
        entries.emplace(key, std::move(value));
    }

    size_t size() const { return keys.size(); }

    void clear() {
        // move out first so destructors that run during the clear see an empty table
        auto doomed = std::move(entries);
        entries.clear();
        keys.clear();
    }
};

// A declared function. `owner` is the class whose method table holds it (empty for free
// functions and function literals); `receiver` is set only on methods read through an instance.
struct FunctionValue {
    std::string name;
    FunctionDeclPtr declaration;
    std::weak_ptr<ClassValue> owner;
    InstancePtr receiver;
    Token token;

    FunctionValue(const std::string& nm, const FunctionDeclPtr& decl, const ClassPtr& owner_class = nullptr);
    FunctionValue(const FunctionValue&) = delete;
    FunctionValue& operator=(const FunctionValue&) = delete;
    ~FunctionValue();

    size_t arity() const { return declaration ? declaration->parameters.size() : 0; }

    // "Class.method" for methods, bare name otherwise
    std::string qualified_name() const;

    // Same function with `self` fixed to the given instance.
    FunctionPtr bind(const InstancePtr& self) const;
};

// Environment with lexical parent pointer
class Environment {
   public:
    explicit Environment(EnvPtr parent = nullptr) : parent(std::move(parent)) {
    }

    struct Variable {
        Value value;
        Token token;  // where the name was declared
    };

    // map from name -> Variable
    std::unordered_map<std::string,
        Variable>
        values;
    EnvPtr parent;

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;

    // check this scope only
    bool has_own(const std::string& name) const;

    // bind in this scope. Throws RedefinitionError if this exact scope already owns the name.
    void define(const std::string& name, const Value& value, const Token& token = {});

    // get reference to variable (searches up the chain). Throws UnboundNameError if not found.
    Variable& get(const std::string& name, const Token& token = {});

    // overwrite the nearest binding. Throws UnboundNameError if no scope owns the name.
    void set(const std::string& name, const Value& value, const Token& token = {});
};

struct RuntimeOptions {
    std::string entry_class = "Test";
    std::string entry_method = "main";
    // calls nested deeper than this fail with StackOverflow
    size_t max_call_depth = 1000;
    std::ostream* out = &std::cout;   // target of `print`
    std::ostream* trace = nullptr;    // call/assert trace, off when null
};

// ----------------- Value model -----------------
std::string type_name(const Value& v);

// only false and null are falsy
bool is_truthy(const Value& v);

// structural for scalars, identity for containers
bool values_equal(const Value& a, const Value& b);

bool is_container(const Value& v);

// Evaluator
class Evaluator {
   public:
    explicit Evaluator(RuntimeOptions options = RuntimeOptions());
    ~Evaluator();

    // Build the class registry and bind classes and free functions in the global scope.
    // The program may be destroyed afterwards; the runtime keeps what it needs.
    void load(const ProgramNode& program);

    // Invoke the configured entry point (Test.main by default) as a class-level call.
    // Cycles among containers allocated by this run and unreachable from its result are
    // broken afterwards; containers the host obtained earlier are left alone.
    Value run(const std::vector<Value>& args = {});

    // ClassName.method(args) from the host side; `self` stays unbound.
    Value call_class_method(const std::string& class_name, const std::string& method, const std::vector<Value>& args, const Token& callToken = {});

    // Public wrapper that lets the host invoke any callable value.
    Value invoke_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken = {});

    // Evaluate a standalone expression in the global scope.
    Value evaluate_expression(ExpressionNode* expr);

    // Path protocol: root.k1.k2...kn read and write.
    Value get_path(const Value& root, const std::vector<std::string>& keys, const Token& token = {});
    void set_path(const Value& root, const std::vector<std::string>& keys, const Value& value, const Token& token = {});

    // Allocation goes through these so the cycle breaker knows about every container.
    ListPtr make_list(std::vector<Value> elements = {});
    DictPtr make_dict();
    InstancePtr instantiate(const ClassPtr& cls, const std::vector<Value>& args, const Token& token = {});

    // repr: strings quoted, containers expanded, cycles cut
    std::string print_value(const Value& v);
    // display form used by `print` and string concatenation: top-level strings unquoted
    std::string value_to_string(const Value& v);

    // Clear every tracked container that is no longer reachable from `roots` or the
    // global scope. Returns how many containers were cleared.
    size_t break_cycles(const std::vector<Value>& roots = {});

    // Tracking entries currently held, live or expired.
    size_t tracked_count() const { return tracked_lists_.size() + tracked_dicts_.size() + tracked_instances_.size(); }

    EnvPtr global_environment() const { return global_env; }
    const ClassRegistry& class_registry() const { return *classes_; }
    size_t call_depth() const { return call_stack_.size(); }
    const RuntimeOptions& options() const { return options_; }

   private:
    RuntimeOptions options_;
    EnvPtr global_env;
    std::unique_ptr<ClassRegistry> classes_;
    std::vector<CallFramePtr> call_stack_;

    std::vector<std::weak_ptr<ListValue>> tracked_lists_;
    std::vector<std::weak_ptr<DictValue>> tracked_dicts_;
    std::vector<std::weak_ptr<InstanceValue>> tracked_instances_;
    void track_instance(const InstancePtr& inst);

    // call frame helpers
    void push_frame(CallFramePtr f);
    void pop_frame();
    CallFramePtr current_frame();

    // Expression & statement evaluators. Pass the environment explicitly for lexical scoping.
    Value evaluate_expression(ExpressionNode* expr, EnvPtr env);
    void evaluate_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return);
    // runs `body` in a fresh child scope of `parent`
    void execute_block(const StatementList& body, EnvPtr parent, Value* return_value, bool* did_return);
    void execute_statements(const StatementList& body, EnvPtr env, Value* return_value, bool* did_return);
    void execute_for_in(ForInStatementNode* fs, EnvPtr env, Value* return_value, bool* did_return);
    void execute_for_range(ForRangeStatementNode* fr, EnvPtr env, Value* return_value, bool* did_return);
    void evaluate_assignment(AssignmentNode* an, EnvPtr env);

    // call dispatch
    Value evaluate_call(CallExpressionNode* call, EnvPtr env);
    std::vector<Value> evaluate_arguments(const std::vector<std::unique_ptr<ExpressionNode>>& args, EnvPtr env);
    Value call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken);
    Value call_function(FunctionPtr fn, InstancePtr self, const std::vector<Value>& args, const Token& callToken);

    // member / index protocol
    Value get_member(const Value& obj, const std::string& key, const Token& token);
    void set_member(const Value& obj, const std::string& key, const Value& value, const Token& token);
    Value get_index(const Value& obj, const Value& index, const Token& token);
    void set_index(const Value& obj, const Value& index, const Value& value, const Token& token);
    size_t checked_list_index(const ListPtr& list, const Value& index, const Token& token);

    // operators
    Value binary_op(const std::string& op, const Value& left, const Value& right, const Token& token);
    Value unary_op(const std::string& op, const Value& operand, const Token& token);
    int compare_values(const Value& left, const Value& right, const std::string& op, const Token& token);

    std::string print_value(const Value& v, std::unordered_set<const void*>& visited);
    void trace_line(const std::string& line);
};
