#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "ast.hpp"
#include "evaluator.hpp"

// A minimal runtime representation for classes
struct ClassValue {
    std::string name;
    // method table in declaration order; lookup goes through `methods`
    std::vector<std::string> method_order;
    std::unordered_map<std::string, FunctionPtr> methods;
    // field initializers, evaluated per instance on `new`
    std::vector<const ClassFieldNode*> fields;
    // keeps the declaration (and so the field initializers above) alive after load
    ClassDeclPtr declaration;
    // token for diagnostics
    Token token;

    ClassValue() { MemoryTracking::g_class_count++; }
    ClassValue(const ClassValue&) = delete;
    ClassValue& operator=(const ClassValue&) = delete;
    ~ClassValue() { MemoryTracking::g_class_count--; }

    FunctionPtr find_method(const std::string& method) const {
        auto it = methods.find(method);
        return it == methods.end() ? nullptr : it->second;
    }
    bool has_method(const std::string& method) const { return methods.count(method) != 0; }
};

// An object of a declared class: the class plus its own field table.
struct InstanceValue {
    ClassPtr klass;
    DictValue fields;

    explicit InstanceValue(ClassPtr cls) : klass(std::move(cls)) { MemoryTracking::g_instance_count++; }
    InstanceValue(const InstanceValue&) = delete;
    InstanceValue& operator=(const InstanceValue&) = delete;
    ~InstanceValue() { MemoryTracking::g_instance_count--; }
};

// Name -> class table built once at load time; read-only afterwards.
class ClassRegistry {
   public:
    // Throws RedefinitionError on a duplicate class name or a duplicate method inside the class.
    ClassPtr declare(const ClassDeclPtr& decl);

    ClassPtr find(const std::string& name) const;

    // Throws UnboundNameError when no such class exists.
    ClassPtr get(const std::string& name, const Token& token = {}) const;

    bool has(const std::string& name) const { return classes_.count(name) != 0; }
    size_t size() const { return order_.size(); }

   private:
    std::unordered_map<std::string, ClassPtr> classes_;
    std::vector<ClassPtr> order_;
};
