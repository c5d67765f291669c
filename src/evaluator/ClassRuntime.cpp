// src/evaluator/ClassRuntime.cpp
#include "ClassRuntime.hpp"

#include <unordered_set>

#include "Frame.hpp"
#include "ScriptError.hpp"

// ----------------- FunctionValue -----------------

FunctionValue::FunctionValue(const std::string& nm, const FunctionDeclPtr& decl, const ClassPtr& owner_class)
    : name(nm), declaration(decl), owner(owner_class) {
    if (decl) token = decl->token;
    MemoryTracking::g_function_count++;
}

FunctionValue::~FunctionValue() {
    MemoryTracking::g_function_count--;
}

std::string FunctionValue::qualified_name() const {
    std::string nm = name.empty() ? "<lambda>" : name;
    if (ClassPtr cls = owner.lock()) return cls->name + "." + nm;
    return nm;
}

FunctionPtr FunctionValue::bind(const InstancePtr& self) const {
    auto fn = std::make_shared<FunctionValue>(name, declaration, owner.lock());
    fn->token = token;
    fn->receiver = self;
    return fn;
}

// ----------------- ClassRegistry -----------------

ClassPtr ClassRegistry::declare(const ClassDeclPtr& decl) {
    auto existing = classes_.find(decl->name);
    if (existing != classes_.end()) {
        throw ScriptError(ErrorKind::RedefinitionError,
            "Class '" + decl->name + "' is already declared (first declared at " + existing->second->token.loc.to_string() + ").",
            decl->token.loc);
    }

    auto cls = std::make_shared<ClassValue>();
    cls->name = decl->name;
    cls->token = decl->token;
    cls->declaration = decl;

    std::unordered_set<std::string> field_names;
    for (const auto& f : decl->fields) {
        if (!field_names.insert(f->name).second) {
            throw ScriptError(ErrorKind::RedefinitionError,
                "Field '" + f->name + "' is declared twice in class '" + decl->name + "'.",
                f->token.loc);
        }
        cls->fields.push_back(f.get());
    }

    for (const auto& m : decl->methods) {
        if (cls->has_method(m->name)) {
            throw ScriptError(ErrorKind::RedefinitionError,
                "Method '" + m->name + "' is already defined in class '" + decl->name + "'.",
                m->token.loc);
        }
        cls->methods.emplace(m->name, std::make_shared<FunctionValue>(m->name, m, cls));
        cls->method_order.push_back(m->name);
    }

    classes_.emplace(cls->name, cls);
    order_.push_back(cls);
    return cls;
}

ClassPtr ClassRegistry::find(const std::string& name) const {
    auto it = classes_.find(name);
    return it == classes_.end() ? nullptr : it->second;
}

ClassPtr ClassRegistry::get(const std::string& name, const Token& token) const {
    ClassPtr cls = find(name);
    if (!cls) {
        throw ScriptError(ErrorKind::UnboundNameError, "Undefined class '" + name + "'.", token.loc);
    }
    return cls;
}

// ----------------- Instantiation -----------------

// Field initializers run first, in a scope whose parent is the global scope and with
// `self` bound, then `constructor` if the class declares one.
InstancePtr Evaluator::instantiate(const ClassPtr& cls, const std::vector<Value>& args, const Token& token) {
    auto inst = std::make_shared<InstanceValue>(cls);
    track_instance(inst);

    if (!cls->fields.empty()) {
        if (call_stack_.size() >= options_.max_call_depth) {
            throw ScriptError(ErrorKind::StackOverflow,
                "Maximum call depth of " + std::to_string(options_.max_call_depth) +
                    " exceeded while initializing fields of '" + cls->name + "'.",
                token.loc);
        }

        auto frame = std::make_shared<CallFrame>();
        frame->call_token = token;
        frame->label = cls->name + ".<fields>";
        frame->klass = cls;
        frame->self = inst;
        frame->env = std::make_shared<Environment>(global_env);

        push_frame(frame);
        try {
            for (const ClassFieldNode* field : cls->fields) {
                Value v = field->initializer ? evaluate_expression(field->initializer.get(), frame->env) : Value{std::monostate{}};
                inst->fields.set(field->name, v);
            }
        } catch (...) {
            pop_frame();
            throw;
        }
        pop_frame();
    }

    if (FunctionPtr ctor = cls->find_method("constructor")) {
        call_function(ctor, inst, args, token);
    } else if (!args.empty()) {
        throw ScriptError(ErrorKind::ArityError,
            "Class '" + cls->name + "' has no constructor but " + std::to_string(args.size()) + " argument(s) were given.",
            token.loc);
    }
    return inst;
}
