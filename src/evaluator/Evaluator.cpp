// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

#include "ClassRuntime.hpp"
#include "Frame.hpp"
#include "ScriptError.hpp"

namespace {
// drop dead entries once the list has grown, so long-running loops don't keep every weak_ptr
template <typename T>
void track(std::vector<std::weak_ptr<T>>& tracked, const std::shared_ptr<T>& p) {
    if (tracked.size() >= 4096 && tracked.size() == tracked.capacity()) {
        tracked.erase(std::remove_if(tracked.begin(), tracked.end(),
                          [](const std::weak_ptr<T>& w) { return w.expired(); }),
            tracked.end());
    }
    tracked.push_back(p);
}

template <typename T>
std::vector<std::shared_ptr<T>> collect_unreachable(std::vector<std::weak_ptr<T>>& tracked, const std::unordered_set<const void*>& reachable) {
    std::vector<std::shared_ptr<T>> out;
    std::vector<std::weak_ptr<T>> alive;
    for (auto& w : tracked) {
        auto p = w.lock();
        if (!p) continue;
        alive.push_back(w);
        if (!reachable.count(p.get())) out.push_back(p);
    }
    tracked.swap(alive);
    return out;
}

// put entries that predate a run back in front of the ones it added
template <typename T>
void restore_tracked(std::vector<std::weak_ptr<T>>& tracked, std::vector<std::weak_ptr<T>>& earlier) {
    earlier.insert(earlier.end(), tracked.begin(), tracked.end());
    tracked.swap(earlier);
    earlier.clear();
}
}  // namespace

Evaluator::~Evaluator() = default;

Evaluator::Evaluator(RuntimeOptions options)
    : options_(std::move(options)),
      global_env(std::make_shared<Environment>(nullptr)),
      classes_(std::make_unique<ClassRegistry>()) {
}

void Evaluator::push_frame(CallFramePtr f) {
    if (!f) return;
    call_stack_.push_back(f);
}

void Evaluator::pop_frame() {
    if (!call_stack_.empty()) {
        call_stack_.pop_back();
    }
}

CallFramePtr Evaluator::current_frame() {
    if (call_stack_.empty()) return nullptr;
    return call_stack_.back();
}

void Evaluator::trace_line(const std::string& line) {
    if (options_.trace) *options_.trace << line << "\n";
}

// ----------------- Program loading -----------------
void Evaluator::load(const ProgramNode& program) {
    for (const auto& decl : program.classes) {
        if (!decl) continue;
        ClassPtr cls = classes_->declare(decl);
        global_env->define(cls->name, cls, decl->token);
    }

    for (const auto& decl : program.functions) {
        if (!decl) continue;
        FunctionPtr fn = std::make_shared<FunctionValue>(decl->name, decl);
        global_env->define(decl->name, fn, decl->token);
    }
}

Value Evaluator::run(const std::vector<Value>& args) {
    Token entry_token;
    entry_token.value = options_.entry_class + "." + options_.entry_method;
    entry_token.loc.filename = "<entry>";

    // set aside what was allocated before this run so only the run's own containers are candidates
    std::vector<std::weak_ptr<ListValue>> earlier_lists;
    std::vector<std::weak_ptr<DictValue>> earlier_dicts;
    std::vector<std::weak_ptr<InstanceValue>> earlier_instances;
    earlier_lists.swap(tracked_lists_);
    earlier_dicts.swap(tracked_dicts_);
    earlier_instances.swap(tracked_instances_);

    auto restore = [&]() {
        restore_tracked(tracked_lists_, earlier_lists);
        restore_tracked(tracked_dicts_, earlier_dicts);
        restore_tracked(tracked_instances_, earlier_instances);
    };

    Value result;
    try {
        result = call_class_method(options_.entry_class, options_.entry_method, args, entry_token);

        std::vector<Value> roots(args);
        roots.push_back(result);
        break_cycles(roots);
    } catch (...) {
        restore();
        throw;
    }
    restore();
    return result;
}

Value Evaluator::call_class_method(const std::string& class_name, const std::string& method, const std::vector<Value>& args, const Token& callToken) {
    ClassPtr cls = classes_->get(class_name, callToken);
    FunctionPtr fn = cls->find_method(method);
    if (!fn) {
        throw ScriptError(ErrorKind::MemberNotFoundError,
            "Class '" + class_name + "' has no method '" + method + "'.",
            callToken.loc);
    }
    return call_function(fn, nullptr, args, callToken);
}

Value Evaluator::invoke_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    InstancePtr self = fn ? fn->receiver : nullptr;
    return call_function(fn, self, args, callToken);
}

Value Evaluator::evaluate_expression(ExpressionNode* expr) {
    return evaluate_expression(expr, global_env);
}

// ----------------- Allocation -----------------
ListPtr Evaluator::make_list(std::vector<Value> elements) {
    auto list = std::make_shared<ListValue>();
    list->elements = std::move(elements);
    track(tracked_lists_, list);
    return list;
}

DictPtr Evaluator::make_dict() {
    auto dict = std::make_shared<DictValue>();
    track(tracked_dicts_, dict);
    return dict;
}

void Evaluator::track_instance(const InstancePtr& inst) {
    track(tracked_instances_, inst);
}

// ----------------- Path protocol -----------------
Value Evaluator::get_path(const Value& root, const std::vector<std::string>& keys, const Token& token) {
    Value current = root;
    for (const auto& key : keys) {
        current = get_member(current, key, token);
    }
    return current;
}

void Evaluator::set_path(const Value& root, const std::vector<std::string>& keys, const Value& value, const Token& token) {
    if (keys.empty()) {
        throw ScriptError(ErrorKind::TypeError, "Cannot assign through an empty path.", token.loc);
    }
    // every intermediate segment must already exist; nothing is created on the way down
    Value current = root;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        current = get_member(current, keys[i], token);
    }
    set_member(current, keys.back(), value, token);
}

// ----------------- Reclamation -----------------
size_t Evaluator::break_cycles(const std::vector<Value>& roots) {
    std::unordered_set<const void*> reachable;
    std::vector<Value> pending(roots);

    for (const auto& kv : global_env->values) pending.push_back(kv.second.value);
    for (const auto& frame : call_stack_) {
        if (frame->self) pending.push_back(frame->self);
        for (Environment* env = frame->env.get(); env && env != global_env.get(); env = env->parent.get()) {
            for (const auto& kv : env->values) pending.push_back(kv.second.value);
        }
    }

    while (!pending.empty()) {
        Value v = std::move(pending.back());
        pending.pop_back();

        if (auto lp = std::get_if<ListPtr>(&v)) {
            if (!*lp || !reachable.insert(lp->get()).second) continue;
            for (const auto& el : (*lp)->elements) pending.push_back(el);
        } else if (auto dp = std::get_if<DictPtr>(&v)) {
            if (!*dp || !reachable.insert(dp->get()).second) continue;
            for (const auto& kv : (*dp)->entries) pending.push_back(kv.second);
        } else if (auto ip = std::get_if<InstancePtr>(&v)) {
            if (!*ip || !reachable.insert(ip->get()).second) continue;
            for (const auto& kv : (*ip)->fields.entries) pending.push_back(kv.second);
        } else if (auto fp = std::get_if<FunctionPtr>(&v)) {
            if (*fp && (*fp)->receiver) pending.push_back((*fp)->receiver);
        }
    }

    // hold strong refs to everything doomed first, so clearing one container
    // never destroys another while it is being walked
    auto lists = collect_unreachable(tracked_lists_, reachable);
    auto dicts = collect_unreachable(tracked_dicts_, reachable);
    auto instances = collect_unreachable(tracked_instances_, reachable);

    for (auto& l : lists) {
        std::vector<Value> doomed;
        doomed.swap(l->elements);
    }
    for (auto& d : dicts) d->clear();
    for (auto& inst : instances) inst->fields.clear();

    return lists.size() + dicts.size() + instances.size();
}
