#include <climits>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <unordered_set>

#include "ClassRuntime.hpp"
#include "ScriptError.hpp"
#include "evaluator.hpp"

// ----------------- Value model -----------------

std::string type_name(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<bool>(v)) return "bool";
    if (std::holds_alternative<int64_t>(v)) return "number";
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<std::string>(v)) return "string";
    if (std::holds_alternative<ListPtr>(v)) return "list";
    if (std::holds_alternative<DictPtr>(v)) return "dict";
    if (std::holds_alternative<InstancePtr>(v)) return "instance";
    if (std::holds_alternative<FunctionPtr>(v)) return "function";
    if (std::holds_alternative<ClassPtr>(v)) return "class";
    return "unknown";
}

bool is_truthy(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return false;
    if (auto b = std::get_if<bool>(&v)) return *b;
    return true;
}

static bool is_number(const Value& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<double>(v);
}

static double as_double(const Value& v) {
    if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    return std::get<double>(v);
}

bool values_equal(const Value& a, const Value& b) {
    // Number is one type: 2 == 2.0
    if (is_number(a) && is_number(b)) {
        auto ia = std::get_if<int64_t>(&a);
        auto ib = std::get_if<int64_t>(&b);
        if (ia && ib) return *ia == *ib;
        return as_double(a) == as_double(b);
    }
    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (auto x = std::get_if<bool>(&a)) return *x == std::get<bool>(b);
    if (auto x = std::get_if<std::string>(&a)) return *x == std::get<std::string>(b);
    if (auto x = std::get_if<ListPtr>(&a)) return *x == std::get<ListPtr>(b);
    if (auto x = std::get_if<DictPtr>(&a)) return *x == std::get<DictPtr>(b);
    if (auto x = std::get_if<InstancePtr>(&a)) return *x == std::get<InstancePtr>(b);
    if (auto x = std::get_if<ClassPtr>(&a)) return *x == std::get<ClassPtr>(b);
    if (auto x = std::get_if<FunctionPtr>(&a)) {
        const FunctionPtr& y = std::get<FunctionPtr>(b);
        if (*x == y) return true;
        // two reads of inst.m produce distinct handles for the same bound method
        return *x && y && (*x)->declaration == y->declaration && (*x)->receiver == y->receiver;
    }
    return false;
}

bool is_container(const Value& v) {
    return std::holds_alternative<ListPtr>(v) ||
        std::holds_alternative<DictPtr>(v) ||
        std::holds_alternative<InstancePtr>(v);
}

// ----------------- Printing -----------------

// doubles print with the fewest significant digits that read back to the same value
static std::string format_number(const Value& v) {
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    double d = std::get<double>(v);
    std::string text;
    for (int precision = 1; precision <= 17; ++precision) {
        std::ostringstream ss;
        ss << std::setprecision(precision) << d;
        text = ss.str();
        if (std::strtod(text.c_str(), nullptr) == d) break;
    }
    return text;
}

static std::string quote(const std::string& s) {
    std::ostringstream ss;
    ss << '"';
    for (char c : s) {
        if (c == '\\')
            ss << "\\\\";
        else if (c == '"')
            ss << "\\\"";
        else if (c == '\n')
            ss << "\\n";
        else
            ss << c;
    }
    ss << '"';
    return ss.str();
}

std::string Evaluator::print_value(const Value& v) {
    std::unordered_set<const void*> visited;
    return print_value(v, visited);
}

std::string Evaluator::value_to_string(const Value& v) {
    if (auto s = std::get_if<std::string>(&v)) return *s;
    return print_value(v);
}

std::string Evaluator::print_value(const Value& v, std::unordered_set<const void*>& visited) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (auto b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (is_number(v)) return format_number(v);
    if (auto s = std::get_if<std::string>(&v)) return quote(*s);

    if (auto lp = std::get_if<ListPtr>(&v)) {
        const ListValue* p = lp->get();
        if (visited.count(p)) return "<cycle>";
        visited.insert(p);
        std::ostringstream ss;
        ss << "[";
        for (size_t i = 0; i < p->elements.size(); ++i) {
            if (i) ss << ", ";
            ss << print_value(p->elements[i], visited);
        }
        ss << "]";
        visited.erase(p);
        return ss.str();
    }

    if (auto dp = std::get_if<DictPtr>(&v)) {
        const DictValue* p = dp->get();
        if (visited.count(p)) return "<cycle>";
        visited.insert(p);
        std::ostringstream ss;
        ss << "{";
        bool first = true;
        for (const auto& key : p->keys) {
            if (!first) ss << ", ";
            first = false;
            ss << quote(key) << ": " << print_value(*p->find(key), visited);
        }
        ss << "}";
        visited.erase(p);
        return ss.str();
    }

    if (auto ip = std::get_if<InstancePtr>(&v)) {
        return "<" + (*ip)->klass->name + " instance>";
    }

    if (auto fp = std::get_if<FunctionPtr>(&v)) {
        return "<function " + (*fp)->qualified_name() + ">";
    }

    if (auto cp = std::get_if<ClassPtr>(&v)) {
        return "<class " + (*cp)->name + ">";
    }

    return "<unknown>";
}

// ----------------- Operators -----------------

static ScriptError overflow_error(const std::string& op, int64_t a, int64_t b, const Token& token) {
    return ScriptError(ErrorKind::ArithmeticError,
        "Integer overflow in " + std::to_string(a) + " " + op + " " + std::to_string(b) + ".",
        token.loc);
}

// exponentiation by squaring; false on overflow
static bool checked_ipow(int64_t base, int64_t exp, int64_t* out) {
    int64_t result = 1;
    while (exp > 0) {
        if ((exp & 1) && __builtin_mul_overflow(result, base, &result)) return false;
        exp >>= 1;
        if (exp > 0 && __builtin_mul_overflow(base, base, &base)) return false;
    }
    *out = result;
    return true;
}

static Value integer_arith(const std::string& op, int64_t a, int64_t b, const Token& token) {
    int64_t r = 0;
    if (op == "+") {
        if (__builtin_add_overflow(a, b, &r)) throw overflow_error(op, a, b, token);
        return r;
    }
    if (op == "-") {
        if (__builtin_sub_overflow(a, b, &r)) throw overflow_error(op, a, b, token);
        return r;
    }
    if (op == "*") {
        if (__builtin_mul_overflow(a, b, &r)) throw overflow_error(op, a, b, token);
        return r;
    }
    if (op == "/") {
        if (b == 0) throw ScriptError(ErrorKind::ArithmeticError, "Division by zero.", token.loc);
        if (a == INT64_MIN && b == -1) throw overflow_error(op, a, b, token);
        // stays integral only when exact
        if (a % b == 0) return a / b;
        return static_cast<double>(a) / static_cast<double>(b);
    }
    if (op == "^") {
        if (b < 0) return std::pow(static_cast<double>(a), static_cast<double>(b));
        if (!checked_ipow(a, b, &r)) throw overflow_error(op, a, b, token);
        return r;
    }
    throw ScriptError(ErrorKind::TypeError, "Unknown arithmetic operator '" + op + "'.", token.loc);
}

static Value float_arith(const std::string& op, double a, double b, const Token& token) {
    if (op == "+") return a + b;
    if (op == "-") return a - b;
    if (op == "*") return a * b;
    if (op == "/") {
        if (b == 0.0) throw ScriptError(ErrorKind::ArithmeticError, "Division by zero.", token.loc);
        return a / b;
    }
    if (op == "^") return std::pow(a, b);
    throw ScriptError(ErrorKind::TypeError, "Unknown arithmetic operator '" + op + "'.", token.loc);
}

int Evaluator::compare_values(const Value& left, const Value& right, const std::string& op, const Token& token) {
    if (is_number(left) && is_number(right)) {
        auto il = std::get_if<int64_t>(&left);
        auto ir = std::get_if<int64_t>(&right);
        if (il && ir) return (*il < *ir) ? -1 : (*il > *ir ? 1 : 0);
        double a = as_double(left);
        double b = as_double(right);
        return (a < b) ? -1 : (a > b ? 1 : 0);
    }
    auto sl = std::get_if<std::string>(&left);
    auto sr = std::get_if<std::string>(&right);
    if (sl && sr) {
        int c = sl->compare(*sr);
        return (c < 0) ? -1 : (c > 0 ? 1 : 0);
    }
    throw ScriptError(ErrorKind::TypeError,
        "Cannot compare " + type_name(left) + " with " + type_name(right) + " using '" + op + "'.",
        token.loc);
}

Value Evaluator::binary_op(const std::string& op, const Value& left, const Value& right, const Token& token) {
    if (op == "==") return values_equal(left, right);
    if (op == "!=") return !values_equal(left, right);

    if (op == "<" || op == "<=" || op == ">" || op == ">=") {
        int c = compare_values(left, right, op, token);
        if (op == "<") return c < 0;
        if (op == "<=") return c <= 0;
        if (op == ">") return c > 0;
        return c >= 0;
    }

    if (op == "+") {
        bool ls = std::holds_alternative<std::string>(left);
        bool rs = std::holds_alternative<std::string>(right);
        if (ls || rs) {
            const Value& other = ls ? right : left;
            if (!std::holds_alternative<std::string>(other) && !is_number(other) && !std::holds_alternative<bool>(other)) {
                throw ScriptError(ErrorKind::TypeError,
                    "Cannot concatenate string with a value of type `" + type_name(other) + "`.",
                    token.loc);
            }
            return value_to_string(left) + value_to_string(right);
        }

        auto bl = std::get_if<bool>(&left);
        auto br = std::get_if<bool>(&right);
        if (bl && br) return *bl && *br;

        auto ll = std::get_if<ListPtr>(&left);
        auto lr = std::get_if<ListPtr>(&right);
        if (ll && lr) {
            std::vector<Value> joined((*ll)->elements);
            joined.insert(joined.end(), (*lr)->elements.begin(), (*lr)->elements.end());
            return make_list(std::move(joined));
        }
    }

    if (op == "+" || op == "-" || op == "*" || op == "/" || op == "^") {
        if (!is_number(left) || !is_number(right)) {
            throw ScriptError(ErrorKind::TypeError,
                "Operator '" + op + "' cannot be applied to " + type_name(left) + " and " + type_name(right) + ".",
                token.loc);
        }
        auto il = std::get_if<int64_t>(&left);
        auto ir = std::get_if<int64_t>(&right);
        if (il && ir) return integer_arith(op, *il, *ir, token);
        return float_arith(op, as_double(left), as_double(right), token);
    }

    throw ScriptError(ErrorKind::TypeError, "Unknown binary operator '" + op + "'.", token.loc);
}

Value Evaluator::unary_op(const std::string& op, const Value& operand, const Token& token) {
    if (op == "!") return !is_truthy(operand);

    if (op == "-") {
        if (auto i = std::get_if<int64_t>(&operand)) {
            if (*i == INT64_MIN) {
                throw ScriptError(ErrorKind::ArithmeticError, "Integer overflow in -" + std::to_string(*i) + ".", token.loc);
            }
            return -*i;
        }
        if (auto d = std::get_if<double>(&operand)) return -*d;
        throw ScriptError(ErrorKind::TypeError,
            "Unary '-' cannot be applied to a value of type `" + type_name(operand) + "`.",
            token.loc);
    }

    throw ScriptError(ErrorKind::TypeError, "Unknown unary operator '" + op + "'.", token.loc);
}
