/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include <string_view>

#include "exceptions/exceptions.hh"
#include "expr/evaluate.hh"
#include "utils/exceptions.hh"

namespace keyrange::expr {

logging::logger exprlog("expression");

namespace {

int32_t to_int32(std::strong_ordering o) {
    return o < 0 ? -1 : o > 0 ? 1 : 0;
}

template <typename Int>
Int checked_arithmetic(arith_oper_t op, Int a, Int b) {
    Int result;
    bool overflow = false;
    switch (op) {
    case arith_oper_t::ADD:
        overflow = __builtin_add_overflow(a, b, &result);
        break;
    case arith_oper_t::SUB:
        overflow = __builtin_sub_overflow(a, b, &result);
        break;
    case arith_oper_t::MUL:
        overflow = __builtin_mul_overflow(a, b, &result);
        break;
    default:
        on_internal_error(exprlog, fmt::format("unknown arithmetic operator {}", static_cast<int>(op)));
    }
    if (overflow) {
        throw exceptions::evaluation_exception(fmt::format("integer overflow in {} {} {}", a, op, b));
    }
    return result;
}

double double_arithmetic(arith_oper_t op, double a, double b) {
    switch (op) {
    case arith_oper_t::ADD: return a + b;
    case arith_oper_t::SUB: return a - b;
    case arith_oper_t::MUL: return a * b;
    }
    on_internal_error(exprlog, fmt::format("unknown arithmetic operator {}", static_cast<int>(op)));
}

int64_t widen(const data_value& v) {
    if (auto p = v.get_if<int32_t>()) {
        return *p;
    }
    return *v.get_if<int64_t>();
}

double to_double(const data_value& v) {
    if (auto p = v.get_if<double>()) {
        return *p;
    }
    return static_cast<double>(widen(v));
}

// Visits an expression and computes its value. When rec is null, the
// expression is evaluated as a constant and reading the record fails.
struct evaluator {
    const record* rec;

    data_value operator()(const constant& c) const {
        return c.value;
    }

    data_value operator()(const captured_value& cv) const {
        if (!cv.value) {
            return data_value::make_null();
        }
        return *cv.value;
    }

    data_value operator()(const parameter& p) const {
        throw exceptions::evaluation_exception(
                fmt::format("parameter {} cannot be used as a value", std::string_view(p.name)));
    }

    data_value operator()(const member_access& ma) const {
        if (!is<parameter>(ma.object)) {
            throw exceptions::evaluation_exception(
                    fmt::format("cannot read member {} of {}", std::string_view(ma.member), ma.object));
        }
        if (!rec) {
            throw exceptions::evaluation_exception(
                    fmt::format("{} reads the record and is not a constant", expression(ma)));
        }
        auto it = rec->find(ma.member);
        if (it == rec->end()) {
            return data_value::make_null();
        }
        return it->second;
    }

    data_value operator()(const binary_operator& op) const {
        auto lhs = expr::visit(*this, op.lhs);
        auto rhs = expr::visit(*this, op.rhs);
        switch (op.op) {
        case oper_t::EQ: return values_equal(lhs, rhs);
        case oper_t::NEQ: return !values_equal(lhs, rhs);
        case oper_t::LT: return compare_values(lhs, rhs) < 0;
        case oper_t::LTE: return compare_values(lhs, rhs) <= 0;
        case oper_t::GT: return compare_values(lhs, rhs) > 0;
        case oper_t::GTE: return compare_values(lhs, rhs) >= 0;
        }
        on_internal_error(exprlog, fmt::format("unknown operator in {}", expression(op)));
    }

    data_value operator()(const conjunction& c) const {
        return get_bool(c.lhs) && get_bool(c.rhs);
    }

    data_value operator()(const disjunction& d) const {
        return get_bool(d.lhs) || get_bool(d.rhs);
    }

    data_value operator()(const negation& n) const {
        return !get_bool(n.operand);
    }

    data_value operator()(const arithmetic& a) const {
        auto lhs = expr::visit(*this, a.lhs);
        auto rhs = expr::visit(*this, a.rhs);
        if (lhs.is_null() || rhs.is_null()) {
            return data_value::make_null();
        }
        if (lhs.kind() == value_kind::int32 && rhs.kind() == value_kind::int32) {
            return checked_arithmetic(a.op, *lhs.get_if<int32_t>(), *rhs.get_if<int32_t>());
        }
        if (lhs.is_integral() && rhs.is_integral()) {
            return checked_arithmetic(a.op, widen(lhs), widen(rhs));
        }
        if (lhs.is_numeric() && rhs.is_numeric()) {
            return double_arithmetic(a.op, to_double(lhs), to_double(rhs));
        }
        if (a.op == arith_oper_t::ADD && lhs.kind() == value_kind::text && rhs.kind() == value_kind::text) {
            return *lhs.get_if<sstring>() + *rhs.get_if<sstring>();
        }
        throw exceptions::evaluation_exception(
                fmt::format("cannot apply {} to {} and {} in {}", a.op, lhs.kind(), rhs.kind(), expression(a)));
    }

    data_value operator()(const function_call& fc) const {
        switch (fc.func) {
        case function_kind::equals:
            check_arity(fc, true, 1);
            return values_equal(get_target(fc), expr::visit(*this, fc.args[0]));
        case function_kind::compare_to:
            check_arity(fc, true, 1);
            return to_int32(compare_values(get_target(fc), expr::visit(*this, fc.args[0])));
        case function_kind::starts_with:
            check_arity(fc, true, 1);
            return get_text(fc, get_target(fc)).starts_with(get_text(fc, expr::visit(*this, fc.args[0])));
        case function_kind::ends_with:
            check_arity(fc, true, 1);
            return get_text(fc, get_target(fc)).ends_with(get_text(fc, expr::visit(*this, fc.args[0])));
        case function_kind::contains:
            check_arity(fc, true, 1);
            return get_text(fc, get_target(fc)).find(get_text(fc, expr::visit(*this, fc.args[0]))) != std::string_view::npos;
        case function_kind::length:
            check_arity(fc, true, 0);
            return static_cast<int32_t>(get_text(fc, get_target(fc)).size());
        case function_kind::compare: {
            check_arity(fc, false, 2);
            auto a = expr::visit(*this, fc.args[0]);
            auto b = expr::visit(*this, fc.args[1]);
            auto check_text = [&] (const data_value& v) {
                if (!v.is_null() && v.kind() != value_kind::text) {
                    throw exceptions::evaluation_exception(
                            fmt::format("{} expects text arguments, got {}", expression(fc), v.kind()));
                }
            };
            check_text(a);
            check_text(b);
            return to_int32(compare_values(a, b));
        }
        }
        on_internal_error(exprlog, fmt::format("unknown function in {}", expression(fc)));
    }

    bool get_bool(const expression& e) const {
        auto v = expr::visit(*this, e);
        if (auto b = v.get_if<bool>()) {
            return *b;
        }
        throw exceptions::evaluation_exception(fmt::format("{} is not a boolean, got {}", e, v));
    }

    // Instance functions require a non-null target.
    data_value get_target(const function_call& fc) const {
        auto v = expr::visit(*this, *fc.target);
        if (v.is_null()) {
            throw exceptions::evaluation_exception(fmt::format("{} called on null", fc.func));
        }
        return v;
    }

    static std::string_view get_text(const function_call& fc, const data_value& v) {
        if (auto s = v.get_if<sstring>()) {
            return std::string_view(*s);
        }
        throw exceptions::evaluation_exception(fmt::format("{} expects text, got {}", fc.func, v.kind()));
    }

    static void check_arity(const function_call& fc, bool needs_target, size_t arg_count) {
        if (fc.target.has_value() != needs_target || fc.args.size() != arg_count) {
            throw exceptions::evaluation_exception(
                    fmt::format("{} expects {}{} argument(s), got {}", fc.func,
                            needs_target ? "a target and " : "", arg_count, expression(fc)));
        }
    }
};

}

data_value evaluate(const expression& e, const record& rec) {
    return expr::visit(evaluator{&rec}, e);
}

bool evaluate_predicate(const expression& e, const record& rec) {
    return evaluator{&rec}.get_bool(e);
}

data_value evaluate_constant(const expression& e) {
    return expr::visit(evaluator{nullptr}, e);
}

}
