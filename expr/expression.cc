/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include <ostream>

#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include "expr/evaluate.hh"
#include "expr/expression.hh"
#include "utils/exceptions.hh"
#include "utils/overloaded_functor.hh"

namespace keyrange::expr {

expression::expression(const expression& o)
        : _v(std::make_unique<impl>(*o._v)) {
}

expression&
expression::operator=(const expression& o) {
    *this = expression(o);
    return *this;
}

bool operator==(const expression& e1, const expression& e2) {
    return e1._v->v == e2._v->v;
}

bool operator==(const captured_value& a, const captured_value& b) {
    if (a.name != b.name) {
        return false;
    }
    if (!a.value || !b.value) {
        return a.value == b.value;
    }
    return *a.value == *b.value;
}

binary_operator::binary_operator(expression lhs, oper_t op, expression rhs)
        : lhs(std::move(lhs))
        , op(op)
        , rhs(std::move(rhs)) {
}

oper_t reverse(oper_t op) {
    switch (op) {
    case oper_t::EQ:
    case oper_t::NEQ:
        return op;
    case oper_t::LT:
        return oper_t::GT;
    case oper_t::LTE:
        return oper_t::GTE;
    case oper_t::GT:
        return oper_t::LT;
    case oper_t::GTE:
        return oper_t::LTE;
    }
    on_internal_error(exprlog, fmt::format("reverse(): unknown operator {}", static_cast<int>(op)));
}

oper_t negated(oper_t op) {
    switch (op) {
    case oper_t::EQ:
        return oper_t::NEQ;
    case oper_t::NEQ:
        return oper_t::EQ;
    case oper_t::LT:
        return oper_t::GTE;
    case oper_t::LTE:
        return oper_t::GT;
    case oper_t::GT:
        return oper_t::LTE;
    case oper_t::GTE:
        return oper_t::LT;
    }
    on_internal_error(exprlog, fmt::format("negated(): unknown operator {}", static_cast<int>(op)));
}

bool is_slice(oper_t op) {
    return op == oper_t::LT || op == oper_t::LTE || op == oper_t::GT || op == oper_t::GTE;
}

bool recurse_until(const expression& e, const noncopyable_function<bool (const expression&)>& predicate_fun) {
    if (predicate_fun(e)) {
        return true;
    }
    return expr::visit(overloaded_functor{
            [&] (const member_access& ma) {
                return recurse_until(ma.object, predicate_fun);
            },
            [&] (const binary_operator& op) {
                return recurse_until(op.lhs, predicate_fun) || recurse_until(op.rhs, predicate_fun);
            },
            [&] (const conjunction& c) {
                return recurse_until(c.lhs, predicate_fun) || recurse_until(c.rhs, predicate_fun);
            },
            [&] (const disjunction& d) {
                return recurse_until(d.lhs, predicate_fun) || recurse_until(d.rhs, predicate_fun);
            },
            [&] (const negation& n) {
                return recurse_until(n.operand, predicate_fun);
            },
            [&] (const arithmetic& a) {
                return recurse_until(a.lhs, predicate_fun) || recurse_until(a.rhs, predicate_fun);
            },
            [&] (const function_call& fc) {
                if (fc.target && recurse_until(*fc.target, predicate_fun)) {
                    return true;
                }
                for (auto& arg : fc.args) {
                    if (recurse_until(arg, predicate_fun)) {
                        return true;
                    }
                }
                return false;
            },
            [] (const constant&) { return false; },
            [] (const captured_value&) { return false; },
            [] (const parameter&) { return false; },
        }, e);
}

bool references_parameter(const expression& e) {
    return find_in_expression<parameter>(e, [] (const parameter&) { return true; }) != nullptr;
}

bool is_key_access(const expression& e, std::string_view key_field) {
    auto ma = as_if<member_access>(&e);
    return ma && is<parameter>(ma->object) && std::string_view(ma->member) == key_field;
}

std::ostream& operator<<(std::ostream& os, const expression& e) {
    return os << fmt::format("{}", e);
}

std::ostream& operator<<(std::ostream& os, oper_t op) {
    return os << fmt::format("{}", op);
}

std::ostream& operator<<(std::ostream& os, function_kind f) {
    return os << fmt::format("{}", f);
}

}

auto fmt::formatter<keyrange::expr::expression>::format(const keyrange::expr::expression& e, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using namespace keyrange::expr;
    auto out = ctx.out();
    keyrange::expr::visit(keyrange::overloaded_functor{
            [&] (const constant& c) {
                out = fmt::format_to(out, "{}", c.value);
            },
            [&] (const captured_value& cv) {
                out = fmt::format_to(out, "{}", std::string_view(cv.name));
            },
            [&] (const parameter& p) {
                out = fmt::format_to(out, "{}", std::string_view(p.name));
            },
            [&] (const member_access& ma) {
                out = fmt::format_to(out, "{}.{}", ma.object, std::string_view(ma.member));
            },
            [&] (const binary_operator& op) {
                out = fmt::format_to(out, "({} {} {})", op.lhs, op.op, op.rhs);
            },
            [&] (const conjunction& c) {
                out = fmt::format_to(out, "({} AND {})", c.lhs, c.rhs);
            },
            [&] (const disjunction& d) {
                out = fmt::format_to(out, "({} OR {})", d.lhs, d.rhs);
            },
            [&] (const negation& n) {
                out = fmt::format_to(out, "NOT {}", n.operand);
            },
            [&] (const arithmetic& a) {
                out = fmt::format_to(out, "({} {} {})", a.lhs, a.op, a.rhs);
            },
            [&] (const function_call& fc) {
                if (fc.target) {
                    out = fmt::format_to(out, "{}.", *fc.target);
                }
                out = fmt::format_to(out, "{}({})", fc.func, fmt::join(fc.args, ", "));
            },
        }, e);
    return out;
}

auto fmt::formatter<keyrange::expr::oper_t>::format(keyrange::expr::oper_t op, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using keyrange::expr::oper_t;
    std::string_view name;
    switch (op) {
    case oper_t::EQ: name = "="; break;
    case oper_t::NEQ: name = "!="; break;
    case oper_t::LT: name = "<"; break;
    case oper_t::LTE: name = "<="; break;
    case oper_t::GT: name = ">"; break;
    case oper_t::GTE: name = ">="; break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
}

auto fmt::formatter<keyrange::expr::arith_oper_t>::format(keyrange::expr::arith_oper_t op, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using keyrange::expr::arith_oper_t;
    std::string_view name;
    switch (op) {
    case arith_oper_t::ADD: name = "+"; break;
    case arith_oper_t::SUB: name = "-"; break;
    case arith_oper_t::MUL: name = "*"; break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
}

auto fmt::formatter<keyrange::expr::function_kind>::format(keyrange::expr::function_kind f, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using keyrange::expr::function_kind;
    std::string_view name;
    switch (f) {
    case function_kind::equals: name = "equals"; break;
    case function_kind::compare_to: name = "compare_to"; break;
    case function_kind::starts_with: name = "starts_with"; break;
    case function_kind::compare: name = "compare"; break;
    case function_kind::ends_with: name = "ends_with"; break;
    case function_kind::contains: name = "contains"; break;
    case function_kind::length: name = "length"; break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
}
