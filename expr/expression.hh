/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

#include <concepts>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <seastar/core/sstring.hh>
#include <seastar/util/noncopyable_function.hh>

#include "seastarx.hh"
#include "types.hh"

namespace keyrange::expr {

struct constant;
struct captured_value;
struct parameter;
struct member_access;
struct binary_operator;
struct conjunction;
struct disjunction;
struct negation;
struct arithmetic;
struct function_call;

template <typename T>
concept ExpressionElement
        = std::same_as<T, constant>
        || std::same_as<T, captured_value>
        || std::same_as<T, parameter>
        || std::same_as<T, member_access>
        || std::same_as<T, binary_operator>
        || std::same_as<T, conjunction>
        || std::same_as<T, disjunction>
        || std::same_as<T, negation>
        || std::same_as<T, arithmetic>
        || std::same_as<T, function_call>
        ;

template <typename Func>
concept invocable_on_expression
        = std::invocable<Func, constant>
        && std::invocable<Func, captured_value>
        && std::invocable<Func, parameter>
        && std::invocable<Func, member_access>
        && std::invocable<Func, binary_operator>
        && std::invocable<Func, conjunction>
        && std::invocable<Func, disjunction>
        && std::invocable<Func, negation>
        && std::invocable<Func, arithmetic>
        && std::invocable<Func, function_call>
        ;

/// A predicate (or value) tree over a single record parameter.
///
/// expression is a value type: copying it deep-copies the tree. The
/// alternatives are a closed set; use expr::visit() to dispatch on them,
/// and is<>, as<> or as_if<> to query a single alternative.
class expression final {
    // 'impl' holds the variant of all expression types, but since
    // variants of incomplete types are not allowed, we forward declare it
    // here and fully define it later.
    struct impl;
    std::unique_ptr<impl> _v;
public:
    expression(ExpressionElement auto e);

    expression(const expression&);
    expression(expression&&) noexcept = default;
    expression& operator=(const expression&);
    expression& operator=(expression&&) noexcept = default;

    template <invocable_on_expression Visitor>
    friend decltype(auto) visit(Visitor&& visitor, const expression& e);

    template <ExpressionElement E>
    friend bool is(const expression& e);

    template <ExpressionElement E>
    friend const E& as(const expression& e);

    template <ExpressionElement E>
    friend const E* as_if(const expression* e);

    friend bool operator==(const expression& e1, const expression& e2);
};

enum class oper_t { EQ, NEQ, LT, LTE, GT, GTE };

enum class arith_oper_t { ADD, SUB, MUL };

// The operations a function_call may name. Instance functions take a
// target; compare is static and takes two arguments.
enum class function_kind {
    equals,         // target.equals(x)
    compare_to,     // target.compare_to(x) -> -1, 0 or 1
    starts_with,    // target.starts_with(prefix)
    compare,        // compare(a, b) -> -1, 0 or 1
    ends_with,      // target.ends_with(suffix)
    contains,       // target.contains(infix)
    length,         // target.length()
};

// A literal value.
struct constant {
    data_value value;

    friend bool operator==(const constant&, const constant&) = default;
};

// A value captured from the enclosing scope when the predicate was built.
// It is read-only and never depends on the record.
struct captured_value {
    sstring name;
    std::shared_ptr<const data_value> value;

    friend bool operator==(const captured_value& a, const captured_value& b);
};

// The record the predicate is applied to.
struct parameter {
    sstring name;

    friend bool operator==(const parameter&, const parameter&) = default;
};

// object.member; when object is the parameter this reads a record field.
struct member_access {
    expression object;
    sstring member;

    friend bool operator==(const member_access&, const member_access&) = default;
};

struct binary_operator {
    expression lhs;
    oper_t op;
    expression rhs;

    binary_operator(expression lhs, oper_t op, expression rhs);

    friend bool operator==(const binary_operator&, const binary_operator&) = default;
};

struct conjunction {
    expression lhs;
    expression rhs;

    friend bool operator==(const conjunction&, const conjunction&) = default;
};

struct disjunction {
    expression lhs;
    expression rhs;

    friend bool operator==(const disjunction&, const disjunction&) = default;
};

struct negation {
    expression operand;

    friend bool operator==(const negation&, const negation&) = default;
};

struct arithmetic {
    expression lhs;
    arith_oper_t op;
    expression rhs;

    friend bool operator==(const arithmetic&, const arithmetic&) = default;
};

struct function_call {
    function_kind func;
    std::optional<expression> target;
    std::vector<expression> args;

    friend bool operator==(const function_call&, const function_call&) = default;
};

struct expression::impl final {
    using variant_type = std::variant<
            constant, captured_value, parameter, member_access, binary_operator,
            conjunction, disjunction, negation, arithmetic, function_call>;
    variant_type v;
};

expression::expression(ExpressionElement auto e)
        : _v(std::make_unique<impl>(std::move(e))) {
}

template <invocable_on_expression Visitor>
decltype(auto) visit(Visitor&& visitor, const expression& e) {
    return std::visit(std::forward<Visitor>(visitor), e._v->v);
}

template <ExpressionElement E>
bool is(const expression& e) {
    return std::holds_alternative<E>(e._v->v);
}

template <ExpressionElement E>
const E& as(const expression& e) {
    return std::get<E>(e._v->v);
}

template <ExpressionElement E>
const E* as_if(const expression* e) {
    return std::get_if<E>(&e->_v->v);
}

// Returns the operator that gives the same result when lhs and rhs swap
// places, e.g. LT for GT.
oper_t reverse(oper_t op);

// Returns the operator whose result is the logical negation of op's.
oper_t negated(oper_t op);

// True for LT, LTE, GT and GTE.
bool is_slice(oper_t op);

/// Walks the tree in pre-order, calling predicate_fun on each node, and
/// stops as soon as it returns true. Returns whether it did.
bool recurse_until(const expression& e, const noncopyable_function<bool (const expression&)>& predicate_fun);

/// Returns a pointer to the first node of type E in pre-order for which
/// predicate_fun returns true, or nullptr.
template <ExpressionElement E, std::invocable<const E&> Fn>
const E* find_in_expression(const expression& e, Fn predicate_fun) {
    const E* ret = nullptr;
    recurse_until(e, [&] (const expression& child) {
        if (auto elem = as_if<E>(&child)) {
            if (predicate_fun(*elem)) {
                ret = elem;
                return true;
            }
        }
        return false;
    });
    return ret;
}

// True if evaluating e needs a record.
bool references_parameter(const expression& e);

// True if e reads the field named key_field of the parameter.
bool is_key_access(const expression& e, std::string_view key_field);

std::ostream& operator<<(std::ostream& os, const expression& e);
std::ostream& operator<<(std::ostream& os, oper_t op);
std::ostream& operator<<(std::ostream& os, function_kind f);

}

template <>
struct fmt::formatter<keyrange::expr::expression> : fmt::formatter<std::string_view> {
    auto format(const keyrange::expr::expression& e, fmt::format_context& ctx) const -> decltype(ctx.out());
};

template <>
struct fmt::formatter<keyrange::expr::oper_t> : fmt::formatter<std::string_view> {
    auto format(keyrange::expr::oper_t op, fmt::format_context& ctx) const -> decltype(ctx.out());
};

template <>
struct fmt::formatter<keyrange::expr::arith_oper_t> : fmt::formatter<std::string_view> {
    auto format(keyrange::expr::arith_oper_t op, fmt::format_context& ctx) const -> decltype(ctx.out());
};

template <>
struct fmt::formatter<keyrange::expr::function_kind> : fmt::formatter<std::string_view> {
    auto format(keyrange::expr::function_kind f, fmt::format_context& ctx) const -> decltype(ctx.out());
};
