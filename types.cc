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

#include "exceptions/exceptions.hh"
#include "types.hh"

namespace keyrange {

static std::string_view kind_name(value_kind k) {
    switch (k) {
    case value_kind::null: return "null";
    case value_kind::boolean: return "boolean";
    case value_kind::int32: return "int32";
    case value_kind::int64: return "int64";
    case value_kind::floating: return "double";
    case value_kind::text: return "text";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, value_kind k) {
    return os << kind_name(k);
}

static int64_t as_int64(const data_value& v) {
    if (auto p = v.get_if<int32_t>()) {
        return *p;
    }
    return *v.get_if<int64_t>();
}

static double as_double(const data_value& v) {
    if (auto p = v.get_if<double>()) {
        return *p;
    }
    return static_cast<double>(as_int64(v));
}

std::strong_ordering compare_values(const data_value& a, const data_value& b) {
    if (a.is_null() || b.is_null()) {
        return !a.is_null() <=> !b.is_null();
    }
    if (a.is_integral() && b.is_integral()) {
        return key_tri_compare(as_int64(a), as_int64(b));
    }
    if (a.is_numeric() && b.is_numeric()) {
        return key_tri_compare(as_double(a), as_double(b));
    }
    if (a.kind() == value_kind::text && b.kind() == value_kind::text) {
        return key_tri_compare(*a.get_if<sstring>(), *b.get_if<sstring>());
    }
    if (a.kind() == value_kind::boolean && b.kind() == value_kind::boolean) {
        return key_tri_compare(*a.get_if<bool>(), *b.get_if<bool>());
    }
    throw exceptions::evaluation_exception(
            fmt::format("cannot compare {} value {} with {} value {}", a.kind(), a, b.kind(), b));
}

bool values_equal(const data_value& a, const data_value& b) {
    const bool comparable = a.is_null() || b.is_null()
            || (a.is_numeric() && b.is_numeric())
            || a.kind() == b.kind();
    return comparable && compare_values(a, b) == 0;
}

std::ostream& operator<<(std::ostream& os, const data_value& v) {
    return os << fmt::format("{}", v);
}

}

auto fmt::formatter<keyrange::data_value>::format(const keyrange::data_value& v, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using namespace keyrange;
    switch (v.kind()) {
    case value_kind::null:
        return fmt::format_to(ctx.out(), "null");
    case value_kind::boolean:
        return fmt::format_to(ctx.out(), "{}", *v.get_if<bool>());
    case value_kind::int32:
        return fmt::format_to(ctx.out(), "{}", *v.get_if<int32_t>());
    case value_kind::int64:
        return fmt::format_to(ctx.out(), "{}L", *v.get_if<int64_t>());
    case value_kind::floating:
        return fmt::format_to(ctx.out(), "{}", *v.get_if<double>());
    case value_kind::text:
        return fmt::format_to(ctx.out(), "\"{}\"", std::string_view(*v.get_if<sstring>()));
    }
    return ctx.out();
}

auto fmt::formatter<keyrange::value_kind>::format(keyrange::value_kind k, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(keyrange::kind_name(k), ctx);
}
