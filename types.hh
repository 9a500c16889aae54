/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <seastar/core/sstring.hh>

#include "key_ordering.hh"
#include "seastarx.hh"

namespace keyrange {

// Order matches the alternatives of data_value::variant_type.
enum class value_kind {
    null,
    boolean,
    int32,
    int64,
    floating,
    text,
};

std::ostream& operator<<(std::ostream& os, value_kind k);

class data_value {
public:
    using variant_type = std::variant<std::monostate, bool, int32_t, int64_t, double, sstring>;
private:
    variant_type _value;
public:
    data_value() = default;
    data_value(bool v) : _value(v) { }
    data_value(int32_t v) : _value(v) { }
    data_value(int64_t v) : _value(v) { }
    data_value(double v) : _value(v) { }
    data_value(sstring v) : _value(std::move(v)) { }
    data_value(const char* v) : _value(sstring(v)) { }
    explicit data_value(std::string_view v) : _value(sstring(v.data(), v.size())) { }

    static data_value make_null() { return data_value(); }

    value_kind kind() const { return static_cast<value_kind>(_value.index()); }
    bool is_null() const { return std::holds_alternative<std::monostate>(_value); }
    bool is_integral() const { return kind() == value_kind::int32 || kind() == value_kind::int64; }
    bool is_numeric() const { return is_integral() || kind() == value_kind::floating; }

    template <typename T>
    const T* get_if() const { return std::get_if<T>(&_value); }
    const variant_type& raw() const { return _value; }

    bool operator==(const data_value&) const = default;
};

/// Extracts a value of type T without losing information. Integers convert
/// between widths when they fit, and to double when exactly representable;
/// text converts to any text key type. Everything else yields std::nullopt.
template <typename T>
std::optional<T> value_cast(const data_value& v) {
    if constexpr (std::same_as<T, bool>) {
        if (auto p = v.get_if<bool>()) {
            return *p;
        }
        return std::nullopt;
    } else if constexpr (std::integral<T>) {
        std::optional<int64_t> wide;
        if (auto p = v.get_if<int32_t>()) {
            wide = *p;
        } else if (auto p = v.get_if<int64_t>()) {
            wide = *p;
        }
        if (!wide || !std::in_range<T>(*wide)) {
            return std::nullopt;
        }
        return static_cast<T>(*wide);
    } else if constexpr (std::floating_point<T>) {
        constexpr int64_t max_exact = int64_t(1) << 53;
        if (auto p = v.get_if<double>()) {
            return static_cast<T>(*p);
        }
        std::optional<int64_t> wide;
        if (auto p = v.get_if<int32_t>()) {
            wide = *p;
        } else if (auto p = v.get_if<int64_t>()) {
            wide = *p;
        }
        if (!wide || *wide > max_exact || *wide < -max_exact) {
            return std::nullopt;
        }
        return static_cast<T>(*wide);
    } else if constexpr (OrderableText<T>) {
        if (auto p = v.get_if<sstring>()) {
            return T(p->data(), p->size());
        }
        return std::nullopt;
    } else {
        return std::nullopt;
    }
}

/// Three-way comparison used by predicate evaluation. Null sorts before
/// everything, integers compare across widths, integers and doubles compare
/// as doubles. Uses key_tri_compare() so that evaluation agrees with the
/// key range algebra.
///
/// Throws evaluation_exception when the kinds cannot be compared.
std::strong_ordering compare_values(const data_value& a, const data_value& b);

// Like compare_values() == 0, but values of unrelated kinds are simply
// not equal.
bool values_equal(const data_value& a, const data_value& b);

std::ostream& operator<<(std::ostream& os, const data_value& v);

}

template <>
struct fmt::formatter<keyrange::data_value> : fmt::formatter<std::string_view> {
    auto format(const keyrange::data_value& v, fmt::format_context& ctx) const -> decltype(ctx.out());
};

template <>
struct fmt::formatter<keyrange::value_kind> : fmt::formatter<std::string_view> {
    auto format(keyrange::value_kind k, fmt::format_context& ctx) const -> decltype(ctx.out());
};
