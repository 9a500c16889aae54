/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "exceptions/exceptions.hh"
#include "key_ordering.hh"

namespace keyrange {

template <Orderable T>
class key_boundary {
    T _value;
    bool _inclusive;
public:
    key_boundary(T value, bool inclusive = true)
        : _value(std::move(value))
        , _inclusive(inclusive)
    { }
    const T& value() const { return _value; }
    bool is_inclusive() const { return _inclusive; }
    bool operator==(const key_boundary& other) const {
        return _inclusive == other._inclusive && key_tri_compare(_value, other._value) == 0;
    }
};

/// The exclusive upper boundary that follows every string starting with
/// \p prefix: the prefix without its trailing 0xff bytes, with the last
/// remaining byte incremented. Returns std::nullopt (unbounded) when no such
/// string exists, i.e. for an empty prefix or one made only of 0xff bytes.
///
/// Throws unsupported_domain_exception for key domains that are not text.
template <Orderable T>
std::optional<key_boundary<T>> make_prefix_boundary(const T& prefix) {
    if constexpr (OrderableText<T>) {
        const std::string_view v(prefix);
        const auto last = v.find_last_not_of('\xff');
        if (last == std::string_view::npos) {
            return std::nullopt;
        }
        std::string next(v.substr(0, last + 1));
        next.back() = static_cast<char>(static_cast<unsigned char>(next.back()) + 1);
        return key_boundary<T>(T(next.data(), next.size()), false);
    } else {
        throw exceptions::unsupported_domain_exception("prefix boundaries are only defined for text keys");
    }
}

/// A single interval of keys, each edge either bounded (inclusive or
/// exclusive) or unbounded.
///
/// Unlike a general interval type, a key_range may be crossed (lower above
/// upper). A crossed range matches no keys; it is kept representable so that
/// intersection never has to special-case emptiness.
template <Orderable T>
class key_range {
public:
    using bound = key_boundary<T>;
    using optional_bound = std::optional<bound>;
private:
    optional_bound _lower;
    optional_bound _upper;

    // Unbounded is -inf here. At equal values an inclusive lower boundary
    // admits more keys, so it sorts first.
    static std::strong_ordering compare_lower(const optional_bound& a, const optional_bound& b) {
        if (!a || !b) {
            return bool(a) <=> bool(b);
        }
        auto r = key_tri_compare(a->value(), b->value());
        if (r != 0) {
            return r;
        }
        return b->is_inclusive() <=> a->is_inclusive();
    }
    // Unbounded is +inf here. At equal values an exclusive upper boundary
    // sorts first.
    static std::strong_ordering compare_upper(const optional_bound& a, const optional_bound& b) {
        if (!a || !b) {
            return bool(b) <=> bool(a);
        }
        auto r = key_tri_compare(a->value(), b->value());
        if (r != 0) {
            return r;
        }
        return a->is_inclusive() <=> b->is_inclusive();
    }
public:
    key_range(optional_bound lower, optional_bound upper)
        : _lower(std::move(lower))
        , _upper(std::move(upper))
    { }

    static key_range make_open() {
        return key_range(std::nullopt, std::nullopt);
    }
    static key_range make_singular(T value) {
        bound b(std::move(value), true);
        return key_range(b, b);
    }
    static key_range make_starting_with(bound b) {
        return key_range(std::move(b), std::nullopt);
    }
    static key_range make_ending_with(bound b) {
        return key_range(std::nullopt, std::move(b));
    }
    // Every key that starts with \p prefix.
    static key_range make_prefix(const T& prefix) {
        auto upper = make_prefix_boundary(prefix);
        return key_range(bound(prefix, true), std::move(upper));
    }

    const optional_bound& lower() const { return _lower; }
    const optional_bound& upper() const { return _upper; }

    bool is_open() const {
        return !_lower && !_upper;
    }
    bool is_singular() const {
        return _lower && _upper && _lower->is_inclusive() && _upper->is_inclusive()
                && key_tri_compare(_lower->value(), _upper->value()) == 0;
    }
    // True if no key can satisfy both edges.
    bool is_empty() const {
        if (!_lower || !_upper) {
            return false;
        }
        auto r = key_tri_compare(_lower->value(), _upper->value());
        return r > 0 || (r == 0 && !(_lower->is_inclusive() && _upper->is_inclusive()));
    }
    bool contains(const T& value) const {
        if (_lower) {
            auto r = key_tri_compare(_lower->value(), value);
            if (r > 0 || (r == 0 && !_lower->is_inclusive())) {
                return false;
            }
        }
        if (_upper) {
            auto r = key_tri_compare(value, _upper->value());
            if (r > 0 || (r == 0 && !_upper->is_inclusive())) {
                return false;
            }
        }
        return true;
    }

    // The greater of the lower edges and the lesser of the upper edges.
    // The result may be crossed.
    key_range intersection(const key_range& other) const {
        return key_range(
                compare_lower(_lower, other._lower) >= 0 ? _lower : other._lower,
                compare_upper(_upper, other._upper) <= 0 ? _upper : other._upper);
    }

    // Smallest single interval enclosing both operands. This is not a set
    // union: the gap between two disjoint ranges is included.
    key_range span(const key_range& other) const {
        if (is_empty()) {
            return other;
        }
        if (other.is_empty()) {
            return *this;
        }
        return key_range(
                compare_lower(_lower, other._lower) <= 0 ? _lower : other._lower,
                compare_upper(_upper, other._upper) >= 0 ? _upper : other._upper);
    }

    // Complement of a one-sided range. The complement of a two-sided range
    // is not a single interval, so it widens to the open range.
    key_range invert() const {
        if (_lower && !_upper) {
            return make_ending_with(bound(_lower->value(), !_lower->is_inclusive()));
        }
        if (_upper && !_lower) {
            return make_starting_with(bound(_upper->value(), !_upper->is_inclusive()));
        }
        return make_open();
    }

    bool operator==(const key_range& other) const = default;
};

template <Orderable T>
key_range<T> operator&(const key_range<T>& a, const key_range<T>& b) {
    return a.intersection(b);
}

template <Orderable T>
key_range<T> operator|(const key_range<T>& a, const key_range<T>& b) {
    return a.span(b);
}

template <typename Range>
auto intersect_all(const Range& ranges) -> typename Range::value_type {
    using range_type = typename Range::value_type;
    auto result = range_type::make_open();
    for (const auto& r : ranges) {
        result = result.intersection(r);
    }
    return result;
}

// Folds with span(); an empty sequence yields the open range.
template <typename Range>
auto span_all(const Range& ranges) -> typename Range::value_type {
    using range_type = typename Range::value_type;
    auto it = std::begin(ranges);
    if (it == std::end(ranges)) {
        return range_type::make_open();
    }
    auto result = *it;
    for (++it; it != std::end(ranges); ++it) {
        result = result.span(*it);
    }
    return result;
}

namespace internal {

template <Orderable T>
void format_key_value(fmt::memory_buffer& out, const T& v) {
    if constexpr (OrderableText<T>) {
        fmt::format_to(std::back_inserter(out), "\"{}\"", std::string_view(v));
    } else {
        fmt::format_to(std::back_inserter(out), "{}", v);
    }
}

}

}

template <keyrange::Orderable T>
struct fmt::formatter<keyrange::key_range<T>> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const keyrange::key_range<T>& r, FormatContext& ctx) const {
        fmt::memory_buffer out;
        if (r.lower()) {
            out.push_back(r.lower()->is_inclusive() ? '[' : '(');
            keyrange::internal::format_key_value(out, r.lower()->value());
        } else {
            fmt::format_to(std::back_inserter(out), "(-inf");
        }
        fmt::format_to(std::back_inserter(out), ", ");
        if (r.upper()) {
            keyrange::internal::format_key_value(out, r.upper()->value());
            out.push_back(r.upper()->is_inclusive() ? ']' : ')');
        } else {
            fmt::format_to(std::back_inserter(out), "+inf)");
        }
        return fmt::formatter<std::string_view>::format(std::string_view(out.data(), out.size()), ctx);
    }
};

namespace keyrange {

template <Orderable T>
std::ostream& operator<<(std::ostream& os, const key_range<T>& r) {
    return os << fmt::format("{}", r);
}

}
