/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

#include <cmath>
#include <compare>
#include <concepts>
#include <cstddef>
#include <string_view>

namespace keyrange {

// A key domain: anything with a total order that can be copied into a
// boundary.
template <typename T>
concept Orderable = std::totally_ordered<T> && std::copyable<T>;

// A key domain that is also an ordered byte string, which is what the
// prefix and string-comparison idioms need.
template <typename T>
concept OrderableText = Orderable<T>
        && std::convertible_to<const T&, std::string_view>
        && std::constructible_from<T, const char*, size_t>;

/// Three-way comparison shared by the range algebra and by exact predicate
/// evaluation. Both must agree, otherwise a computed range could exclude a
/// record that the predicate accepts.
///
/// Floating point values are ordered totally: NaN sorts after +inf and
/// -0.0 sorts before 0.0.
template <Orderable T>
std::strong_ordering key_tri_compare(const T& a, const T& b) {
    if constexpr (std::floating_point<T>) {
        const bool a_nan = std::isnan(a);
        const bool b_nan = std::isnan(b);
        if (a_nan || b_nan) {
            return a_nan <=> b_nan;
        }
        if (a < b) {
            return std::strong_ordering::less;
        }
        if (b < a) {
            return std::strong_ordering::greater;
        }
        return std::signbit(b) <=> std::signbit(a);
    } else if constexpr (OrderableText<T>) {
        // Byte-wise, whatever the string class does for operator<.
        const std::string_view av(a);
        const std::string_view bv(b);
        const int r = av.compare(bv);
        return r < 0 ? std::strong_ordering::less : r > 0 ? std::strong_ordering::greater : std::strong_ordering::equal;
    } else {
        if (a < b) {
            return std::strong_ordering::less;
        }
        if (b < a) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }
}

}
