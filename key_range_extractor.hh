/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

#include <seastar/core/sstring.hh>

#include "exceptions/exceptions.hh"
#include "expr/expression.hh"
#include "extractor_config.hh"
#include "key_range.hh"
#include "seastarx.hh"

namespace keyrange {

/// Computes the range of key values a predicate can possibly accept.
///
/// The key is the field named key_field of the predicate's record
/// parameter. The computed range is sound but not exact: every record the
/// predicate accepts has its key inside the range, but the range may hold
/// keys of records the predicate rejects. Callers must still apply the
/// predicate to every record they scan.
///
/// Recognised shapes:
///  - a AND b, a OR b (OR widens to the enclosing interval), NOT a
///  - key <op> constant and constant <op> key, with <op> one of
///    =, <, <=, >, >=
///  - key.compare_to(constant) <op> 0, in either operand order
///  - for text keys: compare(key, constant) <op> 0 and
///    compare(constant, key) <op> 0, in either operand order,
///    key.equals(constant) and key.starts_with(constant)
///
/// Anything else restricts nothing and yields the open range.
template <Orderable T>
class key_range_extractor {
public:
    using range_type = key_range<T>;
private:
    sstring _key_field;
    extractor_config _cfg;

    // A comparison of the key against a constant, normalised so that the
    // key is on the left.
    struct key_comparison {
        expr::oper_t op;
        T value;
    };
public:
    explicit key_range_extractor(sstring key_field, extractor_config cfg = {});

    const sstring& key_field() const { return _key_field; }
    const extractor_config& config() const { return _cfg; }

    range_type get_key_range(const expr::expression& predicate) const;

    // The range of keys for which NOT predicate may hold. Negation is pushed
    // through AND and OR before any range is built.
    range_type negate(const expr::expression& predicate) const;
private:
    range_type get_key_range(const expr::expression& predicate, uint32_t depth) const;
    range_type negate(const expr::expression& predicate, uint32_t depth) const;
    std::optional<range_type> method_call_range(const expr::function_call& fc) const;

    std::optional<key_comparison> match_comparison(const expr::binary_operator& op) const;
    std::optional<T> match_compare_to(const expr::expression& e) const;
    std::optional<std::pair<T, bool>> match_static_compare(const expr::expression& e) const;
    std::optional<T> key_method_argument(const expr::function_call& fc, expr::function_kind func) const;

    static range_type range_for(expr::oper_t op, T value);
};

/// Throws invalid_argument_exception if predicate or key_field is absent.
template <Orderable T>
key_range<T> get_key_range(const std::optional<expr::expression>& predicate,
        const std::optional<sstring>& key_field, const extractor_config& cfg = {}) {
    if (!predicate) {
        throw exceptions::invalid_argument_exception("predicate must not be null");
    }
    if (!key_field) {
        throw exceptions::invalid_argument_exception("key field name must not be null");
    }
    return key_range_extractor<T>(*key_field, cfg).get_key_range(*predicate);
}

template <Orderable T>
key_range<T> get_key_range(const expr::expression& predicate, std::string_view key_field,
        const extractor_config& cfg = {}) {
    return key_range_extractor<T>(sstring(key_field.data(), key_field.size()), cfg).get_key_range(predicate);
}

template <Orderable T>
key_range<T> negate(const expr::expression& predicate, std::string_view key_field,
        const extractor_config& cfg = {}) {
    return key_range_extractor<T>(sstring(key_field.data(), key_field.size()), cfg).negate(predicate);
}

extern template class key_range_extractor<int32_t>;
extern template class key_range_extractor<int64_t>;
extern template class key_range_extractor<double>;
extern template class key_range_extractor<sstring>;

}
