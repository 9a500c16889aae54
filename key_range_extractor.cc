/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include "expr/constant_extractor.hh"
#include "key_range_extractor.hh"
#include "log.hh"

namespace keyrange {

using namespace expr;

static logging::logger krlogger("key_range_extractor");

// Matches a constant that evaluates to integer zero, the only value
// compare results are recognised against.
static bool is_zero(const expression& e) {
    return try_evaluate_constant<int64_t>(e) == 0;
}

template <Orderable T>
key_range_extractor<T>::key_range_extractor(sstring key_field, extractor_config cfg)
        : _key_field(std::move(key_field))
        , _cfg(cfg) {
}

template <Orderable T>
typename key_range_extractor<T>::range_type
key_range_extractor<T>::get_key_range(const expression& predicate) const {
    auto range = get_key_range(predicate, 0);
    krlogger.debug("{}: {} restricts {} to {}", predicate, std::string_view(_key_field), range);
    return range;
}

template <Orderable T>
typename key_range_extractor<T>::range_type
key_range_extractor<T>::negate(const expression& predicate) const {
    return negate(predicate, 0);
}

template <Orderable T>
typename key_range_extractor<T>::range_type
key_range_extractor<T>::get_key_range(const expression& predicate, uint32_t depth) const {
    if (depth >= _cfg.max_predicate_depth) {
        krlogger.trace("{}: nested deeper than {}, not restricting", predicate, _cfg.max_predicate_depth);
        return range_type::make_open();
    }
    struct range_visitor {
        const key_range_extractor& extractor;
        const expression& e;
        uint32_t depth;

        range_type operator()(const conjunction& c) const {
            return extractor.get_key_range(c.lhs, depth + 1) & extractor.get_key_range(c.rhs, depth + 1);
        }

        range_type operator()(const disjunction& d) const {
            return extractor.get_key_range(d.lhs, depth + 1) | extractor.get_key_range(d.rhs, depth + 1);
        }

        range_type operator()(const negation& n) const {
            return extractor.negate(n.operand, depth + 1);
        }

        range_type operator()(const binary_operator& op) const {
            if (auto cmp = extractor.match_comparison(op)) {
                return range_for(cmp->op, std::move(cmp->value));
            }
            return unrestricted();
        }

        range_type operator()(const function_call& fc) const {
            if (auto range = extractor.method_call_range(fc)) {
                return std::move(*range);
            }
            return unrestricted();
        }

        range_type operator()(const constant&) const { return unrestricted(); }
        range_type operator()(const captured_value&) const { return unrestricted(); }
        range_type operator()(const parameter&) const { return unrestricted(); }
        range_type operator()(const member_access&) const { return unrestricted(); }
        range_type operator()(const arithmetic&) const { return unrestricted(); }

        range_type unrestricted() const {
            krlogger.trace("{}: no restriction on {}", e, std::string_view(extractor._key_field));
            return range_type::make_open();
        }
    };
    return expr::visit(range_visitor{*this, predicate, depth}, predicate);
}

template <Orderable T>
typename key_range_extractor<T>::range_type
key_range_extractor<T>::negate(const expression& predicate, uint32_t depth) const {
    if (depth >= _cfg.max_predicate_depth) {
        krlogger.trace("NOT {}: nested deeper than {}, not restricting", predicate, _cfg.max_predicate_depth);
        return range_type::make_open();
    }
    struct negation_visitor {
        const key_range_extractor& extractor;
        const expression& e;
        uint32_t depth;

        range_type operator()(const negation& n) const {
            return extractor.get_key_range(n.operand, depth + 1);
        }

        // NOT (a AND b) == NOT a OR NOT b
        range_type operator()(const conjunction& c) const {
            return extractor.negate(c.lhs, depth + 1) | extractor.negate(c.rhs, depth + 1);
        }

        // NOT (a OR b) == NOT a AND NOT b
        range_type operator()(const disjunction& d) const {
            return extractor.negate(d.lhs, depth + 1) & extractor.negate(d.rhs, depth + 1);
        }

        // NOT (key = v) is not a single interval and yields the open range.
        range_type operator()(const binary_operator& op) const {
            if (auto cmp = extractor.match_comparison(op)) {
                return range_for(expr::negated(cmp->op), std::move(cmp->value));
            }
            return unrestricted();
        }

        range_type operator()(const function_call&) const { return unrestricted(); }
        range_type operator()(const constant&) const { return unrestricted(); }
        range_type operator()(const captured_value&) const { return unrestricted(); }
        range_type operator()(const parameter&) const { return unrestricted(); }
        range_type operator()(const member_access&) const { return unrestricted(); }
        range_type operator()(const arithmetic&) const { return unrestricted(); }

        range_type unrestricted() const {
            krlogger.trace("NOT {}: no restriction on {}", e, std::string_view(extractor._key_field));
            return range_type::make_open();
        }
    };
    return expr::visit(negation_visitor{*this, predicate, depth}, predicate);
}

template <Orderable T>
std::optional<typename key_range_extractor<T>::range_type>
key_range_extractor<T>::method_call_range(const function_call& fc) const {
    if constexpr (OrderableText<T>) {
        if (_cfg.recognize_method_idioms) {
            if (auto v = key_method_argument(fc, function_kind::equals)) {
                return range_type::make_singular(std::move(*v));
            }
            if (auto v = key_method_argument(fc, function_kind::starts_with)) {
                return range_type::make_prefix(*v);
            }
        }
    }
    return std::nullopt;
}

template <Orderable T>
std::optional<typename key_range_extractor<T>::key_comparison>
key_range_extractor<T>::match_comparison(const binary_operator& op) const {
    // key <op> v
    if (is_key_access(op.lhs, _key_field)) {
        if (auto v = try_evaluate_constant<T>(op.rhs)) {
            return key_comparison{op.op, std::move(*v)};
        }
    }
    // v <op> key
    if (is_key_access(op.rhs, _key_field)) {
        if (auto v = try_evaluate_constant<T>(op.lhs)) {
            return key_comparison{reverse(op.op), std::move(*v)};
        }
    }
    if (!_cfg.recognize_method_idioms) {
        return std::nullopt;
    }
    // key.compare_to(v) <op> 0 and 0 <op> key.compare_to(v)
    if (auto v = match_compare_to(op.lhs); v && is_zero(op.rhs)) {
        return key_comparison{op.op, std::move(*v)};
    }
    if (auto v = match_compare_to(op.rhs); v && is_zero(op.lhs)) {
        return key_comparison{reverse(op.op), std::move(*v)};
    }
    if constexpr (OrderableText<T>) {
        // compare(key, v) < 0 and 0 < compare(v, key) both mean key < v;
        // compare(v, key) > 0 and 0 > compare(key, v) mean the same after
        // reversing the operator.
        if (auto m = match_static_compare(op.lhs); m && is_zero(op.rhs)) {
            auto& [v, key_first] = *m;
            return key_comparison{key_first ? op.op : reverse(op.op), std::move(v)};
        }
        if (auto m = match_static_compare(op.rhs); m && is_zero(op.lhs)) {
            auto& [v, key_first] = *m;
            return key_comparison{key_first ? reverse(op.op) : op.op, std::move(v)};
        }
    }
    return std::nullopt;
}

// key.compare_to(v)
template <Orderable T>
std::optional<T> key_range_extractor<T>::match_compare_to(const expression& e) const {
    auto fc = as_if<function_call>(&e);
    if (!fc) {
        return std::nullopt;
    }
    return key_method_argument(*fc, function_kind::compare_to);
}

// compare(key, v) or compare(v, key). The flag tells whether the key is the
// first argument.
template <Orderable T>
std::optional<std::pair<T, bool>> key_range_extractor<T>::match_static_compare(const expression& e) const {
    auto fc = as_if<function_call>(&e);
    if (!fc || fc->func != function_kind::compare || fc->target || fc->args.size() != 2) {
        return std::nullopt;
    }
    if (is_key_access(fc->args[0], _key_field)) {
        if (auto v = try_evaluate_constant<T>(fc->args[1])) {
            return std::pair<T, bool>(std::move(*v), true);
        }
    }
    if (is_key_access(fc->args[1], _key_field)) {
        if (auto v = try_evaluate_constant<T>(fc->args[0])) {
            return std::pair<T, bool>(std::move(*v), false);
        }
    }
    return std::nullopt;
}

// The constant argument of key.func(v).
template <Orderable T>
std::optional<T> key_range_extractor<T>::key_method_argument(const function_call& fc, function_kind func) const {
    if (fc.func != func || !fc.target || fc.args.size() != 1 || !is_key_access(*fc.target, _key_field)) {
        return std::nullopt;
    }
    return try_evaluate_constant<T>(fc.args[0]);
}

template <Orderable T>
typename key_range_extractor<T>::range_type
key_range_extractor<T>::range_for(oper_t op, T value) {
    using bound = typename range_type::bound;
    switch (op) {
    case oper_t::EQ:
        return range_type::make_singular(std::move(value));
    case oper_t::LT:
        return range_type::make_ending_with(bound(std::move(value), false));
    case oper_t::LTE:
        return range_type::make_ending_with(bound(std::move(value), true));
    case oper_t::GT:
        return range_type::make_starting_with(bound(std::move(value), false));
    case oper_t::GTE:
        return range_type::make_starting_with(bound(std::move(value), true));
    case oper_t::NEQ:
        break;
    }
    return range_type::make_open();
}

template class key_range_extractor<int32_t>;
template class key_range_extractor<int64_t>;
template class key_range_extractor<double>;
template class key_range_extractor<sstring>;

}
