/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include "exceptions/exceptions.hh"
#include "expr/constant_extractor.hh"
#include "expr/evaluate.hh"

namespace keyrange::expr {

template <typename T>
std::optional<T> try_evaluate_constant(const expression& e) {
    if (references_parameter(e)) {
        return std::nullopt;
    }
    data_value v;
    try {
        v = evaluate_constant(e);
    } catch (const exceptions::evaluation_exception& ex) {
        exprlog.trace("{} is not a constant: {}", e, ex.what());
        return std::nullopt;
    }
    auto result = value_cast<T>(v);
    if (!result) {
        exprlog.trace("constant {} does not convert to the requested type", v);
    }
    return result;
}

template std::optional<int32_t> try_evaluate_constant<int32_t>(const expression&);
template std::optional<int64_t> try_evaluate_constant<int64_t>(const expression&);
template std::optional<double> try_evaluate_constant<double>(const expression&);
template std::optional<sstring> try_evaluate_constant<sstring>(const expression&);

}
