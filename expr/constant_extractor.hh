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

#include <seastar/core/sstring.hh>

#include "expr/expression.hh"
#include "seastarx.hh"

namespace keyrange::expr {

/// Evaluates e as a constant of type T, if possible.
///
/// Succeeds for literals, captured values, and any subtree that does not
/// reference the record parameter, as long as it evaluates without error and
/// its value converts to T without loss. Returns std::nullopt otherwise;
/// failing is not an error.
template <typename T>
std::optional<T> try_evaluate_constant(const expression& e);

extern template std::optional<int32_t> try_evaluate_constant<int32_t>(const expression&);
extern template std::optional<int64_t> try_evaluate_constant<int64_t>(const expression&);
extern template std::optional<double> try_evaluate_constant<double>(const expression&);
extern template std::optional<sstring> try_evaluate_constant<sstring>(const expression&);

}
