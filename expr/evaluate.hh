/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

#include <unordered_map>

#include <seastar/core/sstring.hh>

#include "expr/expression.hh"
#include "log.hh"
#include "seastarx.hh"
#include "types.hh"

namespace keyrange::expr {

extern logging::logger exprlog;

// A candidate record: field name to value. Absent fields read as null.
using record = std::unordered_map<sstring, data_value>;

/// Evaluates e against rec.
///
/// Throws evaluation_exception on type errors, bad function arity, integer
/// overflow, or member access on something that is not the record.
data_value evaluate(const expression& e, const record& rec);

/// Evaluates e against rec and requires a boolean result.
bool evaluate_predicate(const expression& e, const record& rec);

/// Evaluates a subtree that must not depend on the record. Throws
/// evaluation_exception if it reads the parameter.
data_value evaluate_constant(const expression& e);

}
