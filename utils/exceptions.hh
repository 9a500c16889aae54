/*
 * Copyright 2016 ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

#include <string_view>

namespace seastar { class logger; }

namespace keyrange {

// Controls whether on_internal_error() aborts or throws.
void set_abort_on_internal_error(bool do_abort) noexcept;

// Handles reporting of violation of internal invariants.
// Callers can assume that it does not return. May throw.
[[noreturn]] void on_internal_error(seastar::logger&, std::string_view reason);

}
