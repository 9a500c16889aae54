/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#pragma once

namespace keyrange {

// Combines several lambdas taking different node types into one visitor for
// expr::visit.
template <typename... Ts>
struct overloaded_functor : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded_functor(Ts...) -> overloaded_functor<Ts...>;

}
