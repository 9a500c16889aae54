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
#include <string_view>

namespace YAML { class Node; }

namespace keyrange {

struct extractor_config {
    // Boolean combinators (AND, OR, NOT) nested deeper than this are not
    // analysed and yield the open range. Operands of a comparison are not
    // counted.
    uint32_t max_predicate_depth = 1000;
    // When false, only boolean combinators and direct comparisons of the key
    // against a constant narrow the range.
    bool recognize_method_idioms = true;
};

// Throws configuration_exception on unknown options or bad values.
extractor_config read_extractor_config(const YAML::Node& node);
extractor_config read_extractor_config_file(std::string_view path);

}
