/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include <limits>
#include <string>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "exceptions/exceptions.hh"
#include "extractor_config.hh"
#include "log.hh"

namespace keyrange {

static logging::logger cfglog("extractor_config");

extractor_config read_extractor_config(const YAML::Node& node) {
    extractor_config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw exceptions::configuration_exception("extractor configuration must be a map");
    }
    for (const auto& kv : node) {
        const auto name = kv.first.Scalar();
        try {
            if (name == "max_predicate_depth") {
                const auto depth = kv.second.as<int64_t>();
                if (depth <= 0 || depth > std::numeric_limits<uint32_t>::max()) {
                    throw exceptions::configuration_exception(
                            fmt::format("max_predicate_depth must be a positive 32-bit integer, got {}", depth));
                }
                cfg.max_predicate_depth = static_cast<uint32_t>(depth);
            } else if (name == "recognize_method_idioms") {
                cfg.recognize_method_idioms = kv.second.as<bool>();
            } else {
                throw exceptions::configuration_exception(fmt::format("unknown extractor option '{}'", name));
            }
        } catch (const YAML::Exception& e) {
            throw exceptions::configuration_exception(fmt::format("invalid value for '{}': {}", name, e.what()));
        }
    }
    cfglog.debug("max_predicate_depth={} recognize_method_idioms={}", cfg.max_predicate_depth, cfg.recognize_method_idioms);
    return cfg;
}

extractor_config read_extractor_config_file(std::string_view path) {
    YAML::Node node;
    try {
        node = YAML::LoadFile(std::string(path));
    } catch (const YAML::Exception& e) {
        throw exceptions::configuration_exception(fmt::format("cannot load {}: {}", path, e.what()));
    }
    cfglog.info("loading extractor configuration from {}", path);
    return read_extractor_config(node);
}

}
