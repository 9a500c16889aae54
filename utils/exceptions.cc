/*
 * Copyright 2015 ScyllaDB
 */

/* This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include <atomic>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include <seastar/util/backtrace.hh>
#include <seastar/util/log.hh>

#include "utils/exceptions.hh"

namespace keyrange {

static std::atomic<bool> abort_on_internal_error{false};

void set_abort_on_internal_error(bool do_abort) noexcept {
    abort_on_internal_error.store(do_abort);
}

void on_internal_error(seastar::logger& logger, std::string_view reason) {
    std::ostringstream backtrace;
    backtrace << seastar::current_backtrace();
    if (abort_on_internal_error.load()) {
        logger.error("{}, at: {}", reason, backtrace.str());
        std::abort();
    }
    logger.error("{}, at: {}", reason, backtrace.str());
    throw std::logic_error(std::string(reason));
}

}
