/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include <ostream>

#include "exceptions/exceptions.hh"

namespace keyrange::exceptions {

keyrange_exception::keyrange_exception(exception_code code, sstring msg) noexcept
    : _code(code)
    , _msg(std::move(msg))
{ }

std::ostream& operator<<(std::ostream& os, exception_code code) {
    switch (code) {
    case exception_code::INVALID_ARGUMENT: return os << "invalid_argument";
    case exception_code::UNSUPPORTED_DOMAIN: return os << "unsupported_domain";
    case exception_code::EVALUATION: return os << "evaluation";
    case exception_code::CONFIGURATION: return os << "configuration";
    }
    return os << "exception_code(" << static_cast<int32_t>(code) << ")";
}

}
