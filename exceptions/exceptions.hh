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
#include <exception>
#include <iosfwd>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"

namespace keyrange::exceptions {

enum class exception_code : int32_t {
    INVALID_ARGUMENT    = 0x2200,
    UNSUPPORTED_DOMAIN  = 0x2201,
    EVALUATION          = 0x2300,
    CONFIGURATION       = 0x2400,
};

std::ostream& operator<<(std::ostream& os, exception_code code);

class keyrange_exception : public std::exception {
private:
    exception_code _code;
    sstring _msg;
public:
    keyrange_exception(exception_code code, sstring msg) noexcept;

    virtual const char* what() const noexcept override { return _msg.c_str(); }
    exception_code code() const { return _code; }
};

/**
 * Thrown when the caller omits a required input, e.g. the predicate or
 * the name of the key field.
 */
class invalid_argument_exception : public keyrange_exception {
public:
    explicit invalid_argument_exception(sstring msg) noexcept
        : keyrange_exception(exception_code::INVALID_ARGUMENT, std::move(msg))
    { }
};

/**
 * Thrown when a text-only operation (such as building a prefix boundary)
 * is requested for a key domain that is not text.
 */
class unsupported_domain_exception : public keyrange_exception {
public:
    explicit unsupported_domain_exception(sstring msg) noexcept
        : keyrange_exception(exception_code::UNSUPPORTED_DOMAIN, std::move(msg))
    { }
};

/**
 * Thrown by the expression evaluator on type errors, bad arity, arithmetic
 * overflow, or when a constant evaluation reaches the predicate parameter.
 */
class evaluation_exception : public keyrange_exception {
public:
    explicit evaluation_exception(sstring msg) noexcept
        : keyrange_exception(exception_code::EVALUATION, std::move(msg))
    { }
};

class configuration_exception : public keyrange_exception {
public:
    explicit configuration_exception(sstring msg) noexcept
        : keyrange_exception(exception_code::CONFIGURATION, std::move(msg))
    { }
};

}
