/*
 * Copyright (C) 2019 ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#include <boost/test/unit_test.hpp>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <seastar/core/print.hh>

#include "test/lib/exception_utils.hh"

namespace keyrange::exception_predicate {

predicate make(
        predicate check,
        std::function<sstring(const std::exception&)> err) {
    return [check = std::move(check), err = std::move(err)] (const std::exception& e) {
        const bool status = check(e);
        BOOST_CHECK_MESSAGE(status, err(e));
        return status;
    };
}

static std::string location(const std::source_location& loc) {
    return fmt::format("{}:{}", loc.file_name(), loc.line());
}

predicate message_contains(
        const sstring& fragment,
        const std::source_location& loc) {
    return make([=] (const std::exception& e) { return sstring(e.what()).find(fragment) != sstring::npos; },
            [=] (const std::exception& e) {
                return seastar::format("Message '{}' doesn't contain '{}'\n{}", e.what(), std::string_view(fragment), location(loc));
            });
}

predicate message_equals(
        const sstring& text,
        const std::source_location& loc) {
    return make([=] (const std::exception& e) { return text == e.what(); },
            [=] (const std::exception& e) {
                return seastar::format("Message '{}' doesn't equal '{}'\n{}", e.what(), std::string_view(text), location(loc));
            });
}

predicate code_equals(
        exceptions::exception_code code,
        const std::source_location& loc) {
    using exceptions::keyrange_exception;
    return make([=] (const std::exception& e) {
                auto kre = dynamic_cast<const keyrange_exception*>(&e);
                return kre && kre->code() == code;
            },
            [=] (const std::exception& e) {
                auto kre = dynamic_cast<const keyrange_exception*>(&e);
                if (!kre) {
                    return seastar::format("'{}' is not a keyrange_exception\n{}", e.what(), location(loc));
                }
                return seastar::format("Code {} doesn't equal {}\n{}", fmt::streamed(kre->code()), fmt::streamed(code), location(loc));
            });
}

}
