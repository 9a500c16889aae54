/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#define BOOST_TEST_MODULE expression

#include <boost/test/unit_test.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

#include "expr/evaluate.hh"
#include "expr/expression.hh"
#include "test/lib/exception_utils.hh"
#include "test/lib/predicate_builder.hh"
#include "types.hh"
#include "utils/exceptions.hh"

using namespace keyrange;
using namespace keyrange::test;
using namespace keyrange::expr;

static const record sample_record = {
    {"K", data_value(int32_t(5))},
    {"name", data_value("abc")},
    {"big", data_value(std::numeric_limits<int64_t>::max())},
};

BOOST_AUTO_TEST_CASE(test_value_cast) {
    BOOST_REQUIRE_EQUAL(value_cast<int32_t>(data_value(int64_t(7))).value(), 7);
    BOOST_REQUIRE(!value_cast<int32_t>(data_value(int64_t(1) << 40)));
    BOOST_REQUIRE_EQUAL(value_cast<int64_t>(data_value(int32_t(-3))).value(), -3);
    BOOST_REQUIRE_EQUAL(value_cast<double>(data_value(int32_t(2))).value(), 2.0);
    BOOST_REQUIRE(!value_cast<double>(data_value((int64_t(1) << 53) + 1)));
    BOOST_REQUIRE(!value_cast<int32_t>(data_value(2.0)));
    BOOST_REQUIRE_EQUAL(value_cast<sstring>(data_value("x")).value(), "x");
    BOOST_REQUIRE(!value_cast<sstring>(data_value(int32_t(1))));
    BOOST_REQUIRE(!value_cast<int32_t>(data_value::make_null()));
}

BOOST_AUTO_TEST_CASE(test_compare_values) {
    BOOST_REQUIRE(compare_values(data_value(int32_t(1)), data_value(int64_t(2))) < 0);
    BOOST_REQUIRE(compare_values(data_value(int64_t(2)), data_value(2.0)) == 0);
    BOOST_REQUIRE(compare_values(data_value::make_null(), data_value(int32_t(-100))) < 0);
    BOOST_REQUIRE(compare_values(data_value("b"), data_value("a")) > 0);
    BOOST_REQUIRE_EXCEPTION(compare_values(data_value("a"), data_value(int32_t(1))), exceptions::evaluation_exception,
            exception_predicate::message_contains("cannot compare"));
    BOOST_REQUIRE(!values_equal(data_value("1"), data_value(int32_t(1))));
    BOOST_REQUIRE(values_equal(data_value(int32_t(1)), data_value(1.0)));
}

BOOST_AUTO_TEST_CASE(test_compare_floating_values) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    BOOST_REQUIRE(compare_values(data_value(nan), data_value(inf)) > 0);
    BOOST_REQUIRE(compare_values(data_value(nan), data_value(int32_t(5))) > 0);
    BOOST_REQUIRE(compare_values(data_value(-inf), data_value(std::numeric_limits<int64_t>::min())) < 0);
    BOOST_REQUIRE(compare_values(data_value(-0.0), data_value(int32_t(0))) < 0);
    BOOST_REQUIRE(compare_values(data_value(-0.0), data_value(0.0)) < 0);
    BOOST_REQUIRE(compare_values(data_value::make_null(), data_value(-inf)) < 0);
    BOOST_REQUIRE(values_equal(data_value(nan), data_value(nan)));
    BOOST_REQUIRE(!values_equal(data_value(-0.0), data_value(0.0)));
    BOOST_REQUIRE(!values_equal(data_value(nan), data_value(inf)));
}

BOOST_AUTO_TEST_CASE(test_evaluate_comparisons) {
    BOOST_REQUIRE(evaluate_predicate(eq(key(), 5), sample_record));
    BOOST_REQUIRE(evaluate_predicate(lt(4, key()), sample_record));
    BOOST_REQUIRE(!evaluate_predicate(gt(key(), int64_t(5)), sample_record));
    BOOST_REQUIRE(evaluate_predicate(neq(key(), 6), sample_record));
    BOOST_REQUIRE(evaluate_predicate(lte(key(), 5.0), sample_record));
}

BOOST_AUTO_TEST_CASE(test_evaluate_combinators) {
    BOOST_REQUIRE(evaluate_predicate(and_(gt(key(), 0), lt(key(), 10)), sample_record));
    BOOST_REQUIRE(evaluate_predicate(or_(gt(key(), 10), eq(key(), 5)), sample_record));
    BOOST_REQUIRE(evaluate_predicate(not_(gt(key(), 10)), sample_record));
    // Short-circuit: the right-hand side would fail to evaluate.
    BOOST_REQUIRE(!evaluate_predicate(and_(false, gt(field("name"), 1)), sample_record));
    BOOST_REQUIRE(evaluate_predicate(or_(true, gt(field("name"), 1)), sample_record));
}

BOOST_AUTO_TEST_CASE(test_evaluate_functions) {
    auto name = field("name");
    BOOST_REQUIRE(evaluate_predicate(call(name, function_kind::equals, "abc"), sample_record));
    BOOST_REQUIRE(evaluate_predicate(call(name, function_kind::starts_with, "ab"), sample_record));
    BOOST_REQUIRE(evaluate_predicate(call(name, function_kind::ends_with, "bc"), sample_record));
    BOOST_REQUIRE(evaluate_predicate(call(name, function_kind::contains, "b"), sample_record));
    BOOST_REQUIRE(!evaluate_predicate(call(name, function_kind::starts_with, "b"), sample_record));
    BOOST_REQUIRE_EQUAL(evaluate(call(name, function_kind::length), sample_record), data_value(int32_t(3)));
    BOOST_REQUIRE_EQUAL(evaluate(call(name, function_kind::compare_to, "abd"), sample_record), data_value(int32_t(-1)));
    BOOST_REQUIRE_EQUAL(evaluate(key_call(function_kind::compare_to, 2), sample_record), data_value(int32_t(1)));
    BOOST_REQUIRE_EQUAL(evaluate(compare("abc", name), sample_record), data_value(int32_t(0)));
    BOOST_REQUIRE_EQUAL(evaluate(compare(name, "b"), sample_record), data_value(int32_t(-1)));
}

BOOST_AUTO_TEST_CASE(test_evaluate_errors) {
    using exception_predicate::message_contains;
    BOOST_REQUIRE_EXCEPTION(evaluate(arith(field("big"), arith_oper_t::ADD, int64_t(1)), sample_record),
            exceptions::evaluation_exception, message_contains("integer overflow"));
    BOOST_REQUIRE_EXCEPTION(evaluate(call(field("name"), function_kind::starts_with), sample_record),
            exceptions::evaluation_exception, message_contains("starts_with expects"));
    BOOST_REQUIRE_EXCEPTION(evaluate(key_call(function_kind::starts_with, "a"), sample_record),
            exceptions::evaluation_exception, message_contains("expects text"));
    BOOST_REQUIRE_EXCEPTION(evaluate(call(field("missing"), function_kind::length), sample_record),
            exceptions::evaluation_exception, message_contains("called on null"));
    BOOST_REQUIRE_EXCEPTION(evaluate_predicate(key(), sample_record),
            exceptions::evaluation_exception, message_contains("is not a boolean"));
    BOOST_REQUIRE_EXCEPTION(evaluate(compare(key(), 1), sample_record),
            exceptions::evaluation_exception, message_contains("expects text arguments"));
}

BOOST_AUTO_TEST_CASE(test_missing_field_is_null) {
    BOOST_REQUIRE_EQUAL(evaluate(field("missing"), sample_record), data_value::make_null());
    BOOST_REQUIRE(evaluate_predicate(lt(field("missing"), 0), sample_record));
}

BOOST_AUTO_TEST_CASE(test_arithmetic) {
    BOOST_REQUIRE_EQUAL(evaluate(arith(key(), arith_oper_t::MUL, 3), sample_record), data_value(int32_t(15)));
    BOOST_REQUIRE_EQUAL(evaluate(arith(key(), arith_oper_t::SUB, int64_t(6)), sample_record), data_value(int64_t(-1)));
    BOOST_REQUIRE_EQUAL(evaluate(arith(key(), arith_oper_t::ADD, 0.5), sample_record), data_value(5.5));
    BOOST_REQUIRE_EQUAL(evaluate(arith(field("name"), arith_oper_t::ADD, "d"), sample_record), data_value("abcd"));
    BOOST_REQUIRE_EQUAL(evaluate(arith(field("missing"), arith_oper_t::ADD, 1), sample_record), data_value::make_null());
}

BOOST_AUTO_TEST_CASE(test_evaluate_constant) {
    BOOST_REQUIRE_EQUAL(evaluate_constant(arith(2, arith_oper_t::ADD, 3)), data_value(int32_t(5)));
    BOOST_REQUIRE_EQUAL(evaluate_constant(captured("limit", data_value(int64_t(9)))), data_value(int64_t(9)));
    BOOST_REQUIRE_EXCEPTION(evaluate_constant(arith(key(), arith_oper_t::ADD, 1)),
            exceptions::evaluation_exception, exception_predicate::message_contains("not a constant"));
}

BOOST_AUTO_TEST_CASE(test_copy_and_equality) {
    expression e = and_(gt(key(), 0), key_call(function_kind::starts_with, "a"));
    expression copy = e;
    BOOST_REQUIRE_EQUAL(e, copy);
    BOOST_REQUIRE(!(e == and_(gt(key(), 1), key_call(function_kind::starts_with, "a"))));
    BOOST_REQUIRE(captured("c", data_value(int32_t(1))) == captured("c", data_value(int32_t(1))));
    BOOST_REQUIRE(!(captured("c", data_value(int32_t(1))) == captured("c", data_value(int32_t(2)))));
}

BOOST_AUTO_TEST_CASE(test_find_in_expression) {
    auto e = or_(gt(field("other"), 0), key_call(function_kind::compare_to, arith(1, arith_oper_t::ADD, 2)));
    BOOST_REQUIRE(references_parameter(e));
    BOOST_REQUIRE(!references_parameter(arith(1, arith_oper_t::ADD, 2)));

    auto ma = find_in_expression<member_access>(e, [] (const member_access& m) { return m.member == "K"; });
    BOOST_REQUIRE(ma);
    BOOST_REQUIRE(is_key_access(expression(*ma), "K"));
    BOOST_REQUIRE(!is_key_access(field("other"), "K"));
    BOOST_REQUIRE(!find_in_expression<negation>(e, [] (const negation&) { return true; }));

    unsigned constants = 0;
    recurse_until(e, [&] (const expression& sub) {
        constants += is<constant>(sub);
        return false;
    });
    BOOST_REQUIRE_EQUAL(constants, 3u);
}

BOOST_AUTO_TEST_CASE(test_operators) {
    BOOST_REQUIRE(reverse(oper_t::LT) == oper_t::GT);
    BOOST_REQUIRE(reverse(oper_t::GTE) == oper_t::LTE);
    BOOST_REQUIRE(reverse(oper_t::EQ) == oper_t::EQ);
    BOOST_REQUIRE(negated(oper_t::LT) == oper_t::GTE);
    BOOST_REQUIRE(negated(oper_t::GT) == oper_t::LTE);
    BOOST_REQUIRE(negated(oper_t::NEQ) == oper_t::EQ);
    BOOST_REQUIRE(is_slice(oper_t::LTE));
    BOOST_REQUIRE(!is_slice(oper_t::NEQ));
}

BOOST_AUTO_TEST_CASE(test_corrupt_operator_is_an_internal_error) {
    set_abort_on_internal_error(false);
    const auto bad = static_cast<oper_t>(42);
    BOOST_REQUIRE_THROW(reverse(bad), std::logic_error);
    BOOST_REQUIRE_THROW(negated(bad), std::logic_error);
    BOOST_REQUIRE_THROW(evaluate(arith(1, static_cast<arith_oper_t>(42), 2), sample_record), std::logic_error);
}

BOOST_AUTO_TEST_CASE(test_format) {
    BOOST_REQUIRE_EQUAL(fmt::format("{}", and_(lt(key(), 0), not_(eq(field("s"), "a")))),
            "((x.K < 0) AND NOT (x.s = \"a\"))");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", lte(key_call(function_kind::compare_to, int64_t(7)), 0)),
            "(x.K.compare_to(7L) <= 0)");
    BOOST_REQUIRE_EQUAL(fmt::format("{}", compare(key(), "m")), "compare(x.K, \"m\")");
}
