/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * This file is part of Scylla.
 *
 * See the LICENSE.PROPRIETARY file in the top-level directory for licensing information.
 */

#define BOOST_TEST_MODULE key_range_soundness

#include <boost/test/unit_test.hpp>
#include <random>

#include <fmt/format.h>

#include "expr/evaluate.hh"
#include "key_range_extractor.hh"
#include "test/lib/log.hh"
#include "test/lib/random_predicate.hh"

using namespace keyrange;
using namespace keyrange::test;

static constexpr unsigned predicates_per_run = 2000;
static constexpr unsigned records_per_predicate = 40;

// Every record that satisfies a predicate must have its key inside the
// range extracted from that predicate.
template <Orderable T>
static void check_soundness(key_domain domain) {
    const auto seed = std::random_device()();
    testlog.info("random seed: {}", seed);
    std::mt19937 engine(seed);
    random_predicate_generator gen(engine, domain);

    unsigned satisfied = 0;
    for (unsigned i = 0; i < predicates_per_run; ++i) {
        auto predicate = gen.make_predicate(4);
        auto range = get_key_range<T>(predicate, "K");
        testlog.trace("{} -> {}", predicate, range);
        for (unsigned j = 0; j < records_per_predicate; ++j) {
            auto rec = gen.make_record();
            if (!expr::evaluate_predicate(predicate, rec)) {
                continue;
            }
            ++satisfied;
            auto key = value_cast<T>(rec.at("K"));
            BOOST_REQUIRE(key);
            if (!range.contains(*key)) {
                BOOST_FAIL(fmt::format("seed {}: record with key {} satisfies {} but lies outside {}",
                        seed, rec.at("K"), predicate, range));
            }
        }
    }
    testlog.info("{} satisfying records checked", satisfied);
}

BOOST_AUTO_TEST_CASE(test_integer_keys) {
    check_soundness<int32_t>(key_domain::integer);
}

// NaN, infinities and signed zeros are keys like any other, ordered the
// same way by the evaluator and by the range algebra.
BOOST_AUTO_TEST_CASE(test_floating_keys) {
    check_soundness<double>(key_domain::floating);
}

BOOST_AUTO_TEST_CASE(test_text_keys) {
    check_soundness<sstring>(key_domain::text);
}

BOOST_AUTO_TEST_CASE(test_extraction_is_deterministic) {
    std::mt19937 engine(1234);
    random_predicate_generator gen(engine, key_domain::text);
    for (unsigned i = 0; i < 200; ++i) {
        auto predicate = gen.make_predicate(4);
        auto copy = predicate;
        BOOST_REQUIRE_EQUAL(get_key_range<sstring>(predicate, "K"), get_key_range<sstring>(copy, "K"));
    }
}
