/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <boost/test/unit_test.hpp>

#include <fc/variant.hpp>

#include <dsched/chain/exceptions.hpp>
#include <dsched/chain/name.hpp>

using namespace dsched::chain;
using namespace dsched::chain::name_literals;

BOOST_AUTO_TEST_SUITE(name_tests)

BOOST_AUTO_TEST_CASE(name_to_string) { try {
    BOOST_CHECK_EQUAL(name("alice").to_string(), "alice");
    BOOST_CHECK_EQUAL(name("a.b.c").to_string(), "a.b.c");
    BOOST_CHECK_EQUAL(name("abcdefghij12j").to_string(), "abcdefghij12j");
    BOOST_CHECK_EQUAL(name().to_string(), "");
    BOOST_CHECK(name().empty());

    BOOST_CHECK_EQUAL("alice"_n, name("alice"));
    BOOST_CHECK_NE("alice"_n, "bob"_n);
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(invalid_names) { try {
    BOOST_CHECK_THROW(name("Alice"), name_type_exception);
    BOOST_CHECK_THROW(name("alice6"), name_type_exception);
    BOOST_CHECK_THROW(name("abcdefghijklmn"), name_type_exception);
    // the 13th character only has 4 bits
    BOOST_CHECK_THROW(name("abcdefghijklz"), name_type_exception);
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE(name_variant) { try {
    auto var = fc::variant("carol"_n);
    BOOST_CHECK_EQUAL(var.as_string(), "carol");
    BOOST_CHECK_EQUAL(var.as<name>(), "carol"_n);

    BOOST_CHECK_THROW(fc::variant("CAROL").as<name>(), name_type_exception);
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
