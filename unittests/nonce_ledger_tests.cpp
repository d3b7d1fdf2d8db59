/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <boost/test/unit_test.hpp>

#include <dsched/chain/nonce_ledger.hpp>

#include "tester.hpp"

using namespace dsched::testing;

BOOST_AUTO_TEST_SUITE(nonce_ledger_tests)

BOOST_FIXTURE_TEST_CASE(unseen_account_starts_at_zero, state_fixture) { try {
    auto ledger = nonce_ledger(db);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), 0u);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("bob"_n), 0u);
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(admit_in_sequence, state_fixture) { try {
    auto ledger = nonce_ledger(db);
    for(auto i = 0u; i < 10; i++) {
        ledger.admit("alice"_n, i);
        BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), i + 1);
    }

    // every admitted nonce is gone for good
    for(auto i = 0u; i < 10; i++) {
        BOOST_CHECK_THROW(ledger.admit("alice"_n, i), invalid_nonce_exception);
    }
    BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), 10u);
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(future_nonce_is_rejected, state_fixture) { try {
    auto ledger = nonce_ledger(db);
    BOOST_CHECK_THROW(ledger.admit("alice"_n, 1), invalid_nonce_exception);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), 0u);

    ledger.admit("alice"_n, 0);
    BOOST_CHECK_THROW(ledger.admit("alice"_n, 5), invalid_nonce_exception);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), 1u);

    ledger.admit("alice"_n, 1);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), 2u);
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(accounts_are_independent, state_fixture) { try {
    auto ledger = nonce_ledger(db);
    ledger.admit("alice"_n, 0);
    ledger.admit("alice"_n, 1);
    ledger.admit("bob"_n, 0);

    BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), 2u);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("bob"_n), 1u);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("carol"_n), 0u);
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(admission_is_undone_with_session, state_fixture) { try {
    auto ledger = nonce_ledger(db);
    ledger.admit("alice"_n, 0);
    {
        auto session = db.start_undo_session(true);
        ledger.admit("alice"_n, 1);
        ledger.admit("bob"_n, 0);
    }
    BOOST_CHECK_EQUAL(ledger.expected_nonce("alice"_n), 1u);
    BOOST_CHECK_EQUAL(ledger.expected_nonce("bob"_n), 0u);
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
