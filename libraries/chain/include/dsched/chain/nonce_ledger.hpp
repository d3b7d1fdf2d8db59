/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/types.hpp>

namespace dsched { namespace chain {

/**
 *  Per-account counters guarding scheduled tasks against replay.
 *
 *  A task is admitted only when it presents exactly the account's current
 *  counter, the counter then moves forward by one. A nonce which has been
 *  admitted once can never be admitted again.
 */
class nonce_ledger {
public:
    explicit nonce_ledger(chainbase::database& db)
        : db_(db) {}

public:
    static void add_indices(chainbase::database& db);

    nonce_type expected_nonce(const account_name& account) const;

    /**
     *  Bumps the counter of `account` when `nonce` is the expected one,
     *  throws invalid_nonce_exception and leaves the counter untouched otherwise.
     */
    void admit(const account_name& account, nonce_type nonce);

private:
    chainbase::database& db_;
};

}}  // namespace dsched::chain
