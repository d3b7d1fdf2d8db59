/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <dsched/chain/nonce_ledger.hpp>

#include <fc/log/logger.hpp>

#include <dsched/chain/account_nonce_object.hpp>
#include <dsched/chain/exceptions.hpp>

namespace dsched { namespace chain {

void
nonce_ledger::add_indices(chainbase::database& db) {
    db.add_index<account_nonce_multi_index>();
}

nonce_type
nonce_ledger::expected_nonce(const account_name& account) const {
    auto obj = db_.find<account_nonce_object, by_account>(account);
    if(obj == nullptr) {
        return 0;
    }
    return obj->next_nonce;
}

void
nonce_ledger::admit(const account_name& account, nonce_type nonce) {
    auto obj = db_.find<account_nonce_object, by_account>(account);
    auto expected = (obj == nullptr) ? nonce_type(0) : obj->next_nonce;

    DSCHED_ASSERT2(nonce == expected, invalid_nonce_exception,
        "Invalid nonce for account: {}, expected: {}, provided: {}", account.to_string(), expected, nonce);

    if(obj == nullptr) {
        db_.create<account_nonce_object>([&](auto& n) {
            n.account    = account;
            n.next_nonce = 1;
        });
    }
    else {
        db_.modify(*obj, [](auto& n) {
            ++n.next_nonce;
        });
    }

    dlog("admitted nonce ${n} for ${a}", ("n", nonce)("a", account));
}

}}  // namespace dsched::chain
