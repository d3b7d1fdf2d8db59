/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/types.hpp>

namespace dsched { namespace chain {

/**
 *  Stores the next nonce an account has to present when it schedules a task.
 *  Accounts without an object are treated as being at nonce zero.
 */
class account_nonce_object : public chainbase::object<account_nonce_object_type, account_nonce_object> {
    OBJECT_CTOR(account_nonce_object)

    id_type      id;
    account_name account;
    nonce_type   next_nonce = 0;
};

struct by_account;
using account_nonce_multi_index = boost::multi_index_container<
    account_nonce_object,
    indexed_by<
        ordered_unique<tag<by_id>, member<account_nonce_object, account_nonce_object::id_type, &account_nonce_object::id>>,
        ordered_unique<tag<by_account>, member<account_nonce_object, account_name, &account_nonce_object::account>>
    >,
    allocator<account_nonce_object>
>;

}}  // namespace dsched::chain

CHAINBASE_SET_INDEX_TYPE(dsched::chain::account_nonce_object, dsched::chain::account_nonce_multi_index);
