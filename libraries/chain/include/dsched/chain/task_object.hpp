/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/types.hpp>
#include <dsched/chain/task.hpp>

namespace dsched { namespace chain {

/**
 *  A scheduled task as it is persisted in the state database.
 *
 *  Tasks of the same bucket form a singly linked list through `next`, the
 *  list is owned by a task_bucket_object which knows its head, tail and size.
 *  `next` is only meaningful when the task is not the tail of its bucket.
 */
class task_object : public chainbase::object<task_object_type, task_object> {
    OBJECT_CTOR(task_object, (packed_action))

    id_type        id;
    account_name   sender;
    nonce_type     nonce     = 0;
    block_num_type block_num = 0;
    id_type        next;
    shared_string  packed_action;

    void
    set(const action& act) {
        auto size = fc::raw::pack_size(act);
        packed_action.resize(size);
        fc::datastream<char*> ds(&packed_action[0], size);
        fc::raw::pack(ds, act);
    }

    action
    get_action() const {
        auto act = action();
        fc::datastream<const char*> ds(packed_action.data(), packed_action.size());
        fc::raw::unpack(ds, act);
        return act;
    }

    task
    to_task() const {
        auto t      = task();
        t.act       = get_action();
        t.sender    = sender;
        t.nonce     = nonce;
        t.block_num = block_num;
        return t;
    }
};

struct by_sender_nonce;
using task_multi_index = boost::multi_index_container<
    task_object,
    indexed_by<
        ordered_unique<tag<by_id>, member<task_object, task_object::id_type, &task_object::id>>,
        ordered_unique<tag<by_sender_nonce>,
            composite_key<task_object,
                member<task_object, account_name, &task_object::sender>,
                member<task_object, nonce_type, &task_object::nonce>
            >
        >
    >,
    allocator<task_object>
>;

/**
 *  Head and tail of the tasks due at one block.
 *  The bucket keyed by config::carry_over_block_num holds the tasks which
 *  were due but could not be executed because of the per-block limit.
 */
class task_bucket_object : public chainbase::object<task_bucket_object_type, task_bucket_object> {
    OBJECT_CTOR(task_bucket_object)

    id_type                 id;
    block_num_type          block_num = 0;
    task_object::id_type    head;
    task_object::id_type    tail;
    uint32_t                size = 0;
};

struct by_block_num;
using task_bucket_multi_index = boost::multi_index_container<
    task_bucket_object,
    indexed_by<
        ordered_unique<tag<by_id>, member<task_bucket_object, task_bucket_object::id_type, &task_bucket_object::id>>,
        ordered_unique<tag<by_block_num>, member<task_bucket_object, block_num_type, &task_bucket_object::block_num>>
    >,
    allocator<task_bucket_object>
>;

/**
 *  Singleton, remembers the highest block the scheduler has run for.
 */
class scheduler_state_object : public chainbase::object<scheduler_state_object_type, scheduler_state_object> {
    OBJECT_CTOR(scheduler_state_object)

    id_type        id;
    block_num_type last_run_block_num = 0;
};

using scheduler_state_multi_index = boost::multi_index_container<
    scheduler_state_object,
    indexed_by<
        ordered_unique<tag<by_id>, member<scheduler_state_object, scheduler_state_object::id_type, &scheduler_state_object::id>>
    >,
    allocator<scheduler_state_object>
>;

}}  // namespace dsched::chain

CHAINBASE_SET_INDEX_TYPE(dsched::chain::task_object, dsched::chain::task_multi_index);
CHAINBASE_SET_INDEX_TYPE(dsched::chain::task_bucket_object, dsched::chain::task_bucket_multi_index);
CHAINBASE_SET_INDEX_TYPE(dsched::chain::scheduler_state_object, dsched::chain::scheduler_state_multi_index);
