/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/types.hpp>
#include <dsched/chain/task.hpp>

namespace dsched { namespace chain {

class task_object;
class task_bucket_object;

/**
 *  Persistent queue of scheduled tasks, bucketed by the block they are due at.
 *
 *  Each bucket is a linked list of task objects, which makes appending,
 *  popping from the head and moving one whole bucket behind another O(1).
 *  Bucket config::carry_over_block_num holds the tasks which were due but
 *  have not been executed yet, oldest first.
 */
class task_queue {
public:
    explicit task_queue(chainbase::database& db)
        : db_(db) {}

public:
    static void add_indices(chainbase::database& db);

    /// appends to the tail of the bucket of `t.block_num`
    void enqueue(const task& t);

    /// same as enqueue but files the task into the carry-over bucket regardless of its block
    void enqueue_carry_over(const task& t);

    /// removes the bucket of `block_num` and returns its tasks in arrival order
    vector<task> drain_due(block_num_type block_num);

    vector<task> carry_over() const;
    void         set_carry_over(const vector<task>& remaining);

    /**
     *  Moves the whole bucket of `block_num` behind the tail of the carry-over bucket.
     *  Returns the number of tasks moved.
     */
    uint32_t merge_due(block_num_type block_num);

    /// removes the head of the carry-over bucket, nothing when it's empty
    optional<task> pop_front();

    vector<task> get_tasks(block_num_type block_num) const;
    uint32_t     bucket_size(block_num_type block_num) const;
    bool         has_task(const account_name& sender, nonce_type nonce) const;

private:
    void append(block_num_type bucket, const task& t);
    void remove_bucket(const task_bucket_object& bucket);

private:
    chainbase::database& db_;
};

}}  // namespace dsched::chain
