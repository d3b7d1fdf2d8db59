/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once

#include <boost/noncopyable.hpp>
#include <dsched/chain/types.hpp>
#include <dsched/chain/task.hpp>
#include <dsched/chain/nonce_ledger.hpp>
#include <dsched/chain/task_queue.hpp>

namespace dsched { namespace chain {

class execution_sink;
class event_log;

namespace sched {

/**
 *  Admits delegated tasks and executes the due ones once per block.
 *
 *  Running block `n` moves the tasks due at `n` behind the ones carried over
 *  from earlier blocks, dispatches at most `max_tasks_per_block` of them from
 *  the front and leaves the rest in the carry-over bucket for block `n + 1`.
 *  A dispatched task is gone whatever its outcome, the outcome is recorded
 *  into the event log once the batch of the block has been applied.
 *
 *  The scheduler is the only writer of the nonce and task indices.
 */
class scheduler : boost::noncopyable {
public:
    scheduler(chainbase::database& db,
              execution_sink&      sink,
              event_log&           log,
              uint32_t             max_tasks_per_block);

public:
    static void add_indices(chainbase::database& db);

    /// throws invalid_nonce_exception and changes nothing when the nonce is not the expected one
    void schedule_task(const task& t);

    run_summary run(block_num_type block_num);

public:
    nonce_type     expected_nonce(const account_name& account) const;
    vector<task>   get_tasks(block_num_type block_num) const;
    vector<task>   get_carry_over() const;
    block_num_type last_run_block_num() const;

    uint32_t max_tasks_per_block() const { return max_tasks_per_block_; }

private:
    task_event dispatch(block_num_type block_num, task&& t, run_summary& summary);
    void       emit(const task_event& ev);
    void       set_last_run_block_num(block_num_type block_num);

private:
    chainbase::database& db_;
    execution_sink&      sink_;
    event_log&           log_;
    nonce_ledger         nonces_;
    task_queue           queue_;
    uint32_t             max_tasks_per_block_;
};

}}}  // namespace dsched::chain::sched
