/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <boost/noncopyable.hpp>

#include <dsched/chain/config.hpp>
#include <dsched/chain/task.hpp>
#include <dsched/chain/types.hpp>

namespace dsched { namespace chain {

class execution_sink;
class event_log;
struct controller_impl;

/**
 *  Owns the state database and drives the scheduler with the block lifecycle.
 *
 *  Tasks are scheduled inside a pending block, finalizing the block runs the
 *  scheduler for it and makes every change of the block permanent. Aborting
 *  the block rolls back everything done since it was started.
 */
class controller : boost::noncopyable {
public:
    struct config {
        path     state_dir           = chain::config::default_state_dir_name;
        uint64_t state_size          = chain::config::default_state_size;
        uint64_t state_guard_size    = chain::config::default_state_guard_size;
        uint32_t max_tasks_per_block = chain::config::default_max_tasks_per_block;
        bool     read_only           = false;
    };

public:
    controller(const config& cfg, execution_sink& sink, event_log& log);
    ~controller();

public:
    void startup();

    /**
     *  Starts a new pending block at head_block_num() + 1
     */
    void start_block();

    /**
     *  Admits a task into the pending block
     *  @throws invalid_nonce_exception when the nonce of the task is not the expected one
     */
    void schedule_task(const task& t);

    /**
     *  Runs the scheduler for the pending block and commits it.
     *  @post there is no pending block
     */
    run_summary finalize_block();

    void abort_block();

public:
    const chainbase::database& db() const;

    const config& get_config() const;

    block_num_type           head_block_num() const;
    optional<block_num_type> pending_block_num() const;

    nonce_type   expected_nonce(const account_name& account) const;
    vector<task> get_tasks(block_num_type block_num) const;
    vector<task> get_carry_over() const;

    void validate_db_available_size() const;

private:
    std::unique_ptr<controller_impl> my;
};

}}  // namespace dsched::chain

FC_REFLECT(dsched::chain::controller::config,
           (state_dir)(state_size)(state_guard_size)(max_tasks_per_block)(read_only));
