/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once

#include <functional>
#include <memory>

#include <fc/filesystem.hpp>

#include <dsched/chain/controller.hpp>
#include <dsched/chain/event_log.hpp>
#include <dsched/chain/exceptions.hpp>
#include <dsched/chain/execution_sink.hpp>
#include <dsched/chain/sched/scheduler.hpp>

namespace dsched { namespace testing {

using namespace dsched::chain;
using namespace dsched::chain::name_literals;

const static uint64_t test_state_size       = 16 * 1024 * 1024;
const static uint64_t test_state_guard_size = 1024 * 1024;

inline task
make_task(account_name sender, nonce_type nonce, block_num_type block_num, action_name act = "noop"_n, bytes data = {}) {
    auto t      = task();
    t.act       = action(act, std::move(data));
    t.sender    = sender;
    t.nonce     = nonce;
    t.block_num = block_num;
    return t;
}

inline vector<account_name>
dispatched_senders(const memory_event_log& events) {
    auto senders = vector<account_name>();
    for(auto& ev : events.events()) {
        senders.emplace_back(ev.sender);
    }
    return senders;
}

/**
 *  Execution sink which remembers every dispatch, actions named `fail` are
 *  reported as failed.
 */
class recording_sink : public execution_sink {
public:
    struct call {
        action       act;
        account_name as;
    };

public:
    void
    dispatch(const action& act, const account_name& as) override {
        calls.push_back(call{act, as});
        if(on_dispatch) {
            on_dispatch(act, as);
        }
        if(act.name == "fail"_n) {
            DSCHED_THROW(task_dispatch_exception, "${name} failed on purpose", ("name", act.name));
        }
    }

public:
    vector<call>                                             calls;
    std::function<void(const action&, const account_name&)> on_dispatch;
};

/**
 *  Chain state database with the scheduler indices, no controller on top
 */
struct state_fixture {
    state_fixture()
        : db(tempdir.path(), chainbase::database::read_write, test_state_size) {
        sched::scheduler::add_indices(db);
    }

    fc::temp_directory  tempdir;
    chainbase::database db;
};

struct scheduler_fixture : state_fixture {
    explicit scheduler_fixture(uint32_t max_tasks_per_block = 2)
        : sched(db, sink, events, max_tasks_per_block) {}

    vector<nonce_type>
    dispatched_nonces() const {
        auto nonces = vector<nonce_type>();
        for(auto& ev : events.events()) {
            nonces.emplace_back(ev.nonce);
        }
        return nonces;
    }

    recording_sink   sink;
    memory_event_log events;
    sched::scheduler sched;
};

class tester {
public:
    explicit tester(uint32_t max_tasks_per_block = 2) {
        cfg.state_dir           = tempdir.path();
        cfg.state_size          = test_state_size;
        cfg.state_guard_size    = test_state_guard_size;
        cfg.max_tasks_per_block = max_tasks_per_block;
        open();
    }

    void
    open() {
        control = std::make_unique<controller>(cfg, sink, events);
        control->startup();
    }

    void
    close() {
        control.reset();
    }

    run_summary
    produce_block() {
        control->start_block();
        return control->finalize_block();
    }

    vector<run_summary>
    produce_blocks(uint32_t n) {
        auto summaries = vector<run_summary>();
        for(auto i = 0u; i < n; i++) {
            summaries.emplace_back(produce_block());
        }
        return summaries;
    }

    /// schedules `t` in a block of its own
    run_summary
    push_task(const task& t) {
        control->start_block();
        try {
            control->schedule_task(t);
        }
        catch(const fc::exception&) {
            control->abort_block();
            throw;
        }
        return control->finalize_block();
    }

public:
    fc::temp_directory          tempdir;
    controller::config          cfg;
    recording_sink              sink;
    memory_event_log            events;
    std::unique_ptr<controller> control;
};

}}  // namespace dsched::testing
