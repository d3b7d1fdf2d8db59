/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <dsched/chain/sched/scheduler.hpp>

#include <fc/log/logger.hpp>

#include <dsched/chain/config.hpp>
#include <dsched/chain/event_log.hpp>
#include <dsched/chain/exceptions.hpp>
#include <dsched/chain/execution_sink.hpp>
#include <dsched/chain/task_object.hpp>

namespace dsched { namespace chain { namespace sched {

scheduler::scheduler(chainbase::database& db,
                     execution_sink&      sink,
                     event_log&           log,
                     uint32_t             max_tasks_per_block)
    : db_(db)
    , sink_(sink)
    , log_(log)
    , nonces_(db)
    , queue_(db)
    , max_tasks_per_block_(max_tasks_per_block) {
    DSCHED_ASSERT(max_tasks_per_block_ > 0, invalid_config_exception,
        "max_tasks_per_block must be greater than zero");
}

void
scheduler::add_indices(chainbase::database& db) {
    nonce_ledger::add_indices(db);
    task_queue::add_indices(db);
    db.add_index<scheduler_state_multi_index>();
}

void
scheduler::schedule_task(const task& t) {
    try {
        auto session = db_.start_undo_session(true);

        nonces_.admit(t.sender, t.nonce);

        // a block which has been run already is never drained again,
        // tasks due at such block are due right away
        if(t.block_num <= last_run_block_num()) {
            queue_.enqueue_carry_over(t);
        }
        else {
            queue_.enqueue(t);
        }

        session.squash();
    }
    FC_CAPTURE_AND_RETHROW((t))
}

run_summary
scheduler::run(block_num_type block_num) {
    DSCHED_ASSERT(block_num != config::carry_over_block_num, block_validate_exception,
        "Block ${n} is reserved and cannot be run", ("n", block_num));

    try {
        auto session = db_.start_undo_session(true);

        auto summary      = run_summary();
        summary.block_num = block_num;

        auto due = queue_.merge_due(block_num);

        // events only leave the scheduler once the whole batch is applied
        auto events = vector<task_event>();
        while(summary.dispatched < max_tasks_per_block_) {
            auto t = queue_.pop_front();
            if(!t.has_value()) {
                break;
            }
            events.emplace_back(dispatch(block_num, std::move(*t), summary));
        }

        summary.carried_over = queue_.bucket_size(config::carry_over_block_num);
        set_last_run_block_num(block_num);

        session.squash();

        for(auto& ev : events) {
            emit(ev);
        }

        if(summary.dispatched > 0 || summary.carried_over > 0) {
            ilog("block ${n}: ${due} newly due, ${d} dispatched, ${f} failed, ${c} carried over",
                 ("n", block_num)("due", due)("d", summary.dispatched)
                 ("f", summary.failed)("c", summary.carried_over));
        }
        return summary;
    }
    catch(const boost::interprocess::bad_alloc&) {
        elog("running tasks of block ${n} failed due to a bad allocation", ("n", block_num));
        throw;
    }
    FC_CAPTURE_AND_RETHROW((block_num))
}

task_event
scheduler::dispatch(block_num_type block_num, task&& t, run_summary& summary) {
    auto ev      = task_event();
    ev.block_num = block_num;
    ev.sender    = t.sender;
    ev.nonce     = t.nonce;
    ev.act       = std::move(t.act);

    try {
        // state changes made by a failed action must not survive
        auto session = db_.start_undo_session(true);
        sink_.dispatch(ev.act, ev.sender);
        session.squash();

        ev.status = task_event::executed;
    }
    catch(const boost::interprocess::bad_alloc&) {
        throw;
    }
    catch(const fc::exception& e) {
        ev.status = task_event::failed;
        ev.error  = e.top_message();
    }
    catch(const std::exception& e) {
        ev.status = task_event::failed;
        ev.error  = e.what();
    }

    summary.dispatched++;
    if(ev.status == task_event::failed) {
        summary.failed++;
        wlog("task ${nonce} of ${sender} failed at block ${n}: ${e}",
             ("nonce", ev.nonce)("sender", ev.sender)("n", block_num)("e", ev.error));
    }
    return ev;
}

/**
 *  The event log is outside of consensus, a failing log must neither abort
 *  the batch nor change what has been executed.
 */
void
scheduler::emit(const task_event& ev) {
    try {
        log_.append(ev);
    }
    catch(const boost::interprocess::bad_alloc&) {
        wlog("bad alloc");
        throw;
    }
    catch(const fc::exception& e) {
        wlog("${details}", ("details", e.to_detail_string()));
    }
    catch(const std::exception& e) {
        wlog("event log threw exception: ${what}", ("what", e.what()));
    }
}

nonce_type
scheduler::expected_nonce(const account_name& account) const {
    return nonces_.expected_nonce(account);
}

vector<task>
scheduler::get_tasks(block_num_type block_num) const {
    return queue_.get_tasks(block_num);
}

vector<task>
scheduler::get_carry_over() const {
    return queue_.carry_over();
}

block_num_type
scheduler::last_run_block_num() const {
    auto state = db_.find<scheduler_state_object>();
    return state ? state->last_run_block_num : 0;
}

void
scheduler::set_last_run_block_num(block_num_type block_num) {
    auto state = db_.find<scheduler_state_object>();
    if(state == nullptr) {
        db_.create<scheduler_state_object>([&](auto& s) {
            s.last_run_block_num = block_num;
        });
    }
    else if(block_num > state->last_run_block_num) {
        db_.modify(*state, [&](auto& s) {
            s.last_run_block_num = block_num;
        });
    }
}

}}}  // namespace dsched::chain::sched
