/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <dsched/chain/controller.hpp>

#include <chainbase/chainbase.hpp>

#include <fc/log/logger.hpp>
#include <fc/scoped_exit.hpp>

#include <dsched/chain/event_log.hpp>
#include <dsched/chain/exceptions.hpp>
#include <dsched/chain/execution_sink.hpp>
#include <dsched/chain/sched/pending.hpp>
#include <dsched/chain/sched/scheduler.hpp>

namespace dsched { namespace chain {

using chainbase::database;
using sched::maybe_session;
using sched::pending_state;

struct controller_impl {
    controller&             self;
    chainbase::database     db;
    optional<pending_state> pending;
    controller::config      conf;
    sched::scheduler        scheduler;

    controller_impl(const controller::config& cfg, controller& s, execution_sink& sink, event_log& log)
        : self(s)
        , db(cfg.state_dir,
             cfg.read_only ? database::read_only : database::read_write,
             cfg.state_size)
        , conf(cfg)
        , scheduler(db, sink, log, cfg.max_tasks_per_block) {}

    ~controller_impl() {
        pending.reset();
        if(!conf.read_only) {
            db.flush();
        }
    }

    void
    add_indices() {
        sched::scheduler::add_indices(db);
    }

    block_num_type
    head_num() const {
        auto revision = db.revision();
        DSCHED_ASSERT(revision >= 0, block_validate_exception, "controller has not been started up");
        return static_cast<block_num_type>(revision);
    }

    void
    startup() {
        add_indices();

        if(head_num() == 0) {
            wlog("No existing scheduler state. Initializing fresh state.");
        }
        ilog("scheduler state initialized at block ${n}, max tasks per block: ${m}",
             ("n", head_num())("m", conf.max_tasks_per_block));
    }

    void
    start_block() {
        DSCHED_ASSERT(!conf.read_only, block_validate_exception, "cannot start a block in read-only mode");
        DSCHED_ASSERT(!pending.has_value(), block_validate_exception, "pending block already exists");

        pending.emplace(maybe_session(db), head_num() + 1);
    }

    void
    schedule_task(const task& t) {
        DSCHED_ASSERT(pending.has_value(), block_validate_exception, "it is not valid to schedule a task when there is no pending block");

        scheduler.schedule_task(t);
        pending->_num_scheduled++;
    }

    run_summary
    finalize_block() {
        DSCHED_ASSERT(pending.has_value(), block_validate_exception, "it is not valid to finalize when there is no pending block");

        auto reset_pending_on_exit = fc::make_scoped_exit([this] {
            pending.reset();
        });

        try {
            auto block_num = pending->_block_num;
            auto summary   = scheduler.run(block_num);

            pending->push();
            db.commit(block_num);

            dlog("finalized block ${n}, #scheduled: ${s}", ("n", block_num)("s", pending->_num_scheduled));
            return summary;
        }
        FC_CAPTURE_AND_RETHROW()
    }

    void
    abort_block() {
        if(pending.has_value()) {
            wlog("aborting pending block ${n}", ("n", pending->_block_num));
            pending.reset();
        }
    }
};

controller::controller(const config& cfg, execution_sink& sink, event_log& log)
    : my(new controller_impl(cfg, *this, sink, log)) {}

controller::~controller() {
    my->abort_block();
}

void
controller::startup() {
    my->startup();
}

void
controller::start_block() {
    validate_db_available_size();
    my->start_block();
}

void
controller::schedule_task(const task& t) {
    validate_db_available_size();
    my->schedule_task(t);
}

run_summary
controller::finalize_block() {
    validate_db_available_size();
    return my->finalize_block();
}

void
controller::abort_block() {
    my->abort_block();
}

const chainbase::database&
controller::db() const {
    return my->db;
}

const controller::config&
controller::get_config() const {
    return my->conf;
}

block_num_type
controller::head_block_num() const {
    if(my->pending.has_value()) {
        return my->pending->_block_num - 1;
    }
    return my->head_num();
}

optional<block_num_type>
controller::pending_block_num() const {
    if(my->pending.has_value()) {
        return my->pending->_block_num;
    }
    return std::nullopt;
}

nonce_type
controller::expected_nonce(const account_name& account) const {
    return my->scheduler.expected_nonce(account);
}

vector<task>
controller::get_tasks(block_num_type block_num) const {
    return my->scheduler.get_tasks(block_num);
}

vector<task>
controller::get_carry_over() const {
    return my->scheduler.get_carry_over();
}

void
controller::validate_db_available_size() const {
    const auto free  = db().get_segment_manager()->get_free_memory();
    const auto guard = my->conf.state_guard_size;
    DSCHED_ASSERT(free >= guard, database_guard_exception, "database free: ${f}, guard size: ${g}", ("f", free)("g", guard));
}

}}  // namespace dsched::chain
