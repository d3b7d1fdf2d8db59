/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/action.hpp>

namespace dsched { namespace chain {

/**
 *  A delegated action which should be executed on behalf of `sender` at or
 *  after block `block_num`. Tasks are immutable once admitted, and
 *  `(sender, nonce)` identifies an admitted task uniquely.
 */
struct task {
    action         act;
    account_name   sender;
    nonce_type     nonce     = 0;
    block_num_type block_num = 0;
};

inline bool
operator==(const task& lhs, const task& rhs) {
    return lhs.sender == rhs.sender && lhs.nonce == rhs.nonce
        && lhs.block_num == rhs.block_num && lhs.act == rhs.act;
}

/**
 *  Outcome of one dispatched task, this is what gets recorded into the event log.
 */
struct task_event {
    enum status_enum {
        executed = 0,  ///< succeed, no error handler executed
        failed   = 1   ///< execution sink reported an error
    };

    block_num_type block_num = 0;
    account_name   sender;
    nonce_type     nonce = 0;
    action         act;
    status_enum    status = executed;
    string         error;
};

/**
 *  Summary of one `run` of the scheduler
 */
struct run_summary {
    block_num_type block_num    = 0;
    uint32_t       dispatched   = 0;
    uint32_t       failed       = 0;
    uint32_t       carried_over = 0;
};

}}  // namespace dsched::chain

FC_REFLECT(dsched::chain::task, (act)(sender)(nonce)(block_num));
FC_REFLECT_ENUM(dsched::chain::task_event::status_enum, (executed)(failed));
FC_REFLECT(dsched::chain::task_event, (block_num)(sender)(nonce)(act)(status)(error));
FC_REFLECT(dsched::chain::run_summary, (block_num)(dispatched)(failed)(carried_over));
