/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <dsched/chain/execution_sink.hpp>
#include <dsched/chain/exceptions.hpp>

namespace dsched { namespace chain {

void
action_dispatcher::register_handler(const action_name& name, handler_func handler) {
    DSCHED_ASSERT(handler, action_handler_exception, "Handler of action: ${name} is empty", ("name", name));

    auto res = handlers_.emplace(name, std::move(handler));
    DSCHED_ASSERT(res.second, action_handler_exception, "Attempting to set handler of action: ${name} twice", ("name", name));
}

bool
action_dispatcher::has_handler(const action_name& name) const {
    return handlers_.find(name) != handlers_.end();
}

void
action_dispatcher::dispatch(const action& act, const account_name& as_account) {
    auto it = handlers_.find(act.name);
    DSCHED_ASSERT(it != handlers_.end(), unknown_action_exception,
        "Cannot find handler of action: ${name}", ("name", act.name));

    try {
        it->second(act, as_account);
    }
    catch(const fc::exception&) {
        throw;
    }
    catch(const std::exception& e) {
        DSCHED_THROW2(task_dispatch_exception, "Action: {} failed as account: {}, {}",
            act.name.to_string(), as_account.to_string(), e.what());
    }
}

}}  // namespace dsched::chain
