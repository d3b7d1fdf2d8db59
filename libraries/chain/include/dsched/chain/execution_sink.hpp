/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <functional>
#include <unordered_map>
#include <boost/noncopyable.hpp>
#include <dsched/chain/action.hpp>

namespace dsched { namespace chain {

/**
 *  Executes a decoded action as if it was signed by `as_account`.
 *
 *  Implementations report a failed dispatch by throwing an fc::exception,
 *  returning normally means the action succeeded. The call must be bounded
 *  and deterministic, it runs inside the per-block batch of the scheduler.
 */
class execution_sink {
public:
    virtual ~execution_sink() = default;

    virtual void dispatch(const action& act, const account_name& as_account) = 0;
};

/**
 *  Execution sink which routes actions to handlers registered by action name
 */
class action_dispatcher : public execution_sink, boost::noncopyable {
public:
    using handler_func = std::function<void(const action&, const account_name&)>;

public:
    void register_handler(const action_name& name, handler_func handler);
    bool has_handler(const action_name& name) const;

    void dispatch(const action& act, const account_name& as_account) override;

private:
    std::unordered_map<action_name, handler_func> handlers_;
};

}}  // namespace dsched::chain
