/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/types.hpp>

namespace dsched { namespace chain {

/**
 *  An action is an opaque, already decoded call. The scheduler never looks
 *  into `data`, it only stores the action and hands it back to the
 *  execution sink on behalf of the account that scheduled it.
 */
struct action {
    action() = default;
    action(action_name name, bytes data)
        : name(name)
        , data(std::move(data)) {}

    action_name name;
    bytes       data;
};

inline bool
operator==(const action& lhs, const action& rhs) {
    return lhs.name == rhs.name && lhs.data == rhs.data;
}

inline bool
operator!=(const action& lhs, const action& rhs) {
    return !(lhs == rhs);
}

}}  // namespace dsched::chain

FC_REFLECT(dsched::chain::action, (name)(data));
