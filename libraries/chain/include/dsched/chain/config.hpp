/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/types.hpp>

namespace dsched { namespace chain { namespace config {

const static auto default_state_dir_name    = "state";
const static auto default_state_size        = 256 * 1024 * 1024ll;
const static auto default_state_guard_size  = 8 * 1024 * 1024ll;

/// key of the bucket holding tasks which were due but not executed yet
const static block_num_type carry_over_block_num = 0;

const static uint32_t default_max_tasks_per_block = 64;

}}}  // namespace dsched::chain::config
