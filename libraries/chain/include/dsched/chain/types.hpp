/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <chainbase/chainbase.hpp>
#include <boost/interprocess/containers/string.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

#include <fc/io/raw.hpp>
#include <fc/filesystem.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <dsched/chain/name.hpp>

namespace dsched { namespace chain {

using std::optional;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

using fc::path;

using boost::multi_index::composite_key;
using boost::multi_index::indexed_by;
using boost::multi_index::member;
using boost::multi_index::ordered_unique;
using boost::multi_index::tag;

using chainbase::allocator;
using shared_string = boost::interprocess::basic_string<char, std::char_traits<char>, allocator<char>>;

using bytes          = vector<char>;
using account_name   = name;
using action_name    = name;
using block_num_type = uint32_t;
using nonce_type     = uint64_t;

/**
 * List all object types used by the scheduler so that every object type has a unique id
 */
enum object_type {
    null_object_type = 0,
    account_nonce_object_type,
    task_object_type,
    task_bucket_object_type,
    scheduler_state_object_type,
    OBJECT_TYPE_COUNT  ///< Sentry value which contains the number of different object types
};

struct by_id;

}}  // namespace dsched::chain
