/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once

#include <fmt/format.h>
#include <fc/exception/exception.hpp>
#include <boost/interprocess/exceptions.hpp>

#define DSCHED_ASSERT(expr, exc_type, FORMAT, ...)            \
    FC_MULTILINE_MACRO_BEGIN                                  \
    if(!(expr))                                               \
        FC_THROW_EXCEPTION(exc_type, FORMAT, __VA_ARGS__);    \
    FC_MULTILINE_MACRO_END

#define DSCHED_ASSERT2(expr, exc_type, FORMAT, ...)                                   \
    FC_MULTILINE_MACRO_BEGIN                                                          \
    if(!(expr))                                                                       \
        throw exc_type(FC_LOG_MESSAGE(error, fmt::format(FORMAT, ##__VA_ARGS__)));    \
    FC_MULTILINE_MACRO_END

#define DSCHED_THROW(exc_type, FORMAT, ...) \
    throw exc_type(FC_LOG_MESSAGE(error, FORMAT, __VA_ARGS__));

#define DSCHED_THROW2(exc_type, FORMAT, ...) \
    throw exc_type(FC_LOG_MESSAGE(error, fmt::format(FORMAT, ##__VA_ARGS__)));

namespace dsched { namespace chain {

FC_DECLARE_DERIVED_EXCEPTION(chain_exception, fc::exception,
                             3000000, "blockchain exception");

    FC_DECLARE_DERIVED_EXCEPTION(name_type_exception, chain_exception,
                                 3010000, "Invalid name");

    FC_DECLARE_DERIVED_EXCEPTION(block_validate_exception, chain_exception,
                                 3020000, "Block exception");

    FC_DECLARE_DERIVED_EXCEPTION(nonce_exception, chain_exception,
                                 3030000, "Nonce exception");
        FC_DECLARE_DERIVED_EXCEPTION(invalid_nonce_exception, nonce_exception,
                                     3030001, "Invalid nonce");

    FC_DECLARE_DERIVED_EXCEPTION(task_exception, chain_exception,
                                 3040000, "Task exception");
        FC_DECLARE_DERIVED_EXCEPTION(unknown_action_exception, task_exception,
                                     3040001, "Unknown action");
        FC_DECLARE_DERIVED_EXCEPTION(task_dispatch_exception, task_exception,
                                     3040002, "Task dispatch failed");
        FC_DECLARE_DERIVED_EXCEPTION(action_handler_exception, task_exception,
                                     3040003, "Action handler exception");

    FC_DECLARE_DERIVED_EXCEPTION(database_exception, chain_exception,
                                 3050000, "Database exception");
        FC_DECLARE_DERIVED_EXCEPTION(database_guard_exception, database_exception,
                                     3050001, "Database usage is at unsafe levels");

    FC_DECLARE_DERIVED_EXCEPTION(config_exception, chain_exception,
                                 3060000, "Configuration exception");
        FC_DECLARE_DERIVED_EXCEPTION(invalid_config_exception, config_exception,
                                     3060001, "Invalid scheduler configuration");

    FC_DECLARE_DERIVED_EXCEPTION(misc_exception, chain_exception,
                                 3100000, "Miscellaneous exception");
        FC_DECLARE_DERIVED_EXCEPTION(replay_script_exception, misc_exception,
                                     3100001, "Invalid replay script");

}}  // namespace dsched::chain
