/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once

#include <chainbase/chainbase.hpp>
#include <dsched/chain/types.hpp>

namespace dsched { namespace chain { namespace sched {

using chainbase::database;

class maybe_session {
public:
    explicit maybe_session(database& db) {
        _session = db.start_undo_session(true);
    }

    maybe_session(maybe_session&& other)
        : _session(std::move(other._session)) {}

    maybe_session(const maybe_session&) = delete;

public:
    void
    push() {
        if(_session) {
            _session->push();
        }
    }

private:
    optional<database::session> _session;
};

/**
 *  The block currently being built: every state change made between
 *  start_block and finalize_block lives in `_db_session` until it is pushed.
 */
struct pending_state {
public:
    pending_state(maybe_session&& s, block_num_type block_num)
        : _db_session(std::move(s))
        , _block_num(block_num) {}

    pending_state(pending_state&& ps)
        : _db_session(std::move(ps._db_session))
        , _block_num(ps._block_num)
        , _num_scheduled(ps._num_scheduled) {}

public:
    void
    push() {
        _db_session.push();
    }

public:
    maybe_session  _db_session;
    block_num_type _block_num     = 0;
    uint32_t       _num_scheduled = 0;
};

}}}  // namespace dsched::chain::sched
