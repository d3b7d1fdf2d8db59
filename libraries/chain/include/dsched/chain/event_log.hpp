/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once
#include <dsched/chain/task.hpp>

namespace dsched { namespace chain {

/**
 *  Append-only record of the outcome of every dispatched task
 */
class event_log {
public:
    virtual ~event_log() = default;

    virtual void append(const task_event& ev) = 0;
};

class memory_event_log : public event_log {
public:
    void append(const task_event& ev) override { events_.emplace_back(ev); }

    const vector<task_event>& events() const { return events_; }

private:
    vector<task_event> events_;
};

}}  // namespace dsched::chain
