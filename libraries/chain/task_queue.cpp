/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <dsched/chain/task_queue.hpp>

#include <boost/tuple/tuple.hpp>

#include <dsched/chain/config.hpp>
#include <dsched/chain/exceptions.hpp>
#include <dsched/chain/task_object.hpp>

namespace dsched { namespace chain {

void
task_queue::add_indices(chainbase::database& db) {
    db.add_index<task_multi_index>();
    db.add_index<task_bucket_multi_index>();
}

void
task_queue::append(block_num_type bucket_num, const task& t) {
    const auto& obj = db_.create<task_object>([&](auto& to) {
        to.sender    = t.sender;
        to.nonce     = t.nonce;
        to.block_num = t.block_num;
        to.set(t.act);
    });

    auto bucket = db_.find<task_bucket_object, by_block_num>(bucket_num);
    if(bucket == nullptr) {
        db_.create<task_bucket_object>([&](auto& b) {
            b.block_num = bucket_num;
            b.head      = obj.id;
            b.tail      = obj.id;
            b.size      = 1;
        });
        return;
    }

    db_.modify(db_.get<task_object>(bucket->tail), [&](auto& to) {
        to.next = obj.id;
    });
    db_.modify(*bucket, [&](auto& b) {
        b.tail = obj.id;
        b.size++;
    });
}

void
task_queue::remove_bucket(const task_bucket_object& bucket) {
    auto id = bucket.head;
    for(auto i = 0u; i < bucket.size; i++) {
        const auto& obj = db_.get<task_object>(id);
        id = obj.next;
        db_.remove(obj);
    }
    db_.remove(bucket);
}

void
task_queue::enqueue(const task& t) {
    append(t.block_num, t);
}

void
task_queue::enqueue_carry_over(const task& t) {
    append(config::carry_over_block_num, t);
}

vector<task>
task_queue::drain_due(block_num_type block_num) {
    auto tasks = get_tasks(block_num);
    if(auto bucket = db_.find<task_bucket_object, by_block_num>(block_num)) {
        remove_bucket(*bucket);
    }
    return tasks;
}

vector<task>
task_queue::carry_over() const {
    return get_tasks(config::carry_over_block_num);
}

void
task_queue::set_carry_over(const vector<task>& remaining) {
    if(auto bucket = db_.find<task_bucket_object, by_block_num>(config::carry_over_block_num)) {
        remove_bucket(*bucket);
    }
    for(auto& t : remaining) {
        append(config::carry_over_block_num, t);
    }
}

uint32_t
task_queue::merge_due(block_num_type block_num) {
    DSCHED_ASSERT(block_num != config::carry_over_block_num, task_exception,
        "Cannot merge the carry-over bucket into itself");

    auto due = db_.find<task_bucket_object, by_block_num>(block_num);
    if(due == nullptr) {
        return 0;
    }

    auto size  = due->size;
    auto carry = db_.find<task_bucket_object, by_block_num>(config::carry_over_block_num);
    if(carry == nullptr) {
        // nothing left over, the due bucket becomes the carry-over bucket as is
        db_.modify(*due, [](auto& b) {
            b.block_num = config::carry_over_block_num;
        });
        return size;
    }

    auto head = due->head;
    auto tail = due->tail;

    db_.modify(db_.get<task_object>(carry->tail), [&](auto& to) {
        to.next = head;
    });
    db_.modify(*carry, [&](auto& b) {
        b.tail = tail;
        b.size += size;
    });
    db_.remove(*due);

    return size;
}

optional<task>
task_queue::pop_front() {
    auto carry = db_.find<task_bucket_object, by_block_num>(config::carry_over_block_num);
    if(carry == nullptr) {
        return std::nullopt;
    }

    const auto& head = db_.get<task_object>(carry->head);
    auto t = head.to_task();

    if(carry->size == 1) {
        db_.remove(*carry);
    }
    else {
        db_.modify(*carry, [&](auto& b) {
            b.head = head.next;
            b.size--;
        });
    }
    db_.remove(head);

    return t;
}

vector<task>
task_queue::get_tasks(block_num_type block_num) const {
    auto tasks  = vector<task>();
    auto bucket = db_.find<task_bucket_object, by_block_num>(block_num);
    if(bucket == nullptr) {
        return tasks;
    }

    tasks.reserve(bucket->size);

    auto id = bucket->head;
    for(auto i = 0u; i < bucket->size; i++) {
        const auto& obj = db_.get<task_object>(id);
        tasks.emplace_back(obj.to_task());
        id = obj.next;
    }
    return tasks;
}

uint32_t
task_queue::bucket_size(block_num_type block_num) const {
    auto bucket = db_.find<task_bucket_object, by_block_num>(block_num);
    return bucket ? bucket->size : 0;
}

bool
task_queue::has_task(const account_name& sender, nonce_type nonce) const {
    return db_.find<task_object, by_sender_nonce>(boost::make_tuple(sender, nonce)) != nullptr;
}

}}  // namespace dsched::chain
