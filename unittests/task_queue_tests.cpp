/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <boost/test/unit_test.hpp>

#include <dsched/chain/config.hpp>
#include <dsched/chain/task_queue.hpp>

#include "tester.hpp"

using namespace dsched::testing;

namespace {

vector<nonce_type>
nonces_of(const vector<task>& tasks) {
    auto nonces = vector<nonce_type>();
    for(auto& t : tasks) {
        nonces.emplace_back(t.nonce);
    }
    return nonces;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(task_queue_tests)

BOOST_FIXTURE_TEST_CASE(enqueue_keeps_arrival_order, state_fixture) { try {
    auto queue = task_queue(db);
    queue.enqueue(make_task("alice"_n, 0, 5));
    queue.enqueue(make_task("bob"_n, 0, 5));
    queue.enqueue(make_task("alice"_n, 1, 6));
    queue.enqueue(make_task("alice"_n, 2, 5));

    auto tasks = queue.get_tasks(5);
    BOOST_REQUIRE_EQUAL(tasks.size(), 3u);
    BOOST_CHECK(tasks[0] == make_task("alice"_n, 0, 5));
    BOOST_CHECK(tasks[1] == make_task("bob"_n, 0, 5));
    BOOST_CHECK(tasks[2] == make_task("alice"_n, 2, 5));

    BOOST_CHECK_EQUAL(queue.bucket_size(5), 3u);
    BOOST_CHECK_EQUAL(queue.bucket_size(6), 1u);
    BOOST_CHECK_EQUAL(queue.bucket_size(7), 0u);
    BOOST_CHECK(queue.get_tasks(7).empty());
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(action_survives_storage, state_fixture) { try {
    auto queue = task_queue(db);
    auto t     = make_task("alice"_n, 0, 3, "transfer"_n, bytes{'\x01', '\x00', '\x7f', 'z'});
    queue.enqueue(t);

    auto tasks = queue.get_tasks(3);
    BOOST_REQUIRE_EQUAL(tasks.size(), 1u);
    BOOST_CHECK(tasks[0].act == t.act);
    BOOST_CHECK_EQUAL(tasks[0].act.name, "transfer"_n);
    BOOST_CHECK(queue.has_task("alice"_n, 0));
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(drain_due_removes_bucket, state_fixture) { try {
    auto queue = task_queue(db);
    for(auto i = 0u; i < 4; i++) {
        queue.enqueue(make_task("alice"_n, i, 8));
    }

    auto tasks = queue.drain_due(8);
    BOOST_CHECK(nonces_of(tasks) == (vector<nonce_type>{0, 1, 2, 3}));
    BOOST_CHECK_EQUAL(queue.bucket_size(8), 0u);
    BOOST_CHECK(!queue.has_task("alice"_n, 0));
    BOOST_CHECK(!queue.has_task("alice"_n, 3));

    BOOST_CHECK(queue.drain_due(8).empty());
    BOOST_CHECK(queue.drain_due(9).empty());
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(merge_due_into_empty_carry_over, state_fixture) { try {
    auto queue = task_queue(db);
    queue.enqueue(make_task("alice"_n, 0, 4));
    queue.enqueue(make_task("alice"_n, 1, 4));

    BOOST_CHECK_EQUAL(queue.merge_due(4), 2u);
    BOOST_CHECK_EQUAL(queue.bucket_size(4), 0u);
    BOOST_CHECK(nonces_of(queue.carry_over()) == (vector<nonce_type>{0, 1}));

    BOOST_CHECK_EQUAL(queue.merge_due(4), 0u);
    BOOST_CHECK_EQUAL(queue.bucket_size(config::carry_over_block_num), 2u);
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(merge_due_appends_after_carry_over, state_fixture) { try {
    auto queue = task_queue(db);
    queue.enqueue(make_task("alice"_n, 0, 4));
    queue.enqueue(make_task("alice"_n, 1, 4));
    queue.enqueue(make_task("bob"_n, 0, 5));
    queue.enqueue(make_task("bob"_n, 1, 5));

    queue.merge_due(4);
    queue.merge_due(5);

    auto carry = queue.carry_over();
    BOOST_REQUIRE_EQUAL(carry.size(), 4u);
    BOOST_CHECK_EQUAL(carry[0].sender, "alice"_n);
    BOOST_CHECK_EQUAL(carry[1].sender, "alice"_n);
    BOOST_CHECK_EQUAL(carry[2].sender, "bob"_n);
    BOOST_CHECK_EQUAL(carry[3].sender, "bob"_n);

    // tasks keep the block they were due at
    BOOST_CHECK_EQUAL(carry[0].block_num, 4u);
    BOOST_CHECK_EQUAL(carry[3].block_num, 5u);

    BOOST_CHECK_THROW(queue.merge_due(config::carry_over_block_num), task_exception);
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(pop_front_consumes_carry_over, state_fixture) { try {
    auto queue = task_queue(db);
    BOOST_CHECK(!queue.pop_front().has_value());

    for(auto i = 0u; i < 3; i++) {
        queue.enqueue(make_task("alice"_n, i, 2));
    }
    queue.merge_due(2);

    auto first = queue.pop_front();
    BOOST_REQUIRE(first.has_value());
    BOOST_CHECK_EQUAL(first->nonce, 0u);
    BOOST_CHECK(!queue.has_task("alice"_n, 0));
    BOOST_CHECK_EQUAL(queue.bucket_size(config::carry_over_block_num), 2u);

    // appending after a pop still links behind the tail
    queue.enqueue_carry_over(make_task("bob"_n, 0, 9));

    BOOST_CHECK_EQUAL(queue.pop_front()->nonce, 1u);
    BOOST_CHECK_EQUAL(queue.pop_front()->nonce, 2u);
    BOOST_CHECK_EQUAL(queue.pop_front()->sender, "bob"_n);
    BOOST_CHECK(!queue.pop_front().has_value());
    BOOST_CHECK_EQUAL(queue.bucket_size(config::carry_over_block_num), 0u);
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(set_carry_over_replaces_bucket, state_fixture) { try {
    auto queue = task_queue(db);
    queue.enqueue_carry_over(make_task("alice"_n, 0, 1));
    queue.enqueue_carry_over(make_task("alice"_n, 1, 1));

    auto remaining = queue.carry_over();
    remaining.erase(remaining.begin());
    remaining.emplace_back(make_task("bob"_n, 0, 2));
    queue.set_carry_over(remaining);

    auto carry = queue.carry_over();
    BOOST_REQUIRE_EQUAL(carry.size(), 2u);
    BOOST_CHECK(carry[0] == make_task("alice"_n, 1, 1));
    BOOST_CHECK(carry[1] == make_task("bob"_n, 0, 2));
    BOOST_CHECK(!queue.has_task("alice"_n, 0));

    queue.set_carry_over({});
    BOOST_CHECK(queue.carry_over().empty());
    BOOST_CHECK(!queue.pop_front().has_value());
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE(carry_over_plus_drain_due_order, state_fixture) { try {
    auto queue = task_queue(db);
    queue.enqueue_carry_over(make_task("alice"_n, 0, 3));
    queue.enqueue(make_task("bob"_n, 0, 4));
    queue.enqueue(make_task("bob"_n, 1, 4));

    auto pending = queue.carry_over();
    auto due     = queue.drain_due(4);
    pending.insert(pending.end(), due.begin(), due.end());

    BOOST_REQUIRE_EQUAL(pending.size(), 3u);
    BOOST_CHECK_EQUAL(pending[0].sender, "alice"_n);
    BOOST_CHECK_EQUAL(pending[1].nonce, 0u);
    BOOST_CHECK_EQUAL(pending[2].nonce, 1u);
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
