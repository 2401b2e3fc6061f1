#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <cadence/acquire.hpp>

#include <fakes/collaborators.hpp>

using namespace std::chrono_literals;

namespace acq = cadence::acquire;

using cadence::test::eventually;
using cadence::test::harness_t;

static acq::experiment_config_t deep_stack() {
    acq::experiment_config_t config;
    config.name = "deep";
    config.space_mode = acq::space_mode_t::simple_z_stack;
    config.footprint = std::make_shared<cadence::test::grid_footprint_t>();
    config.z_start = 0;
    config.z_end = 1000;
    config.z_step = 1;
    return config;
}

static std::vector<acq::instruction_t> drain(acq::instruction_queue_t& queue) {
    std::vector<acq::instruction_t> out;
    acq::instruction_t o;
    while (queue.pop(o, false)) {
        out.push_back(o);
    }
    return out;
}

static bool returns_within(std::function<void()> task, std::chrono::milliseconds timeout = 5s) {
    auto f = std::async(std::launch::async, std::move(task));
    bool ok = f.wait_for(timeout) == std::future_status::ready;
    if (ok) {
        f.get();
    }
    return ok;
}

TEST(abort, unblocks_producer_on_full_queue) {
    harness_t h(3);

    auto& e = h.create(deep_stack());
    h.group->start(e);

    ASSERT_TRUE(eventually([&]() { return h.queue->size() == 3; }));
    EXPECT_EQ(e.state(), acq::state_t::emitting);

    ASSERT_TRUE(returns_within([&]() { e.abort(); }));

    EXPECT_EQ(e.state(), acq::state_t::aborted);
    EXPECT_TRUE(e.done());
    EXPECT_FALSE(e.error());
    EXPECT_EQ(e.status().emitted, 3u);
    EXPECT_EQ(h.group->aborted_count.load(), 1u);

    // nothing stale may follow the terminal instruction
    std::this_thread::sleep_for(20ms);
    auto stream = drain(*h.queue);
    ASSERT_EQ(stream.size(), 1u);
    EXPECT_TRUE(acq::is_terminal(stream[0]));
    EXPECT_EQ(acq::owner(stream[0]), e.id());
}

TEST(abort, keeps_sibling_instructions) {
    harness_t h(3);

    acq::instruction::capture sibling;
    sibling.owner = 999'999;
    ASSERT_TRUE(h.queue->push(sibling));

    auto& e = h.create(deep_stack());
    h.group->start(e);

    ASSERT_TRUE(eventually([&]() { return h.queue->size() == 3; }));
    ASSERT_TRUE(returns_within([&]() { e.abort(); }));

    auto stream = drain(*h.queue);
    ASSERT_EQ(stream.size(), 2u);
    EXPECT_EQ(acq::owner(stream[0]), 999'999u);
    EXPECT_FALSE(acq::is_terminal(stream[0]));
    EXPECT_EQ(acq::owner(stream[1]), e.id());
    EXPECT_TRUE(acq::is_terminal(stream[1]));
}

TEST(abort, is_idempotent) {
    harness_t h;

    auto& e = h.create(deep_stack());
    e.abort();
    e.abort();

    EXPECT_EQ(h.group->aborted_count.load(), 1u);
    auto stream = drain(*h.queue);
    ASSERT_EQ(stream.size(), 1u);
    EXPECT_TRUE(acq::is_terminal(stream[0]));
}

TEST(abort, releases_waiting_group) {
    harness_t h;

    acq::experiment_config_t config;
    config.time_enabled = true;
    config.time_points = 5;
    auto& e = h.create(config);
    h.group->start(e);

    // without a sink the generator stalls on the write gate while the group waits for the next time point
    ASSERT_TRUE(eventually([&]() { return e.state() == acq::state_t::await_write && h.group->granted.load() == 1; }));

    ASSERT_TRUE(returns_within([&]() { e.abort(); }));
    ASSERT_TRUE(returns_within([&]() { h.group->join(); }));

    EXPECT_EQ(e.ready_for_next_timepoint(), acq::experiment_t::arrival_t::broken);
    EXPECT_EQ(e.timepoint_written(), acq::experiment_t::arrival_t::broken);

    // the unconsumed time point is purged
    auto stream = drain(*h.queue);
    ASSERT_EQ(stream.size(), 1u);
    EXPECT_TRUE(acq::is_terminal(stream[0]));
}

TEST(abort, cancels_pending_start_time) {
    harness_t h;

    acq::experiment_config_t config;
    config.time_enabled = true;
    config.time_points = 2;
    config.time_interval = 10;
    config.time_interval_unit = acq::interval_unit_t::minutes;
    auto& e = h.run(config);

    ASSERT_TRUE(eventually([&]() { return e.status().timers_armed == 1; }));

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(returns_within([&]() { e.abort(); }));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    h.sink->join();
    auto stream = h.sink->received();
    ASSERT_FALSE(stream.empty());
    EXPECT_TRUE(acq::is_terminal(stream.back()));
    EXPECT_EQ(std::count_if(stream.begin(), stream.end(), [](auto& o) { return acq::is_terminal(o); }), 1);
    EXPECT_EQ(h.sink->received_of<acq::instruction::capture>().size(), 1u);
}

TEST(abort, while_paused) {
    harness_t h;

    acq::experiment_config_t config;
    config.time_enabled = true;
    config.time_points = 3;
    auto& e = h.create(config);
    e.pause();

    ASSERT_TRUE(returns_within([&]() { e.abort(); }));
    EXPECT_EQ(e.state(), acq::state_t::aborted);
}

TEST(abort, after_completion_does_nothing) {
    harness_t h;

    acq::experiment_config_t config;
    auto& e = h.run(config);
    ASSERT_TRUE(e.wait_for(5s));
    h.sink->join();

    e.abort();

    EXPECT_EQ(e.state(), acq::state_t::finished);
    EXPECT_EQ(h.group->aborted_count.load(), 0u);
    EXPECT_EQ(h.queue->size(), 0u);
}

TEST(abort, reports_group_failure) {
    harness_t h;
    h.group->on_aborted = [](acq::experiment_t&) { throw std::runtime_error("group failed"); };

    auto& e = h.create(deep_stack());

    EXPECT_THROW(e.abort(), std::runtime_error);
    EXPECT_EQ(e.state(), acq::state_t::aborted);

    auto stream = drain(*h.queue);
    ASSERT_EQ(stream.size(), 1u);
    EXPECT_TRUE(acq::is_terminal(stream[0]));

    // a second request does not notify the group again
    EXPECT_NO_THROW(e.abort());
    EXPECT_EQ(h.group->aborted_count.load(), 1u);
}

TEST(abort, destruction_terminates_stream) {
    auto queue = std::make_shared<acq::instruction_queue_t>(acq::instruction_queue_config_t{ 3 });
    auto group = std::make_shared<cadence::test::fake_group_t>();
    auto hardware = std::make_shared<cadence::test::fake_hardware_t>();

    auto e = std::make_unique<acq::experiment_t>(deep_stack(), queue, group, hardware);

    // grant only the first time point so that no group thread outlives the experiment
    std::thread grant([&]() { e->ready_for_next_timepoint(); });
    grant.join();
    ASSERT_TRUE(eventually([&]() { return queue->size() == 3; }));

    ASSERT_TRUE(returns_within([&]() { e.reset(); }));

    auto stream = drain(*queue);
    ASSERT_EQ(stream.size(), 1u);
    EXPECT_TRUE(acq::is_terminal(stream[0]));
    EXPECT_EQ(group->aborted_count.load(), 0u);
}

TEST(abort, after_cancellation_keeps_single_terminal) {
    harness_t h(3);

    auto& e = h.create(deep_stack());
    h.group->start(e);
    ASSERT_TRUE(eventually([&]() { return h.queue->size() == 3; }));

    e.abort();
    e.abort();

    auto stream = drain(*h.queue);
    ASSERT_EQ(stream.size(), 1u);
    EXPECT_TRUE(acq::is_terminal(stream[0]));
}

TEST(abort, group_returns_after_sink_drains) {
    harness_t h(3);
    h.sink->write_delay = 5ms;

    auto& e = h.run(deep_stack());
    h.group->on_aborted = [&](acq::experiment_t&) { h.sink->join(); };
    ASSERT_TRUE(eventually([&]() { return e.status().emitted >= 5; }));

    ASSERT_TRUE(returns_within([&]() { e.abort(); }));

    // the sink saw the end of the stream before abort returned
    auto stream = h.sink->received();
    ASSERT_FALSE(stream.empty());
    EXPECT_TRUE(acq::is_terminal(stream.back()));
    EXPECT_EQ(std::count_if(stream.begin(), stream.end(), [](auto& o) { return acq::is_terminal(o); }), 1);
    EXPECT_EQ(h.queue->size(), 0u);
}
