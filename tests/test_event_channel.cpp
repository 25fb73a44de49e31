#include "event_channel.hpp"
#include "fake_workload_client.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace svidsource;
using namespace svidsource::test;
using namespace std::chrono_literals;

TEST(event_channel, events_keep_delivery_order) {
    auto channel = std::make_shared<event_channel>();
    channel_watcher watcher(channel);

    watcher.on_update(make_context({make_svid("spiffe://example.org/a", 1)}, {}));
    watcher.on_error(make_error(errc::connection, "reset"));
    watcher.on_update(make_context({make_svid("spiffe://example.org/b", 2)}, {}));

    EXPECT_EQ(channel->size_approx(), 3u);

    watch_event ev;
    ASSERT_TRUE(channel->wait_pop(ev, 100ms));
    EXPECT_EQ(ev.type, watch_event::kind::update);
    EXPECT_EQ(ev.sequence, 1u);
    ASSERT_TRUE(ev.update.has_value());
    EXPECT_EQ(ev.update->svids.front().id().str(), "spiffe://example.org/a");

    ASSERT_TRUE(channel->wait_pop(ev, 100ms));
    EXPECT_EQ(ev.type, watch_event::kind::error);
    EXPECT_EQ(ev.sequence, 2u);
    ASSERT_TRUE(ev.err.has_value());
    EXPECT_EQ(ev.err->message, "reset");

    ASSERT_TRUE(channel->wait_pop(ev, 100ms));
    EXPECT_EQ(ev.sequence, 3u);
}

TEST(event_channel, stop_event_has_no_sequence) {
    event_channel channel;
    channel.push_stop();

    watch_event ev;
    ev.sequence = 42;
    ASSERT_TRUE(channel.wait_pop(ev, 100ms));
    EXPECT_EQ(ev.type, watch_event::kind::stop);
    EXPECT_EQ(ev.sequence, 0u);
}

TEST(event_channel, wait_pop_times_out_when_empty) {
    event_channel channel;
    watch_event ev;
    EXPECT_FALSE(channel.wait_pop(ev, 10ms));
}

TEST(event_channel, close_discards_later_events) {
    auto channel = std::make_shared<event_channel>();
    channel_watcher watcher(channel);

    channel->close();
    EXPECT_TRUE(channel->is_closed());
    EXPECT_EQ(channel->size_approx(), 1u);

    watcher.on_update(make_context({make_svid("spiffe://example.org/a", 1)}, {}));
    watcher.on_error(make_error(errc::connection, "reset"));
    channel->close();
    EXPECT_EQ(channel->size_approx(), 1u);

    watch_event ev;
    ASSERT_TRUE(channel->wait_pop(ev, 100ms));
    EXPECT_EQ(ev.type, watch_event::kind::stop);
    EXPECT_FALSE(channel->wait_pop(ev, 10ms));
}
