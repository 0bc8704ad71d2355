#include "channel.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

auto make_counted_channel(std::atomic<int>& notified) {
    return pull::make_channel<std::string>([&notified] { notified++; });
}

} // namespace

TEST(channel, send_then_receive) {
    std::atomic<int> notified{0};
    auto [tx, rx] = make_counted_channel(notified);

    std::string out;
    EXPECT_EQ(rx.try_receive(out), pull::receive_status::empty);

    EXPECT_TRUE(tx.send("a"));
    EXPECT_TRUE(tx.send("b"));
    EXPECT_EQ(notified.load(), 2);

    ASSERT_EQ(rx.try_receive(out), pull::receive_status::received);
    EXPECT_EQ(out, "a");
    ASSERT_EQ(rx.try_receive(out), pull::receive_status::received);
    EXPECT_EQ(out, "b");
    EXPECT_EQ(rx.try_receive(out), pull::receive_status::empty);
}

TEST(channel, closes_after_last_sender) {
    std::atomic<int> notified{0};
    auto [tx, rx] = make_counted_channel(notified);
    auto copy = tx;

    std::string out;
    tx.close();
    EXPECT_TRUE(tx.is_closed());
    EXPECT_FALSE(copy.is_closed());
    EXPECT_EQ(rx.try_receive(out), pull::receive_status::empty);
    EXPECT_EQ(notified.load(), 0);

    copy.close();
    EXPECT_EQ(rx.try_receive(out), pull::receive_status::closed);
    EXPECT_EQ(notified.load(), 1);

    // Idempotent
    copy.close();
    EXPECT_EQ(notified.load(), 1);
}

TEST(channel, destroying_sender_closes) {
    std::atomic<int> notified{0};
    auto [tx, rx] = make_counted_channel(notified);

    {
        auto moved = std::move(tx);
        EXPECT_TRUE(tx.is_closed());
    }

    std::string out;
    EXPECT_EQ(rx.try_receive(out), pull::receive_status::closed);
}

TEST(channel, values_sent_before_close_are_received) {
    std::atomic<int> notified{0};
    auto [tx, rx] = make_counted_channel(notified);

    tx.send("a");
    tx.close();
    EXPECT_FALSE(tx.send("b"));

    std::string out;
    ASSERT_EQ(rx.try_receive(out), pull::receive_status::received);
    EXPECT_EQ(out, "a");
    EXPECT_EQ(rx.try_receive(out), pull::receive_status::closed);
}

TEST(channel, send_fails_without_receiver) {
    std::atomic<int> notified{0};
    auto tx = [&] {
        auto [sender, receiver] = make_counted_channel(notified);
        return std::move(sender);
    }();

    EXPECT_FALSE(tx.send("a"));
    EXPECT_EQ(notified.load(), 0);
}

TEST(channel, close_after_receiver_is_gone_does_not_notify) {
    std::atomic<int> notified{0};
    auto tx = [&] {
        auto [sender, receiver] = make_counted_channel(notified);
        return std::move(sender);
    }();
    auto copy = tx;

    tx.close();
    copy.close();
    EXPECT_TRUE(copy.is_closed());
    EXPECT_EQ(notified.load(), 0);
}

TEST(channel, assignment_releases_previous_channel) {
    std::atomic<int> first_notified{0};
    std::atomic<int> second_notified{0};
    auto [first_tx, first_rx] = make_counted_channel(first_notified);
    auto [second_tx, second_rx] = make_counted_channel(second_notified);

    first_tx = second_tx;

    std::string out;
    EXPECT_EQ(first_rx.try_receive(out), pull::receive_status::closed);

    second_tx.close();
    EXPECT_EQ(second_rx.try_receive(out), pull::receive_status::empty);

    first_tx.send("x");
    ASSERT_EQ(second_rx.try_receive(out), pull::receive_status::received);
    EXPECT_EQ(out, "x");
}

TEST(channel, many_producers_keep_per_producer_order) {
    std::atomic<int> notified{0};
    auto [tx, rx] = pull::make_channel<std::pair<int, int>>([&notified] { notified++; });

    constexpr int producers = 4;
    constexpr int per_producer = 1000;
    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([p, sender = tx]() mutable {
            for (int i = 0; i < per_producer; ++i) sender.send({p, i});
        });
    }
    tx.close();

    std::vector<int> next(producers, 0);
    int received = 0;
    std::pair<int, int> out;
    while (true) {
        auto status = rx.try_receive(out);
        if (status == pull::receive_status::closed) break;
        if (status == pull::receive_status::empty) {
            std::this_thread::yield();
            continue;
        }
        ASSERT_EQ(out.second, next[out.first]) << "producer " << out.first;
        next[out.first]++;
        received++;
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(received, producers * per_producer);
}
