#include "stop_request.hpp"
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

TEST(stop_request, first_request_runs_stop_once) {
    std::vector<std::string> reasons;
    pull::stop_request stop([&](std::string_view reason) { reasons.emplace_back(reason); });
    EXPECT_FALSE(stop.requested());

    EXPECT_TRUE(stop.request("session failed to start", 1));
    EXPECT_TRUE(stop.requested());

    // A signal arriving afterwards changes nothing.
    EXPECT_FALSE(stop.request("signal"));

    EXPECT_EQ(reasons, std::vector<std::string>{"session failed to start"});
    EXPECT_EQ(stop.wait(), 1);
}

TEST(stop_request, signal_stop_exits_cleanly) {
    int stops = 0;
    pull::stop_request stop([&](std::string_view) { ++stops; });

    EXPECT_TRUE(stop.request("signal"));
    EXPECT_FALSE(stop.request("session failed to start", 1));

    EXPECT_EQ(stop.wait(), 0);
    EXPECT_EQ(stops, 1);
}

TEST(stop_request, wait_blocks_until_requested_from_another_thread) {
    bool closed = false;
    pull::stop_request stop([&](std::string_view) { closed = true; });

    std::thread io_thread([&] { stop.request("session failed to start", 1); });

    EXPECT_EQ(stop.wait(), 1);
    // The stop action finished before wait() returned.
    EXPECT_TRUE(closed);
    io_thread.join();
}
