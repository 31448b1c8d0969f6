#include "dialcast/udp_ssdp_peer.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace dialcast::discovery;

TEST(CompletionQueue, RunsInPostingOrder)
{
    completion_queue queue;
    std::vector<int> order;
    queue.post([&]() { order.push_back(1); });
    queue.post([&]() { order.push_back(2); });
    queue.post([&]() { order.push_back(3); });

    EXPECT_EQ(queue.run_pending(), 3u);
    EXPECT_EQ(order, (std::vector<int> {1, 2, 3}));
    EXPECT_EQ(queue.run_pending(), 0u);
}

TEST(CompletionQueue, PostedWhileRunningWaitsForNextRun)
{
    completion_queue queue;
    std::vector<int> order;
    queue.post([&]() {
        order.push_back(1);
        queue.post([&]() { order.push_back(3); });
    });
    queue.post([&]() { order.push_back(2); });

    EXPECT_EQ(queue.run_pending(), 2u);
    EXPECT_EQ(order, (std::vector<int> {1, 2}));

    EXPECT_EQ(queue.run_pending(), 1u);
    EXPECT_EQ(order, (std::vector<int> {1, 2, 3}));
}
