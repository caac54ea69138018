/**
 * @file test_pipeline.cpp
 * @brief Pusher / Puller task distribution in both bind directions, and fail-fast
 *        behaviour when the shared context is shut down.
 */
#include "plx_messaging.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace plexus::tests;
using namespace std::chrono_literals;
using plexus::msg::ErrorKind;
using plexus::msg::Message;
using plexus::msg::Puller;
using plexus::msg::Pusher;
using plexus::msg::SocketRole;

class PipelineTest : public MessagingTest
{
  protected:
    static Message make_task(int id)
    {
        return Message::create("tasks/resize", {{"id", id}}).content();
    }

    /// Pulls until the queue stays empty for @p idle_ms, returning the task ids seen.
    static std::vector<int> PullAll(Puller &puller, int idle_ms = 500)
    {
        std::vector<int> ids;
        while (true)
        {
            auto got = puller.pull_timeout(idle_ms);
            if (got.is_error() || !got.content().has_value())
                return ids;
            ids.push_back(got.content()->payload()["id"].get<int>());
        }
    }
};

TEST_F(PipelineTest, EachTaskReachesExactlyOnePuller)
{
    const auto addr = UniqueInproc("tasks");
    auto pushed = Pusher::bind(addr);
    ASSERT_TRUE(pushed.is_ok());
    auto pusher = std::move(pushed).content();
    EXPECT_EQ(pusher.role(), SocketRole::Bind);

    auto first = Puller::connect(addr);
    auto second = Puller::connect(addr);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    std::vector<int> ids_a;
    std::vector<int> ids_b;
    {
        std::jthread worker_a([puller = std::move(first).content(), &ids_a]() mutable {
            ids_a = PullAll(puller);
        });
        std::jthread worker_b([puller = std::move(second).content(), &ids_b]() mutable {
            ids_b = PullAll(puller);
        });

        for (int id = 0; id < 10; ++id)
        {
            EXPECT_TRUE(pusher.push(make_task(id)).is_ok());
        }
    }

    std::multiset<int> all(ids_a.begin(), ids_a.end());
    all.insert(ids_b.begin(), ids_b.end());
    EXPECT_EQ(all.size(), 10u);
    for (int id = 0; id < 10; ++id)
    {
        EXPECT_EQ(all.count(id), 1u) << "task " << id;
    }
    EXPECT_FALSE(ids_a.empty());
    EXPECT_FALSE(ids_b.empty());
}

TEST_F(PipelineTest, PullerMayBindAndPusherConnect)
{
    auto bound = Puller::bind(EphemeralTcp());
    ASSERT_TRUE(bound.is_ok());
    auto puller = std::move(bound).content();
    EXPECT_EQ(puller.role(), SocketRole::Bind);

    auto connected = Pusher::connect(puller.endpoint());
    ASSERT_TRUE(connected.is_ok());
    auto pusher = std::move(connected).content();
    EXPECT_EQ(pusher.role(), SocketRole::Connect);

    ASSERT_TRUE(pusher.push(make_task(42)).is_ok());
    auto got = puller.pull();
    ASSERT_TRUE(got.is_ok()) << got.error_message();
    EXPECT_EQ(got.content().payload()["id"], 42);
}

TEST_F(PipelineTest, PerPusherOrderIsPreserved)
{
    const auto addr = UniqueInproc("order");
    auto puller = std::move(Puller::bind(addr)).content();
    auto pusher = std::move(Pusher::connect(addr)).content();

    for (int id = 0; id < 20; ++id)
    {
        ASSERT_TRUE(pusher.push(make_task(id)).is_ok());
    }
    std::vector<int> expected(20);
    for (int id = 0; id < 20; ++id)
        expected[id] = id;
    EXPECT_EQ(PullAll(puller, 200), expected);
}

TEST_F(PipelineTest, TryPullOnEmptyQueue)
{
    auto puller = std::move(Puller::bind(UniqueInproc("empty"))).content();
    auto got = puller.try_pull();
    ASSERT_TRUE(got.is_ok());
    EXPECT_FALSE(got.content().has_value());
}

TEST_F(PipelineTest, ConnectToMalformedAddressFails)
{
    auto pusher = Pusher::connect("tcp://");
    ASSERT_TRUE(pusher.is_error());
    EXPECT_EQ(pusher.error(), ErrorKind::ConnectError);
}

TEST_F(PipelineTest, ContextShutdownInterruptsBlockingPull)
{
    auto bound = Puller::bind(UniqueInproc("shutdown"));
    ASSERT_TRUE(bound.is_ok());

    bool interrupted = false;
    ErrorKind kind = ErrorKind::SocketError;
    std::jthread worker([puller = std::move(bound).content(), &interrupted, &kind]() mutable {
        auto got = puller.pull();
        interrupted = got.is_error();
        if (interrupted)
            kind = got.error();
        puller.close();
    });

    std::this_thread::sleep_for(100ms);
    plexus::msg::zmq_context_shutdown(); // returns once the worker has closed its Puller
    worker.join();

    EXPECT_TRUE(interrupted);
    EXPECT_EQ(kind, ErrorKind::ReceiveError);

    // A fresh context can be sized again before first use.
    plexus::msg::zmq_context_startup(2);
    auto again = Puller::bind(UniqueInproc("after-shutdown"));
    EXPECT_TRUE(again.is_ok());
}
