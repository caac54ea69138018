/**
 * @file test_reqrep.cpp
 * @brief Requester / Replier round trips and strict request/reply alternation.
 */
#include "plx_messaging.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>
#include <stop_token>
#include <thread>
#include <vector>

using namespace plexus::tests;
using namespace std::chrono_literals;
using plexus::msg::ErrorKind;
using plexus::msg::ExchangeState;
using plexus::msg::Message;
using plexus::msg::Replier;
using plexus::msg::Requester;
using plexus::msg::SocketPattern;
using plexus::msg::SocketRole;
using plexus::msg::TransportSocket;

class ReqRepTest : public MessagingTest
{
  protected:
    static Message make(const std::string &topic, nlohmann::json payload)
    {
        return Message::create(topic, std::move(payload)).content();
    }

    static Replier BindReplier(const std::string &address)
    {
        auto rep = Replier::bind(address);
        EXPECT_TRUE(rep.is_ok()) << (rep.is_error() ? rep.error_message() : "");
        return std::move(rep).content();
    }

    static Requester ConnectRequester(const std::string &address)
    {
        auto req = Requester::connect(address);
        EXPECT_TRUE(req.is_ok()) << (req.is_error() ? req.error_message() : "");
        return std::move(req).content();
    }
};

// ============================================================================
// Round trips
// ============================================================================

TEST_F(ReqRepTest, RequestReturnsTheMatchingReply)
{
    const auto addr = UniqueInproc("echo");
    auto rep = BindReplier(addr);
    auto req = ConnectRequester(addr);

    std::jthread server([replier = std::move(rep)]() mutable {
        for (int i = 0; i < 3; ++i)
        {
            auto request = replier.receive();
            ASSERT_TRUE(request.is_ok()) << request.error_message();
            const int n = request.content().payload()["n"].get<int>();
            ASSERT_TRUE(replier.reply(Message::create("calc/square", {{"n", n * n}}).content()).is_ok());
        }
    });

    for (int n = 1; n <= 3; ++n)
    {
        auto reply = req.request(make("calc/square", {{"n", n}}));
        ASSERT_TRUE(reply.is_ok()) << reply.error_message();
        EXPECT_EQ(reply.content().payload()["n"], n * n);
        EXPECT_EQ(req.state(), ExchangeState::Ready);
    }
    server.join();
}

TEST_F(ReqRepTest, RoundTripOverTcp)
{
    auto rep = BindReplier(EphemeralTcp());
    auto req = ConnectRequester(rep.endpoint());

    std::jthread server([replier = std::move(rep)]() mutable {
        auto request = replier.receive();
        ASSERT_TRUE(request.is_ok());
        ASSERT_TRUE(replier.reply(make("pong", request.content().payload())).is_ok());
    });

    auto reply = req.request_timeout(make("ping", "hello"), 5000);
    ASSERT_TRUE(reply.is_ok());
    ASSERT_TRUE(reply.content().has_value());
    EXPECT_EQ(reply.content()->topic(), "pong");
    EXPECT_EQ(reply.content()->payload(), "hello");
    server.join();
}

TEST_F(ReqRepTest, SplitSendAndReceive)
{
    const auto addr = UniqueInproc("split");
    auto rep = BindReplier(addr);
    auto req = ConnectRequester(addr);

    ASSERT_TRUE(req.send_request(make("job", 7)).is_ok());
    EXPECT_TRUE(req.awaiting_reply());

    auto request = rep.receive_timeout(2000);
    ASSERT_TRUE(request.is_ok());
    ASSERT_TRUE(request.content().has_value());
    EXPECT_TRUE(rep.awaiting_reply());
    ASSERT_TRUE(rep.reply(make("job/done", 7)).is_ok());
    EXPECT_FALSE(rep.awaiting_reply());

    auto reply = req.receive_reply_timeout(2000);
    ASSERT_TRUE(reply.is_ok());
    ASSERT_TRUE(reply.content().has_value());
    EXPECT_EQ(reply.content()->topic(), "job/done");
    EXPECT_FALSE(req.awaiting_reply());
}

// ============================================================================
// Protocol state
// ============================================================================

TEST_F(ReqRepTest, ReplyBeforeReceiveIsProtocolStateError)
{
    auto rep = BindReplier(UniqueInproc("early"));
    auto status = rep.reply(make("too/early", 0));
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error(), ErrorKind::ProtocolStateError);
    EXPECT_EQ(rep.state(), ExchangeState::Ready);
}

TEST_F(ReqRepTest, SecondReceiveWithoutReplyIsProtocolStateError)
{
    const auto addr = UniqueInproc("double");
    auto rep = BindReplier(addr);
    auto req = ConnectRequester(addr);

    ASSERT_TRUE(req.send_request(make("q", 1)).is_ok());
    auto first = rep.receive_timeout(2000);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(first.content().has_value());

    EXPECT_EQ(rep.receive_timeout(10).error(), ErrorKind::ProtocolStateError);
    EXPECT_EQ(rep.try_receive().error(), ErrorKind::ProtocolStateError);
    EXPECT_EQ(rep.receive().error(), ErrorKind::ProtocolStateError);
    EXPECT_TRUE(rep.awaiting_reply());

    ASSERT_TRUE(rep.reply(make("a", 1)).is_ok());
    auto reply = req.receive_reply_timeout(2000);
    ASSERT_TRUE(reply.is_ok());
    EXPECT_TRUE(reply.content().has_value());
}

TEST_F(ReqRepTest, RequestWhileAwaitingReplyIsProtocolStateError)
{
    const auto addr = UniqueInproc("busy");
    auto rep = BindReplier(addr);
    auto req = ConnectRequester(addr);

    ASSERT_TRUE(req.send_request(make("first", 1)).is_ok());
    EXPECT_EQ(req.send_request(make("second", 2)).error(), ErrorKind::ProtocolStateError);
    EXPECT_EQ(req.request(make("third", 3)).error(), ErrorKind::ProtocolStateError);
    EXPECT_EQ(req.request_timeout(make("fourth", 4), 10).error(), ErrorKind::ProtocolStateError);
    EXPECT_TRUE(req.awaiting_reply());

    // The replier still sees only the first request.
    auto request = rep.receive_timeout(2000);
    ASSERT_TRUE(request.is_ok());
    ASSERT_TRUE(request.content().has_value());
    EXPECT_EQ(request.content()->topic(), "first");
    EXPECT_TRUE(rep.try_receive().is_error());
}

TEST_F(ReqRepTest, ReceiveReplyWithoutRequestIsProtocolStateError)
{
    auto req = ConnectRequester(UniqueInproc("idle"));
    EXPECT_EQ(req.receive_reply().error(), ErrorKind::ProtocolStateError);
    EXPECT_EQ(req.receive_reply_timeout(10).error(), ErrorKind::ProtocolStateError);
}

TEST_F(ReqRepTest, ReplierTimeoutLeavesItReady)
{
    auto rep = BindReplier(UniqueInproc("quiet"));
    auto got = rep.receive_timeout(50);
    ASSERT_TRUE(got.is_ok());
    EXPECT_FALSE(got.content().has_value());
    EXPECT_EQ(rep.state(), ExchangeState::Ready);
}

// ============================================================================
// Timeouts
// ============================================================================

TEST_F(ReqRepTest, ReceiveReplyTimeoutKeepsRequestOutstanding)
{
    const auto addr = UniqueInproc("slow");
    auto rep = BindReplier(addr);
    auto req = ConnectRequester(addr);

    ASSERT_TRUE(req.send_request(make("slow/job", 1)).is_ok());
    auto none = req.receive_reply_timeout(50);
    ASSERT_TRUE(none.is_ok());
    EXPECT_FALSE(none.content().has_value());
    EXPECT_TRUE(req.awaiting_reply());

    auto request = rep.receive_timeout(2000);
    ASSERT_TRUE(request.is_ok());
    ASSERT_TRUE(request.content().has_value());
    ASSERT_TRUE(rep.reply(make("slow/done", 1)).is_ok());

    auto reply = req.receive_reply_timeout(2000);
    ASSERT_TRUE(reply.is_ok());
    ASSERT_TRUE(reply.content().has_value());
    EXPECT_EQ(reply.content()->topic(), "slow/done");
}

TEST_F(ReqRepTest, RequestTimeoutAbandonsAndLateReplyIsDropped)
{
    const auto addr = UniqueInproc("abandon");
    auto rep = BindReplier(addr);
    auto req = ConnectRequester(addr);

    std::jthread server([replier = std::move(rep)]() mutable {
        auto first = replier.receive();
        ASSERT_TRUE(first.is_ok());
        std::this_thread::sleep_for(300ms);
        ASSERT_TRUE(replier.reply(make("late", first.content().payload())).is_ok());

        auto second = replier.receive();
        ASSERT_TRUE(second.is_ok());
        ASSERT_TRUE(replier.reply(make("fresh", second.content().payload())).is_ok());
    });

    auto timed_out = req.request_timeout(make("attempt", 1), 100);
    ASSERT_TRUE(timed_out.is_ok());
    EXPECT_FALSE(timed_out.content().has_value());
    EXPECT_EQ(req.state(), ExchangeState::Ready);

    auto retried = req.request_timeout(make("attempt", 2), 5000);
    ASSERT_TRUE(retried.is_ok());
    ASSERT_TRUE(retried.content().has_value());
    EXPECT_EQ(retried.content()->topic(), "fresh");
    EXPECT_EQ(retried.content()->payload(), 2);
    server.join();
}

// ============================================================================
// Malformed requests and load balancing
// ============================================================================

TEST_F(ReqRepTest, MalformedRequestStillExpectsAReply)
{
    const auto addr = UniqueInproc("garbage");
    auto rep = BindReplier(addr);
    auto raw = TransportSocket::open(SocketPattern::Req, SocketRole::Connect, {addr});
    ASSERT_TRUE(raw.is_ok());

    ASSERT_TRUE(raw.content().send_frames({"only-topic"}).is_ok());
    auto request = rep.receive_timeout(2000);
    ASSERT_TRUE(request.is_error());
    EXPECT_EQ(request.error(), ErrorKind::MalformedMessage);
    EXPECT_TRUE(rep.awaiting_reply());

    ASSERT_TRUE(rep.reply(make("error", {{"kind", "MalformedMessage"}})).is_ok());
    auto reply = raw.content().receive_timeout(2000);
    ASSERT_TRUE(reply.is_ok());
    ASSERT_TRUE(reply.content().has_value());
    EXPECT_EQ(reply.content()->topic(), "error");
}

TEST_F(ReqRepTest, RequestsAreSpreadAcrossRepliers)
{
    const auto addr_a = UniqueInproc("a");
    const auto addr_b = UniqueInproc("b");
    auto serve = [](std::stop_token stop, Replier replier, std::string id) {
        while (!stop.stop_requested())
        {
            auto request = replier.receive_timeout(50);
            if (request.is_ok() && request.content().has_value())
            {
                ASSERT_TRUE(replier.reply(Message::create("served", id).content()).is_ok());
            }
        }
    };
    std::jthread server_a(serve, BindReplier(addr_a), "a");
    std::jthread server_b(serve, BindReplier(addr_b), "b");

    auto connected = Requester::connect(std::vector<std::string>{addr_a, addr_b});
    ASSERT_TRUE(connected.is_ok());
    auto req = std::move(connected).content();

    std::set<std::string> servers;
    for (int i = 0; i < 6; ++i)
    {
        auto reply = req.request_timeout(make("work", i), 5000);
        ASSERT_TRUE(reply.is_ok());
        ASSERT_TRUE(reply.content().has_value());
        servers.insert(reply.content()->payload().get<std::string>());
    }
    server_a.request_stop();
    server_b.request_stop();
    server_a.join();
    server_b.join();

    EXPECT_EQ(servers, (std::set<std::string>{"a", "b"}));
}
