#include "control/control_listener.h"
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <zmq.hpp>

using namespace facewatch;

class ControlListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher_.on("ping", [](const ControlCommand&) { return ControlReply::success("pong"); });
        dispatcher_.on("echo", [](const ControlCommand& c) { return ControlReply::success(c.argument); });
        dispatcher_.on("boom", [](const ControlCommand&) -> ControlReply {
            throw std::runtime_error("exploded");
        });
        ASSERT_TRUE(listener_.open("127.0.0.1", 0));
        ASSERT_GT(listener_.port(), 0);
    }

    zmq::socket_t connectClient() {
        zmq::socket_t client(client_context_, zmq::socket_type::req);
        client.set(zmq::sockopt::linger, 0);
        client.set(zmq::sockopt::rcvtimeo, 2000);
        client.connect("tcp://127.0.0.1:" + std::to_string(listener_.port()));
        return client;
    }

    // Poll the listener until it answers one request
    bool serveWithin(int attempts) {
        for (int attempt = 0; attempt < attempts; attempt++) {
            if (listener_.serveOne(dispatcher_)) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    // Send one request and return the reply
    std::string roundTrip(const std::string& request) {
        zmq::socket_t client = connectClient();
        if (!client.send(zmq::buffer(request), zmq::send_flags::none)) return "<not sent>";
        if (!serveWithin(200)) return "<not served>";

        zmq::message_t reply;
        if (!client.recv(reply, zmq::recv_flags::none)) return "<no reply>";
        return reply.to_string();
    }

    zmq::context_t client_context_;
    ControlDispatcher dispatcher_;
    ControlListener listener_;
};

TEST_F(ControlListenerTest, NothingPendingReturnsImmediately) {
    EXPECT_FALSE(listener_.serveOne(dispatcher_));
}

TEST_F(ControlListenerTest, EndpointNamesBoundPort) {
    EXPECT_EQ(listener_.endpoint(), "tcp://127.0.0.1:" + std::to_string(listener_.port()));
}

TEST_F(ControlListenerTest, RepliesToRequest) {
    EXPECT_EQ(roundTrip("ping"), "ok pong");
}

TEST_F(ControlListenerTest, ArgumentsArePassedThrough) {
    EXPECT_EQ(roundTrip("echo  hello world \r\n"), "ok hello world");
}

TEST_F(ControlListenerTest, UnknownCommand) {
    EXPECT_EQ(roundTrip("frobnicate"), "error unknown command 'frobnicate'");
}

TEST_F(ControlListenerTest, HandlerExceptionBecomesError) {
    EXPECT_EQ(roundTrip("boom"), "error exploded");
}

TEST_F(ControlListenerTest, EmptyRequest) {
    EXPECT_EQ(roundTrip(""), "error empty request");
}

TEST_F(ControlListenerTest, OneReplyPerRequestOnSameConnection) {
    zmq::socket_t client = connectClient();

    for (const std::string request : {"ping", "echo again"}) {
        ASSERT_TRUE(client.send(zmq::buffer(request), zmq::send_flags::none));
        ASSERT_TRUE(serveWithin(200));
        // Nothing further is pending until the client sends again
        EXPECT_FALSE(listener_.serveOne(dispatcher_));

        zmq::message_t reply;
        ASSERT_TRUE(client.recv(reply, zmq::recv_flags::none));
        EXPECT_EQ(reply.to_string(), request == "ping" ? "ok pong" : "ok again");
    }
}

TEST_F(ControlListenerTest, PortInUseFailsToOpen) {
    ControlListener other;
    EXPECT_FALSE(other.open("127.0.0.1", listener_.port()));
    EXPECT_FALSE(other.isOpen());
}

TEST(ControlListenerStatic, ParseRequest) {
    ControlCommand command = ControlListener::parseRequest("  debug   on ");
    EXPECT_EQ(command.name, "debug");
    EXPECT_EQ(command.argument, "on");

    command = ControlListener::parseRequest("status");
    EXPECT_EQ(command.name, "status");
    EXPECT_TRUE(command.argument.empty());
}

TEST(ControlListenerStatic, FormatReply) {
    EXPECT_EQ(ControlListener::formatReply(ControlReply::success()), "ok");
    EXPECT_EQ(ControlListener::formatReply(ControlReply::success("pong")), "ok pong");
    EXPECT_EQ(ControlListener::formatReply(ControlReply::failure("bad")), "error bad");
}

TEST(ControlListenerStatic, ClosedListenerServesNothing) {
    ControlListener listener;
    ControlDispatcher dispatcher;
    EXPECT_FALSE(listener.isOpen());
    EXPECT_FALSE(listener.serveOne(dispatcher));
}
