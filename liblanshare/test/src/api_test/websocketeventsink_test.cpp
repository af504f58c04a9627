#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

#include <nlohmann/json.hpp>

#include "websocketeventsink.hpp"

#include "websocketsession_mock.hpp"

using namespace ::testing;
using namespace ::lanshare;
using namespace ::lanshare::events;

TEST(WebSocketEventSinkTest, DeliversWireFormat)
{
    auto session = std::make_shared<StrictMock<WebSocketSessionMock>>();
    WebSocketEventSink sink {session, std::chrono::milliseconds {250}};

    std::string sent;
    EXPECT_CALL(*session, send_text(_, std::chrono::milliseconds {250}))
        .WillOnce(DoAll(SaveArg<0>(&sent), Return(true)))
        .WillOnce(Return(false));

    EXPECT_TRUE(sink.deliver(Event {event_type::peer_offline, {{"name", "alice"}}}));
    auto json = nlohmann::json::parse(sent);
    EXPECT_EQ(json["type"], "peer_offline");
    EXPECT_EQ(json["data"]["name"], "alice");

    // A broken connection ends the subscription
    EXPECT_FALSE(sink.deliver(Event {event_type::peer_offline, {{"name", "alice"}}}));
}

TEST(WebSocketEventSinkTest, CloseClosesSession)
{
    auto session = std::make_shared<StrictMock<WebSocketSessionMock>>();
    WebSocketEventSink sink {session, std::chrono::milliseconds {250}};

    EXPECT_CALL(*session, close());
    sink.close();
}
