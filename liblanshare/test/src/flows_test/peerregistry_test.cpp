#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "iothreadpool.hpp"
#include "peerregistryimpl.hpp"
#include "testutils.hpp"

#include "peerregistrylistener_mock.hpp"

using namespace ::testing;
using namespace ::lanshare::flows;
using namespace ::lanshare::network;
using namespace ::lanshare::utils;

namespace
{
class PeerRegistryTest : public Test
{
protected:
    void SetUp() override
    {
        io_executer_ = std::make_shared<IOThreadPool>();
        listener_    = std::make_shared<NiceMock<PeerRegistryListenerMock>>();
    }

    std::unique_ptr<PeerRegistryImpl> make_registry(
        std::chrono::milliseconds reaper_period = std::chrono::milliseconds {10000})
    {
        auto registry = std::make_unique<PeerRegistryImpl>(
            io_executer_, reaper_period, liveness_, retention_);
        registry->register_listener(listener_);
        return registry;
    }

    static auto later(std::chrono::milliseconds delta)
    {
        return PeerRegistry::Clock::now() + delta;
    }

    std::shared_ptr<Executer>                 io_executer_;
    std::shared_ptr<PeerRegistryListenerMock> listener_;
    const std::chrono::milliseconds           liveness_ {60000};
    const std::chrono::milliseconds           retention_ {300000};
    const Endpoint alice_ {testutils::make_endpoint("192.168.1.10", 8080)};
    const Endpoint bob_ {testutils::make_endpoint("192.168.1.11", 8080)};
};
}  // namespace

TEST_F(PeerRegistryTest, Upsert_NewRefreshedBackOnline)
{
    auto registry = make_registry();

    EXPECT_EQ(registry->upsert("alice", alice_), PeerRegistry::UpsertResult::NEW);
    EXPECT_EQ(registry->upsert("alice", alice_), PeerRegistry::UpsertResult::REFRESHED);

    registry->reap(later(liveness_ + std::chrono::milliseconds {1}));
    EXPECT_EQ(registry->upsert("alice", alice_), PeerRegistry::UpsertResult::BACK_ONLINE);
}

TEST_F(PeerRegistryTest, Upsert_KeyedByAddressUpdatesName)
{
    auto registry = make_registry();

    registry->upsert("alice", alice_);
    registry->upsert("alice-renamed", alice_);

    auto peers = registry->list_online();
    ASSERT_EQ(peers.size(), 1);
    EXPECT_EQ(peers[0].display_name, "alice-renamed");
    EXPECT_EQ(peers[0].address, alice_);
    EXPECT_TRUE(peers[0].online);
}

TEST_F(PeerRegistryTest, Resolve_OnlineNamesOnly)
{
    auto registry = make_registry();

    registry->upsert("alice", alice_);
    EXPECT_EQ(registry->resolve("alice"), alice_);
    EXPECT_FALSE(registry->resolve("carol"));

    registry->reap(later(liveness_ + std::chrono::milliseconds {1}));
    EXPECT_FALSE(registry->resolve("alice"));
}

TEST_F(PeerRegistryTest, OfflineEventEmittedExactlyOnce)
{
    auto registry = make_registry();
    registry->upsert("alice", alice_);
    registry->upsert("bob", bob_);

    EXPECT_CALL(*listener_, on_peer_offline(Field(&Peer::address, alice_))).Times(1);
    EXPECT_CALL(*listener_, on_peer_offline(Field(&Peer::address, bob_))).Times(0);

    // bob keeps answering, alice does not
    auto past_liveness = later(liveness_ + std::chrono::milliseconds {1000});
    registry->upsert("bob", bob_);
    registry->reap(past_liveness - std::chrono::milliseconds {1000} + liveness_ / 2);
    registry->reap(past_liveness);
    registry->reap(past_liveness + std::chrono::milliseconds {1000});

    auto online = registry->list_online();
    ASSERT_EQ(online.size(), 1);
    EXPECT_EQ(online[0].address, bob_);

    auto alice = registry->find(alice_);
    ASSERT_TRUE(alice);
    EXPECT_FALSE(alice->online);
}

TEST_F(PeerRegistryTest, EvictedAfterRetention)
{
    auto registry = make_registry();
    registry->upsert("alice", alice_);

    EXPECT_CALL(*listener_, on_peer_offline(_)).Times(1);

    registry->reap(later(liveness_ + std::chrono::milliseconds {1}));
    EXPECT_TRUE(registry->find(alice_));

    registry->reap(later(retention_ + std::chrono::milliseconds {1}));
    EXPECT_FALSE(registry->find(alice_));
}

TEST_F(PeerRegistryTest, OfflineAndEvictionInSamePass)
{
    auto registry = make_registry();
    registry->upsert("alice", alice_);

    EXPECT_CALL(*listener_, on_peer_offline(Field(&Peer::display_name, "alice"))).Times(1);

    registry->reap(later(retention_ + std::chrono::milliseconds {1}));
    EXPECT_FALSE(registry->find(alice_));
}

TEST_F(PeerRegistryTest, ReaperTimerRunsPeriodically)
{
    auto registry = std::make_unique<PeerRegistryImpl>(io_executer_, std::chrono::milliseconds {10},
        std::chrono::milliseconds {20}, std::chrono::milliseconds {100000});
    registry->register_listener(listener_);

    std::atomic_bool offline {false};
    ON_CALL(*listener_, on_peer_offline(_)).WillByDefault([&](const Peer &) { offline = true; });

    registry->upsert("alice", alice_);
    registry->start();

    EXPECT_TRUE(testutils::wait_for([&] { return offline.load(); }, 2000));
    registry->stop();
    EXPECT_TRUE(registry->list_online().empty());
}
