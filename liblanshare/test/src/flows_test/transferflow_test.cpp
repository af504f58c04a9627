#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "iothreadpool.hpp"
#include "stagingstoreimpl.hpp"
#include "testutils.hpp"
#include "transferflowimpl.hpp"

#include "loopbackremotenodeclient.hpp"
#include "networkinterfaceprovider_mock.hpp"
#include "peerregistry_mock.hpp"
#include "remotenodeclient_mock.hpp"
#include "transferflowlistener_mock.hpp"

using namespace ::testing;
using namespace ::lanshare::flows;
using namespace ::lanshare::protocol;
using namespace ::lanshare::network;
using namespace ::lanshare::storage;
using namespace ::lanshare::utils;

namespace
{
/// Everything one side of a transfer needs.
struct Node
{
    std::string                                   name;
    Endpoint                                      endpoint;
    std::string                                   root_dir;
    std::shared_ptr<StagingStoreImpl>             staging;
    std::shared_ptr<StagingStoreImpl>             inbox;
    std::shared_ptr<NetworkInterfaceProviderMock> interfaces;
    std::shared_ptr<PeerRegistryMock>             registry;
    std::shared_ptr<RemoteNodeClient>             remote_node_client;
    std::shared_ptr<TransferFlowImpl>             flow;
    std::shared_ptr<TransferFlowListenerMock>     listener;

    std::atomic_int requests {0};
    std::atomic_int accepted {0};
    std::atomic_int rejected {0};
    std::atomic_int completed {0};
    std::atomic_int failed {0};

    std::optional<TransferStatus> status(const TransferId &id) const
    {
        auto t = flow->get(id);
        return t ? std::optional<TransferStatus> {t->status} : std::nullopt;
    }

    size_t staged_files() const
    {
        size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator {staging->directory()})
        {
            (void) entry;
            ++count;
        }
        return count;
    }
};

class TransferFlowTest : public Test
{
protected:
    void SetUp() override
    {
        io_executer_ = std::make_shared<IOThreadPool>();
        network_     = std::make_shared<LoopbackNetwork>();
    }

    void TearDown() override
    {
        for (auto *node : {&sender_, &receiver_})
        {
            if (node->flow)
            {
                node->flow->stop();
                node->flow.reset();
                node->staging.reset();
                node->inbox.reset();
                std::filesystem::remove_all(node->root_dir);
            }
        }
    }

    void make_node(Node &node, const std::string &name, const std::string &ip,
        std::shared_ptr<RemoteNodeClient> remote_node_client = nullptr)
    {
        node.name     = name;
        node.endpoint = testutils::make_endpoint(ip, port_);
        node.root_dir = testutils::make_temp_dir("lanshare_" + name);
        node.staging  = std::make_shared<StagingStoreImpl>(node.root_dir + "/staging", "staged");
        node.inbox    = std::make_shared<StagingStoreImpl>(node.root_dir + "/inbox", "received");
        node.interfaces = std::make_shared<NiceMock<NetworkInterfaceProviderMock>>();
        node.registry   = std::make_shared<NiceMock<PeerRegistryMock>>();
        node.listener   = std::make_shared<NiceMock<TransferFlowListenerMock>>();
        node.remote_node_client =
            remote_node_client ? std::move(remote_node_client) :
                                 std::make_shared<LoopbackRemoteNodeClient>(network_, node.endpoint);

        ON_CALL(*node.interfaces, active_ipv4_interfaces())
            .WillByDefault(Return(std::vector<InterfaceAddress> {
                {"eth0", node.endpoint.address, *conversion::to_ipv4_address("255.255.255.0")}}));

        ON_CALL(*node.listener, on_transfer_request(_)).WillByDefault([&node](auto &&) {
            ++node.requests;
        });
        ON_CALL(*node.listener, on_transfer_accepted(_)).WillByDefault([&node](auto &&) {
            ++node.accepted;
        });
        ON_CALL(*node.listener, on_transfer_rejected(_)).WillByDefault([&node](auto &&) {
            ++node.rejected;
        });
        ON_CALL(*node.listener, on_transfer_completed(_)).WillByDefault([&node](auto &&) {
            ++node.completed;
        });
        ON_CALL(*node.listener, on_transfer_failed(_, _)).WillByDefault([&node](auto &&, auto &&) {
            ++node.failed;
        });

        node.flow = std::make_shared<TransferFlowImpl>(node.registry, node.remote_node_client,
            node.staging, node.inbox, node.interfaces, io_executer_, name, port_);
        node.flow->register_listener(node.listener);
        node.flow->start();
        network_->attach(node.endpoint, node.flow);
    }

    /// Sender offers a file to the receiver and returns the transfer id.
    TransferId offer(const std::vector<uint8_t> &bytes, const std::string &file_name = "a.bin")
    {
        Transfer transfer;
        EXPECT_EQ(sender_.flow->initiate(conversion::to_string(receiver_.endpoint.address),
                      file_name, bytes, transfer),
            StatusCode::OK);
        EXPECT_TRUE(testutils::wait_for([&] { return receiver_.requests == 1; }, 2000));
        return transfer.id;
    }

    static TransferMetadata make_metadata(const TransferId &id, FileSize size = 3)
    {
        TransferMetadata metadata;
        metadata.id          = id;
        metadata.file_name   = "notes.txt";
        metadata.size        = size;
        metadata.sender_name = "alice";
        return metadata;
    }

    const unsigned short             port_ = 8080;
    std::shared_ptr<Executer>        io_executer_;
    std::shared_ptr<LoopbackNetwork> network_;
    Node                             sender_;
    Node                             receiver_;
};
}  // namespace

TEST_F(TransferFlowTest, Push10MB_CompletedOnBothSides)
{
    make_node(sender_, "alice", "192.168.1.10");
    make_node(receiver_, "bob", "192.168.1.20");

    const auto bytes = testutils::random_bytes(10 * 1024 * 1024);
    auto       id    = offer(bytes, "video.mp4");

    EXPECT_EQ(sender_.status(id), TransferStatus::PENDING);
    EXPECT_EQ(receiver_.status(id), TransferStatus::PENDING);
    EXPECT_EQ(sender_.staged_files(), 1u);

    auto inbound = receiver_.flow->get(id);
    ASSERT_TRUE(inbound);
    EXPECT_EQ(inbound->direction, TransferDirection::INBOUND);
    EXPECT_EQ(inbound->sender_name, "alice");
    EXPECT_EQ(inbound->sender_address, sender_.endpoint);
    EXPECT_EQ(inbound->size, bytes.size());

    EXPECT_EQ(receiver_.flow->accept(id), StatusCode::OK);

    EXPECT_TRUE(testutils::wait_for(
        [&] { return sender_.completed == 1 && receiver_.completed == 1; }, 5000));
    EXPECT_EQ(sender_.status(id), TransferStatus::COMPLETED);
    EXPECT_EQ(receiver_.status(id), TransferStatus::COMPLETED);
    EXPECT_EQ(sender_.flow->get(id)->size, receiver_.flow->get(id)->size);
    EXPECT_EQ(sender_.staged_files(), 0u);
    EXPECT_EQ(sender_.failed, 0);
    EXPECT_EQ(receiver_.failed, 0);

    std::vector<uint8_t> received;
    std::string          file_name;
    EXPECT_EQ(receiver_.flow->fetch(id, received, file_name), StatusCode::OK);
    EXPECT_EQ(file_name, "video.mp4");
    EXPECT_EQ(received, bytes);

    // The received bytes are handed out once
    EXPECT_EQ(receiver_.flow->fetch(id, received, file_name), StatusCode::NOT_FOUND);
}

TEST_F(TransferFlowTest, Rejection_PropagatesToSenderAndPurgesStaging)
{
    make_node(sender_, "alice", "192.168.1.10");
    make_node(receiver_, "bob", "192.168.1.20");

    auto id = offer(testutils::random_bytes(1000));
    EXPECT_EQ(sender_.staged_files(), 1u);

    EXPECT_EQ(receiver_.flow->reject(id), StatusCode::OK);

    EXPECT_TRUE(testutils::wait_for([&] { return sender_.rejected == 1; }, 2000));
    EXPECT_EQ(receiver_.rejected, 1);
    EXPECT_EQ(sender_.status(id), TransferStatus::REJECTED);
    EXPECT_EQ(receiver_.status(id), TransferStatus::REJECTED);
    EXPECT_EQ(sender_.staged_files(), 0u);
}

TEST_F(TransferFlowTest, Transitions_AreMonotonic)
{
    make_node(sender_, "alice", "192.168.1.10");
    make_node(receiver_, "bob", "192.168.1.20");

    auto rejected_id = offer({1, 2, 3});
    EXPECT_EQ(receiver_.flow->reject(rejected_id), StatusCode::OK);
    EXPECT_EQ(receiver_.flow->accept(rejected_id), StatusCode::INVALID_STATE);
    EXPECT_EQ(receiver_.flow->reject(rejected_id), StatusCode::INVALID_STATE);
    EXPECT_TRUE(testutils::wait_for([&] { return sender_.rejected == 1; }, 2000));
    EXPECT_EQ(sender_.flow->handle_accept_remote(rejected_id), StatusCode::INVALID_STATE);

    receiver_.requests = 0;
    auto completed_id  = offer({4, 5, 6});
    EXPECT_EQ(receiver_.flow->accept(completed_id), StatusCode::OK);
    EXPECT_TRUE(testutils::wait_for([&] { return receiver_.completed == 1; }, 2000));
    EXPECT_EQ(receiver_.flow->reject(completed_id), StatusCode::INVALID_STATE);
    EXPECT_EQ(receiver_.flow->accept(completed_id), StatusCode::INVALID_STATE);
    EXPECT_EQ(receiver_.flow->handle_upload(completed_id, {7}), StatusCode::INVALID_STATE);
    EXPECT_EQ(receiver_.status(completed_id), TransferStatus::COMPLETED);
}

TEST_F(TransferFlowTest, WrongDirectionOrUnknownId_NotFound)
{
    make_node(sender_, "alice", "192.168.1.10");
    make_node(receiver_, "bob", "192.168.1.20");

    auto id = offer({1});

    // Local decisions are for inbound transfers only, remote decisions for outbound ones
    EXPECT_EQ(sender_.flow->accept(id), StatusCode::NOT_FOUND);
    EXPECT_EQ(receiver_.flow->handle_accept_remote(id), StatusCode::NOT_FOUND);
    EXPECT_EQ(receiver_.flow->accept("no-such-id"), StatusCode::NOT_FOUND);
    EXPECT_EQ(receiver_.flow->handle_upload("no-such-id", {1}), StatusCode::NOT_FOUND);

    std::vector<uint8_t> bytes;
    std::string          file_name;
    EXPECT_EQ(sender_.flow->fetch(id, bytes, file_name), StatusCode::NOT_FOUND);
}

TEST_F(TransferFlowTest, UploadBeforeAccept_InvalidState)
{
    make_node(receiver_, "bob", "192.168.1.20", std::make_shared<NiceMock<RemoteNodeClientMock>>());

    EXPECT_EQ(receiver_.flow->handle_notify(
                  make_metadata("1"), testutils::make_endpoint("192.168.1.10", 8080)),
        StatusCode::OK);
    EXPECT_EQ(receiver_.flow->handle_upload("1", {1, 2, 3}), StatusCode::INVALID_STATE);

    std::vector<uint8_t> bytes;
    std::string          file_name;
    EXPECT_EQ(receiver_.flow->fetch("1", bytes, file_name), StatusCode::INVALID_STATE);
}

TEST_F(TransferFlowTest, RepeatedNotify_SingleRequestEvent)
{
    make_node(receiver_, "bob", "192.168.1.20", std::make_shared<NiceMock<RemoteNodeClientMock>>());

    EXPECT_CALL(*receiver_.listener, on_transfer_request(_)).Times(1);

    auto from = testutils::make_endpoint("192.168.1.10", 8080);
    EXPECT_EQ(receiver_.flow->handle_notify(make_metadata("77"), from), StatusCode::OK);
    EXPECT_EQ(receiver_.flow->handle_notify(make_metadata("77"), from), StatusCode::OK);
    EXPECT_EQ(receiver_.flow->list().size(), 1u);
}

TEST_F(TransferFlowTest, Notify_WithoutSenderAddress_UsesConnectionPeer)
{
    make_node(receiver_, "bob", "192.168.1.20", std::make_shared<NiceMock<RemoteNodeClientMock>>());

    EXPECT_EQ(receiver_.flow->handle_notify(
                  make_metadata("5"), testutils::make_endpoint("192.168.1.33", 50123)),
        StatusCode::OK);

    auto t = receiver_.flow->get("5");
    ASSERT_TRUE(t);
    EXPECT_EQ(t->sender_address, testutils::make_endpoint("192.168.1.33", 8080));
    EXPECT_EQ(t->receiver, "bob");
}

TEST_F(TransferFlowTest, NotifyClashingWithOutboundTransfer_InvalidState)
{
    make_node(sender_, "alice", "192.168.1.10");
    make_node(receiver_, "bob", "192.168.1.20");

    auto id = offer({1, 2});

    EXPECT_EQ(sender_.flow->handle_notify(make_metadata(id), receiver_.endpoint),
        StatusCode::INVALID_STATE);
    EXPECT_EQ(sender_.flow->get(id)->direction, TransferDirection::OUTBOUND);
}

TEST_F(TransferFlowTest, ConcurrentAccepts_ExactlyOneSucceeds)
{
    auto remote = std::make_shared<NiceMock<RemoteNodeClientMock>>();
    ON_CALL(*remote, accept_remote(_, _)).WillByDefault([](auto &&, auto &&) {
        return testutils::make_status_future(StatusCode::OK);
    });
    make_node(receiver_, "bob", "192.168.1.20", remote);

    const int rounds       = 20;
    const int thread_count = 2;
    for (int round = 0; round != rounds; ++round)
    {
        auto id = std::to_string(1000 + round);
        ASSERT_EQ(receiver_.flow->handle_notify(
                      make_metadata(id), testutils::make_endpoint("192.168.1.10", 8080)),
            StatusCode::OK);

        std::atomic_int          ok {0};
        std::atomic_int          invalid {0};
        std::vector<std::thread> threads;
        for (int i = 0; i != thread_count; ++i)
        {
            threads.emplace_back([&] {
                auto status = receiver_.flow->accept(id);
                if (status == StatusCode::OK)
                {
                    ++ok;
                }
                else if (status == StatusCode::INVALID_STATE)
                {
                    ++invalid;
                }
            });
        }
        for (auto &t : threads)
        {
            t.join();
        }

        EXPECT_EQ(ok, 1);
        EXPECT_EQ(invalid, thread_count - 1);
    }
    EXPECT_EQ(receiver_.accepted, rounds);
}

TEST_F(TransferFlowTest, NotifyFailure_ReportedTransferStaysPending)
{
    make_node(sender_, "alice", "192.168.1.10");

    // Nobody attached at the receiver endpoint
    Transfer transfer;
    EXPECT_EQ(sender_.flow->initiate("192.168.1.99", "a.txt", {1, 2, 3}, transfer), StatusCode::OK);

    EXPECT_TRUE(testutils::wait_for([&] { return sender_.failed == 1; }, 2000));
    EXPECT_EQ(sender_.status(transfer.id), TransferStatus::PENDING);
}

TEST_F(TransferFlowTest, AcceptRemoteFailure_Reported)
{
    auto remote = std::make_shared<NiceMock<RemoteNodeClientMock>>();
    ON_CALL(*remote, accept_remote(_, _)).WillByDefault([](auto &&, auto &&) {
        return testutils::make_status_future(StatusCode::UNREACHABLE);
    });
    make_node(receiver_, "bob", "192.168.1.20", remote);

    EXPECT_CALL(*receiver_.listener, on_transfer_failed(Field(&Transfer::id, "9"), _));

    receiver_.flow->handle_notify(make_metadata("9"), testutils::make_endpoint("192.168.1.10", 8080));
    EXPECT_EQ(receiver_.flow->accept("9"), StatusCode::OK);
    EXPECT_TRUE(testutils::wait_for([&] { return receiver_.failed == 1; }, 2000));
    EXPECT_EQ(receiver_.status("9"), TransferStatus::ACCEPTED);
}

TEST_F(TransferFlowTest, UploadFailure_ReportedAndStagingKept)
{
    auto remote = std::make_shared<NiceMock<RemoteNodeClientMock>>();
    ON_CALL(*remote, notify_transfer(_, _)).WillByDefault([](auto &&, auto &&) {
        return testutils::make_status_future(StatusCode::OK);
    });
    ON_CALL(*remote, upload(_, _, _)).WillByDefault([](auto &&, auto &&, auto &&) {
        return testutils::make_status_future(StatusCode::UNREACHABLE);
    });
    make_node(sender_, "alice", "192.168.1.10", remote);

    Transfer transfer;
    ASSERT_EQ(sender_.flow->initiate("192.168.1.20", "a.txt", {1, 2, 3}, transfer), StatusCode::OK);
    EXPECT_EQ(sender_.flow->handle_accept_remote(transfer.id), StatusCode::OK);

    EXPECT_TRUE(testutils::wait_for([&] { return sender_.failed == 1; }, 2000));
    EXPECT_EQ(sender_.status(transfer.id), TransferStatus::ACCEPTED);
    EXPECT_EQ(sender_.staged_files(), 1u);
}

TEST_F(TransferFlowTest, Initiate_ByDisplayName)
{
    make_node(sender_, "alice", "192.168.1.10");
    make_node(receiver_, "bob", "192.168.1.20");

    ON_CALL(*sender_.registry, resolve("bob")).WillByDefault(Return(receiver_.endpoint));
    ON_CALL(*sender_.registry, resolve("carol")).WillByDefault(Return(std::nullopt));

    Transfer transfer;
    EXPECT_EQ(sender_.flow->initiate("bob", "a.txt", {1}, transfer), StatusCode::OK);
    EXPECT_EQ(transfer.receiver, "bob");
    EXPECT_EQ(transfer.receiver_address, receiver_.endpoint);
    EXPECT_TRUE(testutils::wait_for([&] { return receiver_.requests == 1; }, 2000));

    EXPECT_EQ(sender_.flow->initiate("carol", "a.txt", {1}, transfer), StatusCode::NOT_FOUND);
    EXPECT_EQ(sender_.flow->initiate("bob", "", {1}, transfer), StatusCode::BAD_REQUEST);
}

TEST_F(TransferFlowTest, Initiate_AnnouncesInterfaceOnReceiverSubnet)
{
    auto remote = std::make_shared<NiceMock<RemoteNodeClientMock>>();
    make_node(sender_, "alice", "192.168.1.10", remote);
    ON_CALL(*sender_.interfaces, active_ipv4_interfaces())
        .WillByDefault(Return(std::vector<InterfaceAddress> {
            {"eth0", *conversion::to_ipv4_address("10.0.0.4"),
                *conversion::to_ipv4_address("255.255.255.0")},
            {"wlan0", *conversion::to_ipv4_address("192.168.7.4"),
                *conversion::to_ipv4_address("255.255.255.0")}}));

    TransferMetadata sent;
    EXPECT_CALL(*remote, notify_transfer(testutils::make_endpoint("192.168.7.30", 8080), _))
        .WillOnce([&](const Endpoint &, const TransferMetadata &metadata) {
            sent = metadata;
            return testutils::make_status_future(StatusCode::OK);
        });

    Transfer transfer;
    ASSERT_EQ(sender_.flow->initiate("192.168.7.30", "a.txt", {1}, transfer), StatusCode::OK);
    EXPECT_EQ(sent.sender_address, testutils::make_endpoint("192.168.7.4", 8080));
    EXPECT_EQ(sent.sender_name, "alice");
    EXPECT_EQ(sent.size, 1u);
}

TEST_F(TransferFlowTest, TransferIdsStrictlyIncrease)
{
    auto remote = std::make_shared<NiceMock<RemoteNodeClientMock>>();
    ON_CALL(*remote, notify_transfer(_, _)).WillByDefault([](auto &&, auto &&) {
        return testutils::make_status_future(StatusCode::OK);
    });
    make_node(sender_, "alice", "192.168.1.10", remote);

    long long previous = 0;
    for (int i = 0; i != 50; ++i)
    {
        Transfer transfer;
        ASSERT_EQ(sender_.flow->initiate("192.168.1.20", "a", {}, transfer), StatusCode::OK);
        auto id = std::stoll(transfer.id);
        EXPECT_GT(id, previous);
        previous = id;
    }
}

TEST_F(TransferFlowTest, NotRunning_Refused)
{
    make_node(sender_, "alice", "192.168.1.10");
    sender_.flow->stop();

    Transfer transfer;
    EXPECT_EQ(sender_.flow->initiate("192.168.1.20", "a", {1}, transfer), StatusCode::INVALID_STATE);
    EXPECT_EQ(sender_.flow->handle_notify(make_metadata("1"), receiver_.endpoint),
        StatusCode::INVALID_STATE);
}

TEST(TransferTest, StatusAndDirectionNames)
{
    EXPECT_STREQ(to_string(TransferStatus::PENDING), "pending");
    EXPECT_STREQ(to_string(TransferStatus::COMPLETED), "completed");
    EXPECT_STREQ(to_string(TransferDirection::INBOUND), "inbound");
}
