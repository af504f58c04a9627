#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "messageserializerimpl.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::lanshare::protocol;
using namespace ::lanshare::network;

namespace
{
class MessageSerializerTest : public Test
{
protected:
    static std::vector<uint8_t> to_bytes(const std::string &str)
    {
        return {str.begin(), str.end()};
    }

    static nlohmann::json to_json(const std::vector<uint8_t> &bytes)
    {
        return nlohmann::json::parse(bytes.begin(), bytes.end());
    }

    MessageSerializerImpl serializer_;
};
}  // namespace

TEST_F(MessageSerializerTest, SerializePeerIdentity)
{
    PeerIdentity identity {"alice@desk", testutils::make_endpoint("192.168.1.10", 8080)};

    auto json = to_json(serializer_.serialize(identity));

    EXPECT_EQ(json["name"], "alice@desk");
    EXPECT_EQ(json["ip"], "192.168.1.10");
    EXPECT_EQ(json["port"], 8080);
}

TEST_F(MessageSerializerTest, DeserializePeerIdentity_NameRequired)
{
    PeerIdentity identity;

    EXPECT_TRUE(serializer_.deserialize(
        to_bytes(R"({"name":"bob","ip":"10.0.0.3","port":9000})"), identity));
    EXPECT_EQ(identity.name, "bob");
    EXPECT_EQ(identity.endpoint, testutils::make_endpoint("10.0.0.3", 9000));

    EXPECT_FALSE(serializer_.deserialize(to_bytes(R"({"ip":"10.0.0.3","port":9000})"), identity));
    EXPECT_FALSE(serializer_.deserialize(to_bytes(R"(<html></html>)"), identity));
    EXPECT_FALSE(serializer_.deserialize(to_bytes(R"(["bob"])"), identity));
}

TEST_F(MessageSerializerTest, SerializeMetadata_WithSenderAddress)
{
    TransferMetadata metadata;
    metadata.id             = "1700000000000000001";
    metadata.file_name      = "notes.txt";
    metadata.size           = 42;
    metadata.sender_name    = "alice@desk";
    metadata.sender_address = testutils::make_endpoint("192.168.1.10", 8080);
    metadata.receiver       = "192.168.1.20";

    auto json = to_json(serializer_.serialize(metadata));

    EXPECT_EQ(json["id"], "1700000000000000001");
    EXPECT_EQ(json["filename"], "notes.txt");
    EXPECT_EQ(json["size"], 42);
    EXPECT_EQ(json["from"], "alice@desk");
    EXPECT_EQ(json["to"], "192.168.1.20");
    EXPECT_EQ(json["status"], "pending");
    EXPECT_EQ(json["fromIP"], "192.168.1.10");
    EXPECT_EQ(json["fromPort"], 8080);
}

TEST_F(MessageSerializerTest, SerializeMetadata_WithoutSenderAddress)
{
    TransferMetadata metadata;
    metadata.id        = "7";
    metadata.file_name = "a.bin";

    auto json = to_json(serializer_.serialize(metadata));

    EXPECT_FALSE(json.contains("fromIP"));
    EXPECT_FALSE(json.contains("fromPort"));
}

TEST_F(MessageSerializerTest, DeserializeMetadata)
{
    TransferMetadata metadata;

    ASSERT_TRUE(serializer_.deserialize(
        to_bytes(R"({"id":"5","filename":"x.png","size":1024,"from":"carol","to":"dave",)"
                 R"("status":"pending","fromIP":"10.1.2.3","fromPort":8081})"),
        metadata));
    EXPECT_EQ(metadata.id, "5");
    EXPECT_EQ(metadata.file_name, "x.png");
    EXPECT_EQ(metadata.size, 1024);
    EXPECT_EQ(metadata.sender_name, "carol");
    EXPECT_EQ(metadata.receiver, "dave");
    EXPECT_EQ(metadata.sender_address, testutils::make_endpoint("10.1.2.3", 8081));
}

TEST_F(MessageSerializerTest, DeserializeMetadata_RequiredFields)
{
    TransferMetadata metadata;

    EXPECT_FALSE(serializer_.deserialize(to_bytes(R"({"filename":"x","size":1})"), metadata));
    EXPECT_FALSE(serializer_.deserialize(to_bytes(R"({"id":"1","size":1})"), metadata));
    EXPECT_FALSE(serializer_.deserialize(to_bytes(R"({"id":"1","filename":"x"})"), metadata));
    EXPECT_FALSE(
        serializer_.deserialize(to_bytes(R"({"id":"1","filename":"x","size":-4})"), metadata));
    EXPECT_FALSE(serializer_.deserialize(to_bytes("{"), metadata));
}
