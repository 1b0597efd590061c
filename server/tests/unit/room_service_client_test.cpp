#include <chrono>

#include <gtest/gtest.h>

#include "roomgate/room_service_client.hpp"
#include "support/fake_room_backend.hpp"

using roomgate::ClassifyCreateRoomResponse;
using roomgate::ParseServiceEndpoint;
using roomgate::ProvisionOutcome;

TEST(ServiceEndpointTest, SecureWebsocketMapsToHttps) {
  auto endpoint = ParseServiceEndpoint("wss://kairos.livekit.example");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_TRUE(endpoint->tls);
  EXPECT_EQ(endpoint->host, "kairos.livekit.example");
  EXPECT_EQ(endpoint->port, "443");
  EXPECT_TRUE(endpoint->base_path.empty());
}

TEST(ServiceEndpointTest, PlainWebsocketKeepsExplicitPort) {
  auto endpoint = ParseServiceEndpoint("ws://localhost:7880");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_FALSE(endpoint->tls);
  EXPECT_EQ(endpoint->host, "localhost");
  EXPECT_EQ(endpoint->port, "7880");
}

TEST(ServiceEndpointTest, PathPrefixIsKeptWithoutTrailingSlash) {
  auto endpoint = ParseServiceEndpoint("HTTPS://rtc.example.com/livekit/?x=1");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_TRUE(endpoint->tls);
  EXPECT_EQ(endpoint->base_path, "/livekit");
}

TEST(ServiceEndpointTest, BracketedIpv6Host) {
  auto endpoint = ParseServiceEndpoint("http://[::1]:7880");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->host, "::1");
  EXPECT_EQ(endpoint->port, "7880");
}

TEST(ServiceEndpointTest, RejectsUnsupportedOrMalformedUrls) {
  EXPECT_FALSE(ParseServiceEndpoint("ftp://example.com").has_value());
  EXPECT_FALSE(ParseServiceEndpoint("localhost:7880").has_value());
  EXPECT_FALSE(ParseServiceEndpoint("ws://").has_value());
  EXPECT_FALSE(ParseServiceEndpoint("ws://host:0").has_value());
  EXPECT_FALSE(ParseServiceEndpoint("ws://host:99999").has_value());
  EXPECT_FALSE(ParseServiceEndpoint("ws://host:abc").has_value());
  EXPECT_FALSE(ParseServiceEndpoint("ws://user:pw@host").has_value());
  EXPECT_FALSE(ParseServiceEndpoint("ws://[::1").has_value());
}

TEST(CreateRoomClassificationTest, SuccessIsCreated) {
  auto result = ClassifyCreateRoomResponse(200, R"({"name":"room-1"})");
  EXPECT_EQ(result.outcome, ProvisionOutcome::kCreated);
  EXPECT_EQ(result.http_status, 200u);
}

TEST(CreateRoomClassificationTest, SuccessWithOldCreationTimeIsExistingRoom) {
  auto requested_at = std::chrono::system_clock::time_point(std::chrono::seconds(1700000600));
  auto as_string = ClassifyCreateRoomResponse(200, R"({"name":"room-1","creation_time":"1700000000"})", requested_at);
  EXPECT_EQ(as_string.outcome, ProvisionOutcome::kAlreadyExists);
  EXPECT_EQ(as_string.http_status, 200u);

  auto as_number = ClassifyCreateRoomResponse(200, R"({"name":"room-1","creation_time":1700000000})", requested_at);
  EXPECT_EQ(as_number.outcome, ProvisionOutcome::kAlreadyExists);
}

TEST(CreateRoomClassificationTest, SuccessWithFreshOrMissingCreationTimeIsCreated) {
  auto requested_at = std::chrono::system_clock::time_point(std::chrono::seconds(1700000600));
  EXPECT_EQ(ClassifyCreateRoomResponse(200, R"({"name":"room-1","creation_time":"1700000598"})", requested_at).outcome,
            ProvisionOutcome::kCreated);
  EXPECT_EQ(ClassifyCreateRoomResponse(200, R"({"name":"room-1"})", requested_at).outcome,
            ProvisionOutcome::kCreated);
  EXPECT_EQ(ClassifyCreateRoomResponse(200, R"({"creation_time":"soon"})", requested_at).outcome,
            ProvisionOutcome::kCreated);
  EXPECT_EQ(ClassifyCreateRoomResponse(200, "not json", requested_at).outcome, ProvisionOutcome::kCreated);
}

TEST(CreateRoomClassificationTest, ConflictIsAlreadyExists) {
  EXPECT_EQ(ClassifyCreateRoomResponse(409, "").outcome, ProvisionOutcome::kAlreadyExists);
  auto coded = ClassifyCreateRoomResponse(400, R"({"code":"already_exists","msg":"room exists"})");
  EXPECT_EQ(coded.outcome, ProvisionOutcome::kAlreadyExists);
  EXPECT_EQ(coded.message, "room exists");
}

TEST(CreateRoomClassificationTest, ServerSideErrorsAreTransient) {
  EXPECT_EQ(ClassifyCreateRoomResponse(503, "upstream down").outcome, ProvisionOutcome::kTransientFailure);
  EXPECT_EQ(ClassifyCreateRoomResponse(500, R"({"code":"internal"})").outcome, ProvisionOutcome::kTransientFailure);
  EXPECT_EQ(ClassifyCreateRoomResponse(429, "").outcome, ProvisionOutcome::kTransientFailure);
}

TEST(CreateRoomClassificationTest, AuthErrorsAreRejected) {
  auto result = ClassifyCreateRoomResponse(401, R"({"code":"unauthenticated","msg":"invalid token"})");
  EXPECT_EQ(result.outcome, ProvisionOutcome::kRejected);
  EXPECT_EQ(result.http_status, 401u);
  EXPECT_EQ(result.message, "invalid token");
}

TEST(RoomServiceClientTest, MalformedUrlIsRejectedWithoutNetwork) {
  roomgate::RoomServiceClient client(roomgate_test::TestCredentials("not a url"), std::chrono::milliseconds(100));
  roomgate::RoomOptions options;
  options.name = "room-1";
  auto result = client.CreateRoom(options);
  EXPECT_EQ(result.outcome, ProvisionOutcome::kRejected);
  EXPECT_EQ(result.http_status, 0u);
}
