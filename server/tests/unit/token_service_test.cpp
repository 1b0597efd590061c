#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "roomgate/access_token.hpp"
#include "roomgate/token_service.hpp"
#include "support/fake_room_backend.hpp"

namespace {

using boost::beast::http::status;
using Clock = std::chrono::system_clock;

constexpr const char* kRoom = "kairos-1700000000-ab12cd";

class TokenServiceFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_ = std::make_shared<roomgate_test::FakeBackendState>();
    credentials_ = std::make_shared<roomgate_test::MutableCredentials>();
    credentials_->Set(roomgate_test::TestCredentials());
    observability_ = std::make_shared<roomgate::Observability>(roomgate::LogLevel::kError);
  }

  roomgate::TokenService MakeService(roomgate::ProvisioningPolicy policy = roomgate::ProvisioningPolicy::kLenient) {
    roomgate::TokenServiceOptions options;
    options.policy = policy;
    return roomgate::TokenService(roomgate_test::MakeCredentialSource(credentials_),
                                  roomgate_test::MakeFakeBackendFactory(backend_), options, observability_);
  }

  static roomgate::TokenRequest Request(std::optional<std::string> room, std::optional<std::string> username) {
    roomgate::TokenRequest request;
    request.room = std::move(room);
    request.username = std::move(username);
    request.trace_id = "test";
    return request;
  }

  std::optional<roomgate::AccessTokenClaims> Decode(const roomgate::TokenReply& reply,
                                                    Clock::time_point now = Clock::now()) {
    return roomgate::VerifyAccessToken(reply.body["token"].get<std::string>(),
                                       roomgate_test::TestCredentials().api_secret, now);
  }

  std::shared_ptr<roomgate_test::FakeBackendState> backend_;
  std::shared_ptr<roomgate_test::MutableCredentials> credentials_;
  std::shared_ptr<roomgate::Observability> observability_;
};

}  // namespace

TEST_F(TokenServiceFixture, IssuesTokenAndEndpointForValidRequest) {
  auto service = MakeService();
  auto reply = service.Handle(Request(kRoom, "Alex"));

  ASSERT_EQ(reply.status, status::ok);
  EXPECT_EQ(reply.body.size(), 2u);
  EXPECT_EQ(reply.body["url"], "wss://kairos.livekit.example");

  auto claims = Decode(reply);
  ASSERT_TRUE(claims.has_value());
  EXPECT_EQ(claims->identity, "Alex");
  EXPECT_TRUE(claims->video == roomgate::TokenIssuer::SessionGrant(kRoom));
  EXPECT_EQ(backend_->CallCount(), 1u);
}

TEST_F(TokenServiceFixture, MissingParametersAreRejectedWithoutSideEffects) {
  auto service = MakeService();
  for (const auto& request : {Request("", "Alex"), Request(kRoom, ""), Request(std::nullopt, "Alex"),
                              Request(kRoom, std::nullopt), Request("   ", "Alex"), Request(kRoom, "\t ")}) {
    auto reply = service.Handle(request);
    EXPECT_EQ(reply.status, status::bad_request);
    EXPECT_EQ(reply.body, (nlohmann::json{{"error", "Missing room or username"}}));
    EXPECT_FALSE(reply.room.has_value());
  }
  EXPECT_EQ(backend_->factory_calls, 0);
  EXPECT_EQ(backend_->CallCount(), 0u);
  EXPECT_EQ(observability_->Snapshot().tokens_issued, 0u);
}

TEST_F(TokenServiceFixture, AnyMissingConfigValueFailsEveryRequest) {
  auto service = MakeService();
  auto strip = [](int which) {
    auto credentials = roomgate_test::TestCredentials();
    if (which == 0) {
      credentials.api_key.clear();
    } else if (which == 1) {
      credentials.api_secret.clear();
    } else {
      credentials.service_url.clear();
    }
    return credentials;
  };
  for (int which = 0; which < 3; ++which) {
    credentials_->Set(strip(which));
    for (const auto& request : {Request(kRoom, "Alex"), Request("", "Alex"), Request(std::nullopt, std::nullopt)}) {
      auto reply = service.Handle(request);
      EXPECT_EQ(reply.status, status::internal_server_error);
      EXPECT_EQ(reply.body, (nlohmann::json{{"error", "Server configuration error"}}));
    }
  }
  EXPECT_EQ(backend_->factory_calls, 0);
  EXPECT_EQ(observability_->Snapshot().tokens_issued, 0u);
}

TEST_F(TokenServiceFixture, RecoversWhenConfigurationIsRestored) {
  auto service = MakeService();
  auto broken = roomgate_test::TestCredentials();
  broken.api_key.clear();
  credentials_->Set(broken);
  EXPECT_EQ(service.Handle(Request(kRoom, "Alex")).status, status::internal_server_error);

  credentials_->Set(roomgate_test::TestCredentials());
  EXPECT_EQ(service.Handle(Request(kRoom, "Alex")).status, status::ok);
}

TEST_F(TokenServiceFixture, SecondParticipantInSameRoomSucceeds) {
  auto service = MakeService();
  auto first = service.Handle(Request(kRoom, "Alex"));
  auto second = service.Handle(Request(kRoom, "Sam"));

  ASSERT_EQ(first.status, status::ok);
  ASSERT_EQ(second.status, status::ok);
  EXPECT_EQ(Decode(second)->identity, "Sam");
  EXPECT_EQ(backend_->CallCount(), 2u);
  EXPECT_EQ(backend_->rooms.size(), 1u);

  auto snapshot = observability_->Snapshot();
  EXPECT_EQ(snapshot.rooms_created, 1u);
  EXPECT_EQ(snapshot.rooms_existing, 1u);
  EXPECT_EQ(snapshot.tokens_issued, 2u);
}

TEST_F(TokenServiceFixture, TokenValidForOneHourFromIssue) {
  auto service = MakeService();
  auto issued_at = Clock::time_point(std::chrono::seconds(1700000000));
  auto reply = service.Handle(Request(kRoom, "Alex"), issued_at);
  ASSERT_EQ(reply.status, status::ok);

  EXPECT_TRUE(Decode(reply, issued_at + std::chrono::minutes(59)).has_value());
  EXPECT_FALSE(Decode(reply, issued_at + std::chrono::minutes(61)).has_value());
}

TEST_F(TokenServiceFixture, TrimmedValuesAreUsed) {
  auto service = MakeService();
  auto reply = service.Handle(Request("  room-1 ", " Alex\n"));
  ASSERT_EQ(reply.status, status::ok);
  auto claims = Decode(reply);
  ASSERT_TRUE(claims.has_value());
  EXPECT_EQ(claims->identity, "Alex");
  EXPECT_EQ(claims->video.room, "room-1");
  EXPECT_EQ(backend_->calls.front().name, "room-1");
  EXPECT_EQ(reply.room, std::optional<std::string>("room-1"));
}

TEST_F(TokenServiceFixture, ConcurrentRequestsForSameRoomAllSucceed) {
  constexpr int kParticipants = 16;
  auto service = MakeService();
  std::vector<roomgate::TokenReply> replies(kParticipants);
  std::vector<std::thread> threads;
  for (int i = 0; i < kParticipants; ++i) {
    threads.emplace_back([&service, &replies, i]() {
      replies[i] = service.Handle(Request("shared-room", "user-" + std::to_string(i)));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (int i = 0; i < kParticipants; ++i) {
    ASSERT_EQ(replies[i].status, status::ok) << "participant " << i;
    auto claims = Decode(replies[i]);
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ(claims->identity, "user-" + std::to_string(i));
    EXPECT_EQ(claims->video.room, "shared-room");
  }
  EXPECT_EQ(backend_->CallCount(), static_cast<std::size_t>(kParticipants));
  EXPECT_EQ(backend_->rooms.size(), 1u);

  auto snapshot = observability_->Snapshot();
  EXPECT_EQ(snapshot.tokens_issued, static_cast<std::uint64_t>(kParticipants));
  EXPECT_EQ(snapshot.rooms_created, 1u);
  EXPECT_EQ(snapshot.rooms_existing, static_cast<std::uint64_t>(kParticipants - 1));
}

TEST_F(TokenServiceFixture, LenientPolicyIssuesTokenWhenProvisioningFails) {
  auto service = MakeService();
  for (auto outcome : {roomgate::ProvisionOutcome::kTransientFailure, roomgate::ProvisionOutcome::kRejected}) {
    backend_->forced_outcome = outcome;
    auto reply = service.Handle(Request(kRoom, "Alex"));
    EXPECT_EQ(reply.status, status::ok);
    EXPECT_TRUE(Decode(reply).has_value());
  }
  backend_->forced_outcome.reset();
  backend_->throw_on_create = true;
  EXPECT_EQ(service.Handle(Request(kRoom, "Alex")).status, status::ok);
  EXPECT_EQ(observability_->Snapshot().provision_failures, 3u);
}

TEST_F(TokenServiceFixture, StrictPolicySurfacesProvisioningFailures) {
  auto service = MakeService(roomgate::ProvisioningPolicy::kStrict);

  backend_->forced_outcome = roomgate::ProvisionOutcome::kTransientFailure;
  auto unavailable = service.Handle(Request(kRoom, "Alex"));
  EXPECT_EQ(unavailable.status, status::service_unavailable);
  EXPECT_EQ(unavailable.body, (nlohmann::json{{"error", "Room provisioning unavailable"}}));

  backend_->forced_outcome = roomgate::ProvisionOutcome::kRejected;
  auto rejected = service.Handle(Request(kRoom, "Alex"));
  EXPECT_EQ(rejected.status, status::bad_gateway);
  EXPECT_EQ(rejected.room, std::optional<std::string>(kRoom));
  EXPECT_EQ(rejected.body, (nlohmann::json{{"error", "Room provisioning failed"}}));

  backend_->forced_outcome = roomgate::ProvisionOutcome::kAlreadyExists;
  EXPECT_EQ(service.Handle(Request(kRoom, "Alex")).status, status::ok);
  EXPECT_EQ(observability_->Snapshot().tokens_issued, 1u);
}

TEST_F(TokenServiceFixture, UnsignableIdentityIsServerError) {
  auto service = MakeService();
  auto reply = service.Handle(Request(kRoom, "\xff\xfe"));
  EXPECT_EQ(reply.status, status::internal_server_error);
  EXPECT_EQ(reply.body, (nlohmann::json{{"error", "Failed to issue token"}}));
}

TEST_F(TokenServiceFixture, BackendReceivesRequestCredentials) {
  auto service = MakeService();
  service.Handle(Request(kRoom, "Alex"));
  ASSERT_EQ(backend_->credentials.size(), 1u);
  EXPECT_EQ(backend_->credentials.front().api_key, "APIkey123");
  EXPECT_EQ(backend_->credentials.front().service_url, "wss://kairos.livekit.example");
}
