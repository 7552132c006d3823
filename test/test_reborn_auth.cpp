#include "doctest.h"

#include "fakes.hpp"
#include "reborn_auth.hpp"
#include "trainer_err.hpp"

#include <vector>

using namespace trainer_link;

namespace {
std::vector<uint8_t> replyFor(const RebornHandshake::Challenge& challenge)
{
    std::vector<uint8_t> reply = {0xAA, 0x09, 0x8A, 0x03, 0, 0, 0, 0, 0};
    RebornHandshake::ExpectedResponse(challenge, reply.data() + 4);
    return reply;
}
}

TEST_CASE("RebornHandshake: challenge layout") {
    RebornHandshake hs(test::CountingFill);
    RebornHandshake::Challenge challenge{};
    REQUIRE(hs.BeginChallenge(challenge) == ESP_OK);
    CHECK(hs.State() == AuthState::ChallengeSent);

    CHECK(challenge[0] == 0xAA);
    CHECK(challenge[1] == 0x0F);
    CHECK(challenge[2] == 0x8A);
    CHECK(challenge[3] == 0x03);
    for (size_t i = 0; i < 10; ++i) {
        CHECK(challenge[4 + i] == i + 1);
    }
    CHECK(challenge[14] == RebornHandshake::SumChecksum(challenge.data(), 14));
}

TEST_CASE("RebornHandshake: expected response adds the fixed key") {
    RebornHandshake hs(test::CountingFill);
    RebornHandshake::Challenge challenge{};
    REQUIRE(hs.BeginChallenge(challenge) == ESP_OK);

    uint8_t expected[RebornHandshake::RESPONSE_SIZE_];
    RebornHandshake::ExpectedResponse(challenge, expected);
    CHECK(expected[0] == 0x1C);
    CHECK(expected[1] == 0x2E);
    CHECK(expected[2] == 0x8B);
    CHECK(expected[3] == 0x20);
    CHECK(expected[4] == 0xFF);
}

TEST_CASE("RebornHandshake: correct reply is accepted") {
    RebornHandshake hs(test::CountingFill);
    RebornHandshake::Challenge challenge{};
    REQUIRE(hs.BeginChallenge(challenge) == ESP_OK);

    const auto reply = replyFor(challenge);
    RebornHandshake::Verdict verdict{};
    CHECK(hs.HandleReply(reply.data(), reply.size(), verdict) == ESP_OK);
    CHECK(hs.IsVerified());
    CHECK(verdict == RebornHandshake::Verdict{0xAA, 0x06, 0x80, 0xE1, 0x00, 0x11});
}

TEST_CASE("RebornHandshake: any single wrong response byte is rejected") {
    for (size_t pos = 4; pos < 9; ++pos) {
        CAPTURE(pos);
        RebornHandshake hs(test::CountingFill);
        RebornHandshake::Challenge challenge{};
        REQUIRE(hs.BeginChallenge(challenge) == ESP_OK);

        auto reply = replyFor(challenge);
        reply[pos] ^= 0x01;
        RebornHandshake::Verdict verdict{};
        CHECK(hs.HandleReply(reply.data(), reply.size(), verdict) == ERR_AUTHENTICATION_);
        CHECK(hs.State() == AuthState::Rejected);
        CHECK(verdict == RebornHandshake::Verdict{0xAA, 0x06, 0x80, 0xE1, 0x01, 0x12});
    }
}

TEST_CASE("RebornHandshake: state errors") {
    RebornHandshake hs(test::CountingFill);
    RebornHandshake::Verdict verdict{};
    const uint8_t reply[] = {0xAA, 0x09, 0x8A, 0x03, 0, 0, 0, 0, 0};
    CHECK(hs.HandleReply(reply, sizeof(reply), verdict) == ESP_ERR_INVALID_STATE);

    RebornHandshake::Challenge challenge{};
    REQUIRE(hs.BeginChallenge(challenge) == ESP_OK);
    CHECK(hs.BeginChallenge(challenge) == ESP_ERR_INVALID_STATE);

    const uint8_t telemetry[16] = {0xAA, 0x10, 0x00, 0x80};
    CHECK(hs.HandleReply(telemetry, sizeof(telemetry), verdict) == ESP_ERR_INVALID_ARG);
    CHECK(hs.State() == AuthState::ChallengeSent);

    // Terminal: a replayed reply after the verdict is refused
    const auto good = replyFor(challenge);
    REQUIRE(hs.HandleReply(good.data(), good.size(), verdict) == ESP_OK);
    CHECK(hs.HandleReply(good.data(), good.size(), verdict) == ESP_ERR_INVALID_STATE);

    hs.Reset();
    CHECK(hs.State() == AuthState::Idle);
    CHECK(hs.BeginChallenge(challenge) == ESP_OK);
}

TEST_CASE("RebornHandshake: frame classification") {
    const uint8_t reply[] = {0xAA, 0x09, 0x8A, 0x03, 0, 0, 0, 0, 0};
    CHECK(RebornHandshake::Classify(reply, sizeof(reply)) == RebornFrame::AuthReply);
    CHECK(RebornHandshake::Classify(reply, 8) == RebornFrame::Other);

    const uint8_t failure[] = {0xAA, 0x06, 0x80, 0xE1, 0x01};
    CHECK(RebornHandshake::Classify(failure, sizeof(failure)) == RebornFrame::DeviceFailure);

    const uint8_t telemetry[16] = {0xAA, 0x10, 0x00, 0x80};
    CHECK(RebornHandshake::Classify(telemetry, sizeof(telemetry)) == RebornFrame::Telemetry);

    CHECK(RebornHandshake::Classify(nullptr, 0) == RebornFrame::Other);
}
