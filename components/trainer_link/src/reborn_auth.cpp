/**
 * @file reborn_auth.cpp
 * @brief Reborn handshake state machine
 */

#include "reborn_auth.hpp"
#include "trainer_err.hpp"
#include "esp_log.h"
#include "esp_random.h"

#include <cstring>

static const char* TAG_ = "reborn_auth";

namespace trainer_link {

namespace {

constexpr uint8_t CHALLENGE_HEADER_[4] = {0xAA, 0x0F, 0x8A, 0x03};
constexpr uint8_t VERDICT_ACCEPT_[RebornHandshake::VERDICT_SIZE_] = {0xAA, 0x06, 0x80, 0xE1, 0x00, 0x11};
constexpr uint8_t VERDICT_REJECT_[RebornHandshake::VERDICT_SIZE_] = {0xAA, 0x06, 0x80, 0xE1, 0x01, 0x12};

constexpr size_t AUTH_REPLY_MIN_LEN_  = 9;
constexpr size_t FAILURE_MIN_LEN_     = 5;
constexpr size_t TELEMETRY_LEN_       = 16;

} // namespace

const char* ToString(AuthState state) noexcept
{
    switch (state) {
        case AuthState::Idle:          return "Idle";
        case AuthState::ChallengeSent: return "ChallengeSent";
        case AuthState::Verified:      return "Verified";
        case AuthState::Rejected:      return "Rejected";
    }
    return "Unknown";
}

RebornHandshake::RebornHandshake(RandomFillFn fill) noexcept
    : fill_(fill ? fill : esp_fill_random)
    , state_(AuthState::Idle)
    , challenge_{}
{
}

uint8_t RebornHandshake::SumChecksum(const uint8_t* data, size_t len) noexcept
{
    uint32_t sum = 0;
    for (size_t i = 0; i < len; ++i) {
        sum += data[i];
    }
    return static_cast<uint8_t>(sum & 0xFF);
}

void RebornHandshake::ExpectedResponse(const Challenge& challenge, uint8_t out[RESPONSE_SIZE_]) noexcept
{
    for (size_t i = 0; i < RESPONSE_SIZE_; ++i) {
        out[i] = static_cast<uint8_t>((challenge[4 + i] + challenge[9 + i] + KEY_[i]) & 0xFF);
    }
}

esp_err_t RebornHandshake::BeginChallenge(Challenge& out) noexcept
{
    if (state_ != AuthState::Idle) {
        ESP_LOGW(TAG_, "Challenge refused in state %s", ToString(state_));
        return ESP_ERR_INVALID_STATE;
    }

    std::memcpy(challenge_.data(), CHALLENGE_HEADER_, sizeof(CHALLENGE_HEADER_));
    fill_(challenge_.data() + sizeof(CHALLENGE_HEADER_), 10);
    challenge_[CHALLENGE_SIZE_ - 1] = SumChecksum(challenge_.data(), CHALLENGE_SIZE_ - 1);

    out = challenge_;
    state_ = AuthState::ChallengeSent;
    ESP_LOGI(TAG_, "Challenge issued");
    return ESP_OK;
}

esp_err_t RebornHandshake::HandleReply(const uint8_t* data, size_t len, Verdict& verdict) noexcept
{
    if (state_ != AuthState::ChallengeSent) {
        ESP_LOGE(TAG_, "Reply without a pending challenge (state %s)", ToString(state_));
        return ESP_ERR_INVALID_STATE;
    }
    if (Classify(data, len) != RebornFrame::AuthReply) {
        return ESP_ERR_INVALID_ARG;
    }

    uint8_t expected[RESPONSE_SIZE_];
    ExpectedResponse(challenge_, expected);

    uint8_t diff = 0;
    for (size_t i = 0; i < RESPONSE_SIZE_; ++i) {
        diff |= static_cast<uint8_t>(expected[i] ^ data[4 + i]);
    }

    // Terminal transition: the challenge is single-use
    challenge_.fill(0);

    if (diff == 0) {
        state_ = AuthState::Verified;
        std::memcpy(verdict.data(), VERDICT_ACCEPT_, VERDICT_SIZE_);
        ESP_LOGI(TAG_, "Handshake verified");
        return ESP_OK;
    }

    state_ = AuthState::Rejected;
    std::memcpy(verdict.data(), VERDICT_REJECT_, VERDICT_SIZE_);
    ESP_LOGE(TAG_, "Handshake rejected: reply does not match challenge");
    return ERR_AUTHENTICATION_;
}

void RebornHandshake::Reset() noexcept
{
    challenge_.fill(0);
    state_ = AuthState::Idle;
}

RebornFrame RebornHandshake::Classify(const uint8_t* data, size_t len) noexcept
{
    if (data == nullptr) return RebornFrame::Other;

    if (len >= AUTH_REPLY_MIN_LEN_ && data[2] == 0x8A && data[3] == 0x03) {
        return RebornFrame::AuthReply;
    }
    if (len >= FAILURE_MIN_LEN_ && data[2] == 0x80 && data[3] == 0xE1 && data[4] == 0x01) {
        return RebornFrame::DeviceFailure;
    }
    if (len == TELEMETRY_LEN_ && data[1] == TELEMETRY_LEN_ && data[2] == 0x00 && data[3] == 0x80) {
        return RebornFrame::Telemetry;
    }
    return RebornFrame::Other;
}

} // namespace trainer_link
