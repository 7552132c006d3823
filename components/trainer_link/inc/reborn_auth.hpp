/**
 * @file reborn_auth.hpp
 * @brief Reborn challenge / response handshake
 *
 * Vendor checksum scheme, not a security primitive:
 *  - Challenge: [AA 0F 8A 03] + 10 random bytes + sum(bytes 0..13) & 0xFF
 *  - Reply:     bytes 4..8 must equal (ch[4+i] + ch[9+i] + KEY[i]) & 0xFF
 *  - Verdict:   AA 06 80 E1 00 11 (accepted) / AA 06 80 E1 01 12 (rejected)
 *
 * The object holds one in-flight challenge. It produces frames but never
 * writes them; the session owns the transport.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include "esp_err.h"

namespace trainer_link {

// Enum class: PascalCase
enum class AuthState : uint8_t {
    Idle = 0,
    ChallengeSent,
    Verified,
    Rejected
};

const char* ToString(AuthState state) noexcept;

/// What a notification on the Reborn data characteristic carries.
enum class RebornFrame : uint8_t {
    AuthReply,
    DeviceFailure,
    Telemetry,
    Other
};

class RebornHandshake {
public:
    static constexpr size_t  CHALLENGE_SIZE_   = 15;
    static constexpr size_t  RESPONSE_SIZE_    = 5;
    static constexpr size_t  VERDICT_SIZE_     = 6;
    static constexpr uint8_t KEY_[RESPONSE_SIZE_] = {0x15, 0x25, 0x80, 0x13, 0xF0};

    using Challenge = std::array<uint8_t, CHALLENGE_SIZE_>;
    using Verdict   = std::array<uint8_t, VERDICT_SIZE_>;

    /// Same shape as esp_fill_random.
    using RandomFillFn = void (*)(void* buf, size_t len);

    explicit RebornHandshake(RandomFillFn fill = nullptr) noexcept;

    /**
     * @brief Idle -> ChallengeSent. Fills `out` with the frame to write.
     * @return ESP_ERR_INVALID_STATE if a challenge is already in flight or resolved.
     */
    esp_err_t BeginChallenge(Challenge& out) noexcept;

    /**
     * @brief ChallengeSent -> Verified / Rejected. Fills `verdict` with the frame to write.
     * @return ESP_OK when verified, ERR_AUTHENTICATION_ when rejected,
     *         ESP_ERR_INVALID_STATE without a pending challenge,
     *         ESP_ERR_INVALID_ARG if the frame is not shaped like a reply.
     */
    esp_err_t HandleReply(const uint8_t* data, size_t len, Verdict& verdict) noexcept;

    /// Any state -> Idle, stored challenge cleared.
    void Reset() noexcept;

    AuthState State() const noexcept { return state_; }
    bool IsVerified() const noexcept { return state_ == AuthState::Verified; }

    static RebornFrame Classify(const uint8_t* data, size_t len) noexcept;

    /// Expected reply bytes 4..8 for a given challenge.
    static void ExpectedResponse(const Challenge& challenge, uint8_t out[RESPONSE_SIZE_]) noexcept;

    static uint8_t SumChecksum(const uint8_t* data, size_t len) noexcept;

private:
    RandomFillFn fill_;
    AuthState    state_;
    Challenge    challenge_;
};

} // namespace trainer_link
