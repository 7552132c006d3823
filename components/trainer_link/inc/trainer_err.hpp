/**
 * @file trainer_err.hpp
 * @brief Component error codes for trainer_link
 *
 * All fallible calls return esp_err_t. Component-specific failures live above
 * TRAINER_LINK_ERR_BASE; generic conditions reuse the ESP-IDF codes
 * (ESP_ERR_INVALID_SIZE, ESP_ERR_INVALID_STATE, ESP_ERR_INVALID_ARG).
 */

#pragma once

#include "esp_err.h"

#define TRAINER_LINK_ERR_BASE 0x7A00

namespace trainer_link {

/// Connect, discover, read or write failed inside the transport collaborator
static constexpr esp_err_t ERR_TRANSPORT_             = TRAINER_LINK_ERR_BASE + 1;
/// Control command requested against a read-only protocol
static constexpr esp_err_t ERR_UNSUPPORTED_OPERATION_ = TRAINER_LINK_ERR_BASE + 2;
/// Service discovery failed while detecting the protocol
static constexpr esp_err_t ERR_PROTOCOL_DETECTION_    = TRAINER_LINK_ERR_BASE + 3;
/// Handshake rejected, or the device reported the handshake as failed
static constexpr esp_err_t ERR_AUTHENTICATION_        = TRAINER_LINK_ERR_BASE + 4;
/// Control-capable vendor protocol has no frame for this operation
static constexpr esp_err_t ERR_NO_VENDOR_FRAME_       = TRAINER_LINK_ERR_BASE + 5;

const char* ErrorToName(esp_err_t err) noexcept;

} // namespace trainer_link
