/**
 * @file config_store.hpp
 * @brief Persisted trainer_link configuration (NVS blob + CRC32)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include "esp_err.h"
#include "command_encoder.hpp"

namespace trainer_link {

static constexpr size_t NAME_FILTER_LEN_ = 32;

// Stored as a raw blob; keep it trivially copyable.
struct TrainerConfig {
    // Settle delays, ms
    uint32_t simple_command_ms = 500;
    uint32_t mode_change_ms    = 1000;
    uint32_t fitshow_init_ms   = 3000;
    uint32_t fitshow_start_ms  = 2000;

    // Simulation defaults
    float    default_crr = 0.004f;
    float    default_cw  = 0.5f;

    uint16_t event_log_capacity = 200;
    bool     telemetry_only = false;    // skip reset / start in the connection sequence

    // Advertised-name substring to connect to; empty = first device with any vendor marker
    char     target_name_filter[NAME_FILTER_LEN_] = {};
};

namespace ConfigStore {

static constexpr uint32_t MAX_DELAY_MS_      = 10000;
static constexpr uint16_t MIN_LOG_CAPACITY_  = 1;
static constexpr uint16_t MAX_LOG_CAPACITY_  = 1000;
static constexpr float    MAX_CRR_           = 255.0f / 20000.0f;
static constexpr float    MAX_CW_            = 2.55f;

/// Defaults first, then the stored blob if present, intact and in range.
esp_err_t Init(TrainerConfig& cfg) noexcept;
esp_err_t Save(const TrainerConfig& cfg) noexcept;

/// Range check only, no storage access.
bool Validate(const TrainerConfig& cfg) noexcept;

command::DelayPolicy ToDelayPolicy(const TrainerConfig& cfg) noexcept;
command::SimulationParams DefaultSimulation(const TrainerConfig& cfg) noexcept;

} // namespace ConfigStore

} // namespace trainer_link
