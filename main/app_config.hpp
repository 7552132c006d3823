/**
 * @file app_config.hpp
 * @brief Build-time configuration for the trainer bridge firmware
 *
 * Runtime settings (delays, simulation defaults, name filter) live in NVS,
 * see trainer_link::ConfigStore.
 */

#pragma once

#include <cstdint>

// ------------- SCAN / RECONNECT -------------

static constexpr uint32_t SCAN_WINDOW_MS_       = 10000;  // one active scan window
static constexpr uint32_t RETRY_DELAY_MS_       = 5000;   // pause after a failed attempt
static constexpr uint32_t LINK_POLL_MS_         = 1000;   // session state poll while active

// ------------- TASKS -------------

static constexpr uint32_t SESSION_TASK_STACK_ = 8192;
static constexpr uint32_t SESSION_TASK_PRIO_  = 5;
