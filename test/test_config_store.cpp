#include "doctest.h"

#include "config_store.hpp"

#include <cmath>
#include <cstring>
#include <limits>

using namespace trainer_link;
using doctest::Approx;

TEST_CASE("ConfigStore: defaults are valid") {
    TrainerConfig cfg;
    CHECK(ConfigStore::Validate(cfg));

    const auto delays = ConfigStore::ToDelayPolicy(cfg);
    CHECK(delays.simple_command_ms == 500);
    CHECK(delays.mode_change_ms == 1000);
    CHECK(delays.fitshow_init_ms == 3000);
    CHECK(delays.fitshow_start_ms == 2000);

    const auto sim = ConfigStore::DefaultSimulation(cfg);
    CHECK(sim.crr == Approx(0.004f));
    CHECK(sim.cw == Approx(0.5f));
    CHECK(sim.grade_pct == Approx(0.0f));
}

TEST_CASE("ConfigStore: out of range values are rejected") {
    TrainerConfig cfg;
    cfg.mode_change_ms = ConfigStore::MAX_DELAY_MS_ + 1;
    CHECK_FALSE(ConfigStore::Validate(cfg));

    cfg = TrainerConfig{};
    cfg.event_log_capacity = 0;
    CHECK_FALSE(ConfigStore::Validate(cfg));

    cfg = TrainerConfig{};
    cfg.event_log_capacity = ConfigStore::MAX_LOG_CAPACITY_ + 1;
    CHECK_FALSE(ConfigStore::Validate(cfg));

    cfg = TrainerConfig{};
    cfg.default_crr = std::numeric_limits<float>::quiet_NaN();
    CHECK_FALSE(ConfigStore::Validate(cfg));

    cfg = TrainerConfig{};
    cfg.default_cw = 3.0f;
    CHECK_FALSE(ConfigStore::Validate(cfg));
}

TEST_CASE("ConfigStore: name filter must be terminated") {
    TrainerConfig cfg;
    std::strncpy(cfg.target_name_filter, "FS-", NAME_FILTER_LEN_ - 1);
    CHECK(ConfigStore::Validate(cfg));

    std::memset(cfg.target_name_filter, 'A', NAME_FILTER_LEN_);
    CHECK_FALSE(ConfigStore::Validate(cfg));
}

TEST_CASE("ConfigStore: corrupted bool byte is rejected") {
    TrainerConfig cfg;
    const uint8_t garbage = 0x7F;
    std::memcpy(&cfg.telemetry_only, &garbage, 1);
    CHECK_FALSE(ConfigStore::Validate(cfg));
}
