/**
 * @file config_store.cpp
 * @brief NVS persistence for TrainerConfig
 */

#include "config_store.hpp"
#include "nvs_flash.h"
#include "nvs.h"
#include "esp_log.h"
#include "esp_crc.h"

#include <cstring>

static const char* TAG_CFG_ = "TrainerCfg";

namespace {

const char* NVS_NAMESPACE_ = "trainer_link";
const char* KEY_BLOB_      = "cfg_blob";
const char* KEY_CRC_       = "cfg_crc";

uint32_t blobCrc(const trainer_link::TrainerConfig& cfg) noexcept
{
    return esp_crc32_le(0, reinterpret_cast<const uint8_t*>(&cfg), sizeof(cfg));
}

esp_err_t writeBlob(nvs_handle_t h, const trainer_link::TrainerConfig& cfg) noexcept
{
    esp_err_t err = nvs_set_blob(h, KEY_BLOB_, &cfg, sizeof(cfg));
    if (err == ESP_OK) {
        err = nvs_set_u32(h, KEY_CRC_, blobCrc(cfg));
    }
    if (err == ESP_OK) {
        err = nvs_commit(h);
    }
    return err;
}

} // namespace

namespace trainer_link {

bool ConfigStore::Validate(const TrainerConfig& cfg) noexcept
{
    if (cfg.simple_command_ms > MAX_DELAY_MS_ || cfg.mode_change_ms > MAX_DELAY_MS_ ||
        cfg.fitshow_init_ms > MAX_DELAY_MS_ || cfg.fitshow_start_ms > MAX_DELAY_MS_) {
        return false;
    }
    if (cfg.event_log_capacity < MIN_LOG_CAPACITY_ || cfg.event_log_capacity > MAX_LOG_CAPACITY_) {
        return false;
    }
    // NaN fails both comparisons
    if (!(cfg.default_crr >= 0.0f && cfg.default_crr <= MAX_CRR_)) return false;
    if (!(cfg.default_cw >= 0.0f && cfg.default_cw <= MAX_CW_)) return false;

    // A blob read back from flash may carry any byte in the bool slot
    uint8_t raw_bool = 0;
    std::memcpy(&raw_bool, &cfg.telemetry_only, 1);
    if (raw_bool > 1) return false;

    return std::memchr(cfg.target_name_filter, '\0', NAME_FILTER_LEN_) != nullptr;
}

esp_err_t ConfigStore::Init(TrainerConfig& cfg) noexcept
{
    cfg = TrainerConfig{};

    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        err = nvs_flash_erase();
        if (err == ESP_OK) {
            err = nvs_flash_init();
        }
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG_CFG_, "NVS init failed: %s", esp_err_to_name(err));
        return err;
    }

    nvs_handle_t h;
    err = nvs_open(NVS_NAMESPACE_, NVS_READWRITE, &h);
    if (err != ESP_OK) {
        ESP_LOGE(TAG_CFG_, "Failed to open NVS: %s", esp_err_to_name(err));
        return err;
    }

    size_t blob_size = 0;
    bool loaded = false;
    err = nvs_get_blob(h, KEY_BLOB_, nullptr, &blob_size);

    if (err == ESP_OK && blob_size == sizeof(TrainerConfig)) {
        TrainerConfig stored;
        uint32_t stored_crc = 0;
        if (nvs_get_blob(h, KEY_BLOB_, &stored, &blob_size) == ESP_OK &&
            nvs_get_u32(h, KEY_CRC_, &stored_crc) == ESP_OK) {
            const uint32_t calc_crc = blobCrc(stored);
            if (calc_crc != stored_crc) {
                ESP_LOGW(TAG_CFG_, "Config CRC mismatch! Stored: 0x%08lx, Calc: 0x%08lx",
                         (unsigned long)stored_crc, (unsigned long)calc_crc);
            } else if (!Validate(stored)) {
                ESP_LOGE(TAG_CFG_, "Config CRC OK but values out of range");
            } else {
                ESP_LOGI(TAG_CFG_, "Config loaded (CRC: 0x%08lx)", (unsigned long)stored_crc);
                cfg = stored;
                loaded = true;
            }
        } else {
            ESP_LOGW(TAG_CFG_, "Config blob found but unreadable or CRC missing");
        }
    } else if (err == ESP_ERR_NVS_NOT_FOUND) {
        ESP_LOGI(TAG_CFG_, "No config in NVS, creating defaults");
    } else {
        ESP_LOGW(TAG_CFG_, "Config blob size mismatch or read error (sz=%d, exp=%d)",
                 (int)blob_size, (int)sizeof(TrainerConfig));
    }

    esp_err_t result = ESP_OK;
    if (!loaded) {
        ESP_LOGW(TAG_CFG_, "Using defaults and overwriting NVS");
        result = writeBlob(h, cfg);
        if (result != ESP_OK) {
            ESP_LOGE(TAG_CFG_, "Writing defaults failed: %s", esp_err_to_name(result));
        }
    }

    nvs_close(h);
    return result;
}

esp_err_t ConfigStore::Save(const TrainerConfig& cfg) noexcept
{
    if (!Validate(cfg)) {
        ESP_LOGE(TAG_CFG_, "Refusing to save out-of-range config");
        return ESP_ERR_INVALID_ARG;
    }

    nvs_handle_t h;
    esp_err_t err = nvs_open(NVS_NAMESPACE_, NVS_READWRITE, &h);
    if (err != ESP_OK) {
        ESP_LOGE(TAG_CFG_, "Failed to open NVS for write: %s", esp_err_to_name(err));
        return err;
    }

    err = writeBlob(h, cfg);
    if (err == ESP_OK) {
        ESP_LOGI(TAG_CFG_, "Config saved (CRC: 0x%08lx)", (unsigned long)blobCrc(cfg));
    } else {
        ESP_LOGE(TAG_CFG_, "NVS write failed: %s", esp_err_to_name(err));
    }

    nvs_close(h);
    return err;
}

command::DelayPolicy ConfigStore::ToDelayPolicy(const TrainerConfig& cfg) noexcept
{
    command::DelayPolicy p;
    p.simple_command_ms = cfg.simple_command_ms;
    p.mode_change_ms = cfg.mode_change_ms;
    p.fitshow_init_ms = cfg.fitshow_init_ms;
    p.fitshow_start_ms = cfg.fitshow_start_ms;
    return p;
}

command::SimulationParams ConfigStore::DefaultSimulation(const TrainerConfig& cfg) noexcept
{
    command::SimulationParams sim;
    sim.crr = cfg.default_crr;
    sim.cw = cfg.default_cw;
    return sim;
}

} // namespace trainer_link
