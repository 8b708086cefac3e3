/**
 * @file rsc_config.cpp
 * @brief Kconfig defaults and startup validation of the RSC configuration
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <cstring>

#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <errors.hpp>
#include <rsc_config.hpp>

LOG_MODULE_DECLARE(app, CONFIG_APP_MODULE_LOG_LEVEL);

rsc_config_t rsc_config_default(void)
{
    rsc_config_t config = {};

    config.sample_period_ms = CONFIG_RSC_SAMPLE_PERIOD_MS;
    config.max_consecutive_sensor_failures = CONFIG_RSC_SENSOR_MAX_CONSECUTIVE_FAILURES;

    // Kconfig has no float type, thresholds are stored in milli units
    config.detector.min_amplitude = CONFIG_RSC_STEP_MIN_AMPLITUDE_MM_S2 / 1000.0f;
    config.detector.refractory_ms = CONFIG_RSC_STEP_REFRACTORY_MS;
    config.detector.baseline_alpha = CONFIG_RSC_BASELINE_ALPHA_PERMILLE / 1000.0f;

    config.cadence.horizon_ms = CONFIG_RSC_CADENCE_HORIZON_MS;
    config.cadence.report_interval_ms = CONFIG_RSC_REPORT_INTERVAL_MS;

    config.mapper.reference_cadence_spm = CONFIG_RSC_REFERENCE_CADENCE_SPM;
    config.mapper.reference_running_cadence_spm = CONFIG_RSC_REFERENCE_RUNNING_CADENCE_SPM;
    config.mapper.stride_length_mm = CONFIG_RSC_STRIDE_LENGTH_MM;

    strncpy(config.peripheral.device_name, CONFIG_RSC_DEVICE_NAME, sizeof(config.peripheral.device_name) - 1);
    config.peripheral.device_name[sizeof(config.peripheral.device_name) - 1] = '\0';
    config.peripheral.sensor_location = CONFIG_RSC_SENSOR_LOCATION;
    config.peripheral.tx_power_dbm = CONFIG_RSC_ADV_TX_POWER_DBM;
    config.peripheral.adv_retry.max_attempts = CONFIG_RSC_ADV_MAX_ATTEMPTS;
    config.peripheral.adv_retry.initial_delay_ms = CONFIG_RSC_ADV_INITIAL_DELAY_MS;
    config.peripheral.adv_retry.max_delay_ms = CONFIG_RSC_ADV_MAX_DELAY_MS;
    config.peripheral.adv_retry.backoff_multiplier = 2.0f;
    config.peripheral.adv_retry.jitter_enabled = true;
    config.peripheral.drain_timeout_ms = CONFIG_RSC_SHUTDOWN_DRAIN_TIMEOUT_MS;

    return config;
}

err_t rsc_config_validate(const rsc_config_t *config)
{
    if (config == nullptr)
    {
        LOG_ERR("No configuration");
        return err_t::CONFIGURATION_ERROR;
    }

    bool valid = true;

    if (config->sample_period_ms == 0)
    {
        LOG_ERR("Sample period must be > 0 ms");
        valid = false;
    }
    if (config->max_consecutive_sensor_failures == 0)
    {
        LOG_ERR("Sensor failure limit must be > 0");
        valid = false;
    }
    if (!(config->detector.min_amplitude > 0.0f))
    {
        LOG_ERR("Step amplitude threshold must be > 0");
        valid = false;
    }
    if (config->detector.refractory_ms == 0)
    {
        LOG_ERR("Refractory period must be > 0 ms");
        valid = false;
    }
    if (!(config->detector.baseline_alpha > 0.0f && config->detector.baseline_alpha <= 1.0f))
    {
        LOG_ERR("Baseline smoothing factor must be in (0, 1]");
        valid = false;
    }
    if (config->cadence.horizon_ms == 0 || config->cadence.horizon_ms < config->detector.refractory_ms)
    {
        LOG_ERR("Cadence horizon (%u ms) must be >= refractory period (%u ms)", config->cadence.horizon_ms,
                config->detector.refractory_ms);
        valid = false;
    }
    else if (config->detector.refractory_ms > 0 &&
             (config->cadence.horizon_ms / config->detector.refractory_ms) + 1 > RSC_CADENCE_WINDOW_CAPACITY)
    {
        // The detector can produce horizon / refractory + 1 steps inside one horizon
        LOG_ERR("Cadence window capacity %u too small for horizon %u ms / refractory %u ms",
                RSC_CADENCE_WINDOW_CAPACITY, config->cadence.horizon_ms, config->detector.refractory_ms);
        valid = false;
    }
    if (config->cadence.report_interval_ms == 0)
    {
        LOG_ERR("Cadence report interval must be > 0 ms");
        valid = false;
    }
    if (config->mapper.reference_cadence_spm == 0 || config->mapper.reference_running_cadence_spm == 0 ||
        config->mapper.stride_length_mm == 0)
    {
        LOG_ERR("Speed calibration constants must be > 0");
        valid = false;
    }
    if (config->peripheral.device_name[0] == '\0')
    {
        LOG_ERR("Device name is empty");
        valid = false;
    }
    if (config->peripheral.adv_retry.max_attempts == 0)
    {
        LOG_ERR("Advertising retry needs at least one attempt");
        valid = false;
    }

    return valid ? err_t::NO_ERROR : err_t::CONFIGURATION_ERROR;
}

const char *err_to_str(err_t err)
{
    switch (err)
    {
        case err_t::NO_ERROR:
            return "NO_ERROR";
        case err_t::BLUETOOTH_ERROR:
            return "BLUETOOTH_ERROR";
        case err_t::HARDWARE:
            return "HARDWARE";
        case err_t::INVALID_PARAMETER:
            return "INVALID_PARAMETER";
        case err_t::SENSOR_READ_ERROR:
            return "SENSOR_READ_ERROR";
        case err_t::REGISTRATION_ERROR:
            return "REGISTRATION_ERROR";
        case err_t::NOTIFY_DELIVERY_ERROR:
            return "NOTIFY_DELIVERY_ERROR";
        case err_t::CONFIGURATION_ERROR:
            return "CONFIGURATION_ERROR";
    }
    return "UNKNOWN";
}
