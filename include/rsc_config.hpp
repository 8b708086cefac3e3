/**
 * @file rsc_config.hpp
 * @brief Tunable constants for the sampling pipeline and the RSC peripheral
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 * Defaults come from Kconfig (CONFIG_RSC_*). The detector thresholds depend on
 * how the accelerometer is mounted on the machine, so none of them is fixed in
 * code: change the Kconfig values or build a config at runtime.
 */

#ifndef APP_INCLUDE_RSC_CONFIG_HEADER_
#define APP_INCLUDE_RSC_CONFIG_HEADER_

#include <cstdint>
#include <errors.hpp>

// Upper bound on tracked centrals. The Bluetooth build ties it to BT_MAX_CONN.
static constexpr uint8_t RSC_MAX_CENTRALS = CONFIG_RSC_MAX_CENTRALS;

// Capacity of the cadence window ring buffer
static constexpr uint16_t RSC_CADENCE_WINDOW_CAPACITY = CONFIG_RSC_CADENCE_WINDOW_CAPACITY;

static constexpr uint8_t RSC_DEVICE_NAME_MAX_LEN = 29;

// Step detector
typedef struct
{
    float min_amplitude;   // Peak to trough swing of the deviation, +/- half around the baseline, m/s^2
    uint32_t refractory_ms;
    float baseline_alpha;  // EMA smoothing factor, (0, 1]
} step_detector_config_t;

// Cadence window
typedef struct
{
    uint32_t horizon_ms;
    uint32_t report_interval_ms; // Periodic cadence report while idle
} cadence_config_t;

// Cadence to speed calibration
typedef struct
{
    uint16_t reference_cadence_spm;         // Machine cadence of the calibration point
    uint16_t reference_running_cadence_spm; // Running cadence reported for it
    uint16_t stride_length_mm;              // Running step length
} mapper_config_t;

typedef struct
{
    uint32_t max_attempts;
    uint32_t initial_delay_ms;
    uint32_t max_delay_ms;
    float backoff_multiplier;
    bool jitter_enabled;
} retry_config_t;

typedef struct
{
    char device_name[RSC_DEVICE_NAME_MAX_LEN + 1];
    uint8_t sensor_location;
    int8_t tx_power_dbm;
    retry_config_t adv_retry;
    uint32_t drain_timeout_ms; // Wait for in-flight notifications on shutdown
} peripheral_config_t;

typedef struct
{
    uint32_t sample_period_ms;
    uint32_t max_consecutive_sensor_failures;
    step_detector_config_t detector;
    cadence_config_t cadence;
    mapper_config_t mapper;
    peripheral_config_t peripheral;
} rsc_config_t;

/**
 * @brief Builds a configuration from the Kconfig defaults.
 */
rsc_config_t rsc_config_default(void);

/**
 * @brief Checks a configuration before the sampling loop starts.
 *
 * Every rejected field is logged.
 *
 * @return err_t::NO_ERROR or err_t::CONFIGURATION_ERROR
 */
err_t rsc_config_validate(const rsc_config_t *config);

#endif // APP_INCLUDE_RSC_CONFIG_HEADER_
