/**
 * @file rsc_types.hpp
 * @brief Data passed between the stages of the cadence pipeline
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_RSC_TYPES_HEADER_
#define APP_INCLUDE_RSC_TYPES_HEADER_

#include <cstdint>

// One reading of the configured acceleration axis
typedef struct
{
    float value;          // m/s^2
    int64_t timestamp_ms; // k_uptime_get() when read
} accel_sample_t;

// Detected step (rising baseline crossing)
typedef struct
{
    int64_t timestamp_ms;
    uint32_t interval_ms; // Since the previous step, 0 for the first one
} step_event_t;

typedef struct
{
    int64_t timestamp_ms;
    uint16_t cadence_spm;
    uint16_t steps_in_window;
} cadence_sample_t;

// Values carried by the RSC Measurement characteristic
typedef struct
{
    uint16_t speed;      // Instantaneous speed, 1/256 m/s
    uint8_t cadence_spm; // Instantaneous cadence, steps per minute
} rsc_measurement_t;

#endif // APP_INCLUDE_RSC_TYPES_HEADER_
