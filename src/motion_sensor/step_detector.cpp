/**
 * @file step_detector.cpp
 * @brief Baseline crossing step detector
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#include <step_detector.hpp>
#include <zephyr/logging/log.h>

LOG_MODULE_REGISTER(step_detector, CONFIG_RSC_PIPELINE_LOG_LEVEL);

StepDetector::StepDetector(const step_detector_config_t &config) : config(config)
{
    reset();
}

void StepDetector::reset()
{
    has_baseline = false;
    baseline_value = 0.0f;
    prev_deviation = 0.0f;
    prev_timestamp_ms = 0;
    disarm();
    has_last_step = false;
    last_step_ms = 0;
    step_count = 0;
}

bool StepDetector::observe(const accel_sample_t &sample, step_event_t *event)
{
    // First sample only seeds the baseline
    if (!has_baseline) {
        has_baseline = true;
        baseline_value = sample.value;
        prev_deviation = 0.0f;
        prev_timestamp_ms = sample.timestamp_ms;
        disarm();
        return false;
    }

    if (sample.timestamp_ms < prev_timestamp_ms) {
        LOG_WRN("Dropping out of order sample (%lld < %lld)", (long long)sample.timestamp_ms,
                (long long)prev_timestamp_ms);
        return false;
    }
    prev_timestamp_ms = sample.timestamp_ms;

    float deviation = sample.value - baseline_value;
    baseline_value += config.baseline_alpha * deviation;

    float half_swing = config.min_amplitude / 2.0f;
    bool detected = false;

    if (prev_deviation <= 0.0f && deviation > 0.0f && seen_trough) {
        bool refractory_over =
            !has_last_step || (sample.timestamp_ms - last_step_ms) >= static_cast<int64_t>(config.refractory_ms);

        if (refractory_over) {
            if (event) {
                event->timestamp_ms = sample.timestamp_ms;
                event->interval_ms = has_last_step ? static_cast<uint32_t>(sample.timestamp_ms - last_step_ms) : 0;
            }
            has_last_step = true;
            last_step_ms = sample.timestamp_ms;
            step_count++;
            detected = true;
            LOG_DBG("Step %u at %lld ms (swing %d mm/s2)", step_count, (long long)sample.timestamp_ms,
                    static_cast<int>((peak - trough) * 1000.0f));
        } else {
            LOG_DBG("Crossing inside refractory period ignored");
        }

        // The cycle is used up either way, this sample may already open the next one
        disarm();
        if (deviation >= half_swing) {
            seen_peak = true;
            peak = deviation;
        }
    } else if (!seen_peak) {
        if (deviation >= half_swing) {
            seen_peak = true;
            peak = deviation;
        }
    } else if (!seen_trough) {
        if (deviation > peak) {
            peak = deviation;
        }
        if (deviation <= -half_swing) {
            seen_trough = true;
            trough = deviation;
        }
    } else if (deviation < trough) {
        trough = deviation;
    }

    prev_deviation = deviation;
    return detected;
}

void StepDetector::disarm()
{
    seen_peak = false;
    seen_trough = false;
    peak = 0.0f;
    trough = 0.0f;
}
