/**
 * @file cadence_estimator.cpp
 * @brief Sliding window cadence from detected steps
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#include <cadence_estimator.hpp>
#include <zephyr/logging/log.h>

LOG_MODULE_REGISTER(cadence_estimator, CONFIG_RSC_PIPELINE_LOG_LEVEL);

static constexpr uint32_t MS_PER_MINUTE = 60000;

CadenceEstimator::CadenceEstimator(const cadence_config_t &config) : config(config)
{
    reset();
}

void CadenceEstimator::reset()
{
    head = 0;
    count = 0;
    has_latest = false;
    latest_ms = 0;
}

cadence_sample_t CadenceEstimator::onStep(const step_event_t &event)
{
    if (has_latest && event.timestamp_ms <= latest_ms) {
        LOG_WRN("Ignoring non-monotonic step at %lld ms (latest %lld ms)", (long long)event.timestamp_ms,
                (long long)latest_ms);
        return evaluate(latest_ms);
    }

    if (count == RSC_CADENCE_WINDOW_CAPACITY) {
        // Full: drop the oldest step
        head = (head + 1) % RSC_CADENCE_WINDOW_CAPACITY;
        count--;
        LOG_WRN("Cadence window full, oldest step dropped");
    }

    window[(head + count) % RSC_CADENCE_WINDOW_CAPACITY] = event.timestamp_ms;
    count++;
    has_latest = true;
    latest_ms = event.timestamp_ms;

    return evaluate(event.timestamp_ms);
}

cadence_sample_t CadenceEstimator::tick(int64_t now_ms)
{
    if (has_latest && now_ms < latest_ms) {
        now_ms = latest_ms;
    }
    return evaluate(now_ms);
}

void CadenceEstimator::evict(int64_t now_ms)
{
    int64_t cutoff = now_ms - static_cast<int64_t>(config.horizon_ms);

    while (count > 0 && window[head] <= cutoff) {
        head = (head + 1) % RSC_CADENCE_WINDOW_CAPACITY;
        count--;
    }
}

cadence_sample_t CadenceEstimator::evaluate(int64_t now_ms)
{
    evict(now_ms);

    uint32_t cadence = (static_cast<uint32_t>(count) * MS_PER_MINUTE + config.horizon_ms / 2) / config.horizon_ms;
    if (cadence > UINT16_MAX) {
        cadence = UINT16_MAX;
    }

    cadence_sample_t sample;
    sample.timestamp_ms = now_ms;
    sample.cadence_spm = static_cast<uint16_t>(cadence);
    sample.steps_in_window = count;
    return sample;
}
