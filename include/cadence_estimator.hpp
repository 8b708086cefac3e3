/**
 * @file cadence_estimator.hpp
 * @brief Sliding window cadence from detected steps
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#ifndef APP_INCLUDE_CADENCE_ESTIMATOR_HEADER_
#define APP_INCLUDE_CADENCE_ESTIMATOR_HEADER_

#include <cstdint>

#include <rsc_config.hpp>
#include <rsc_types.hpp>

/**
 * @brief Counts steps inside the last horizon_ms and scales to steps/min.
 *
 * cadence = round(count * 60000 / horizon_ms). Steps with a timestamp
 * <= now - horizon_ms are evicted, so tick() must run periodically for the
 * cadence to fall to 0 once the machine stops.
 */
class CadenceEstimator {
public:
    explicit CadenceEstimator(const cadence_config_t &config);

    cadence_sample_t onStep(const step_event_t &event);
    cadence_sample_t tick(int64_t now_ms);

    void reset();

    uint16_t stepsInWindow() const { return count; }

private:
    cadence_sample_t evaluate(int64_t now_ms);
    void evict(int64_t now_ms);

    cadence_config_t config;

    // Ring buffer of step timestamps, oldest at head
    int64_t window[RSC_CADENCE_WINDOW_CAPACITY];
    uint16_t head;
    uint16_t count;

    bool has_latest;
    int64_t latest_ms;
};

#endif // APP_INCLUDE_CADENCE_ESTIMATOR_HEADER_
