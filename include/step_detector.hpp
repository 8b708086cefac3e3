/**
 * @file step_detector.hpp
 * @brief Step detection from a single oscillating acceleration axis
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#ifndef APP_INCLUDE_STEP_DETECTOR_HEADER_
#define APP_INCLUDE_STEP_DETECTOR_HEADER_

#include <cstdint>

#include <rsc_config.hpp>
#include <rsc_types.hpp>

/**
 * @brief Detects footfalls as rising crossings of a slowly adapting baseline.
 *
 * The baseline is an exponential moving average of the signal. The detector
 * arms once the deviation from the baseline has gone above +min_amplitude / 2
 * and afterwards below -min_amplitude / 2, i.e. one full peak-trough cycle.
 * An armed detector reports a step at the next rising crossing (deviation
 * from <= 0 to > 0) if at least refractory_ms have passed since the last
 * step. Every armed crossing disarms it, so a lone dip or spike and noise
 * around the baseline never count.
 */
class StepDetector {
public:
    explicit StepDetector(const step_detector_config_t &config);

    /**
     * @brief Feeds one sample.
     *
     * @param sample Sample, timestamps must not go backwards
     * @param event Filled when a step is detected
     * @return true if a step was detected
     */
    bool observe(const accel_sample_t &sample, step_event_t *event);

    void reset();

    float baseline() const { return baseline_value; }
    uint32_t stepCount() const { return step_count; }

private:
    void disarm();

    step_detector_config_t config;

    bool has_baseline;
    float baseline_value;
    float prev_deviation;
    int64_t prev_timestamp_ms;

    // Cycle progress since the last armed crossing
    bool seen_peak;
    bool seen_trough;
    float peak;
    float trough;

    bool has_last_step;
    int64_t last_step_ms;
    uint32_t step_count;
};

#endif // APP_INCLUDE_STEP_DETECTOR_HEADER_
