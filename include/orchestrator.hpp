/**
 * @file orchestrator.hpp
 * @brief Sampling loop driving the cadence pipeline and the RSC peripheral
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_ORCHESTRATOR_HEADER_
#define APP_INCLUDE_ORCHESTRATOR_HEADER_

#include <cstdint>

#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include <cadence_estimator.hpp>
#include <errors.hpp>
#include <gatt_peripheral.hpp>
#include <host_stack.hpp>
#include <rsc_config.hpp>
#include <rsc_types.hpp>
#include <sample_source.hpp>
#include <speed_cadence_mapper.hpp>
#include <step_detector.hpp>

typedef struct
{
    bool running;
    cadence_sample_t cadence;       // Last cadence reported
    rsc_measurement_t measurement;  // Last measurement handed to the peripheral
    uint32_t steps_detected;
    uint32_t sensor_failures;
    uint32_t consecutive_sensor_failures;
    peripheral_status_t peripheral;
} rsc_status_t;

/**
 * @brief Owns the pipeline and the peripheral for the lifetime of the firmware.
 *
 * init() -> run() -> shutdown(). tick() is one loop iteration and can be
 * driven directly with synthetic time.
 */
class Orchestrator
{
  public:
    Orchestrator(const rsc_config_t &config, SampleSource &source, HostStack &host, struct k_work_q *work_q);
    ~Orchestrator();

    Orchestrator(const Orchestrator &) = delete;
    Orchestrator &operator=(const Orchestrator &) = delete;

    /**
     * @brief Validates the configuration, reads the sensor once, registers and advertises.
     *
     * @return err_t::NO_ERROR
     * @return err_t::CONFIGURATION_ERROR
     * @return err_t::SENSOR_READ_ERROR if the sensor cannot be initialised or read
     * @return err_t::REGISTRATION_ERROR if the service cannot be published
     */
    err_t init();

    /**
     * @brief Samples every sample_period_ms until requestStop().
     *
     * @return err_t::NO_ERROR when stopped, err_t::SENSOR_READ_ERROR when
     * the sensor failed too many times in a row
     */
    err_t run();

    err_t tick(int64_t now_ms);

    // Observed at the next tick boundary. Safe from any thread or ISR.
    void requestStop();
    bool stopRequested() const;

    void shutdown();

    void getStatus(rsc_status_t *status) const;

    GattPeripheral &peripheral() { return rsc_peripheral; }

  private:
    void report(const cadence_sample_t &cadence, int64_t now_ms);

    rsc_config_t config;
    SampleSource &source;

    StepDetector detector;
    CadenceEstimator estimator;
    SpeedCadenceMapper mapper;
    GattPeripheral rsc_peripheral;

    struct k_timer tick_timer;
    atomic_t stop_requested;
    atomic_t running;

    mutable struct k_mutex status_mutex;
    uint32_t sensor_failures;
    uint32_t consecutive_failures;
    bool has_report;
    int64_t last_report_ms;
    cadence_sample_t last_cadence;
    rsc_measurement_t last_measurement;
    uint32_t step_total;
};

#endif // APP_INCLUDE_ORCHESTRATOR_HEADER_
