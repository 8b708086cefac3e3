/**
 * @file orchestrator.cpp
 * @brief Sampling loop driving the cadence pipeline and the RSC peripheral
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#include <cerrno>
#include <cstring>

#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <orchestrator.hpp>

LOG_MODULE_REGISTER(app, CONFIG_APP_MODULE_LOG_LEVEL); // NOLINT

Orchestrator::Orchestrator(const rsc_config_t &config, SampleSource &source, HostStack &host,
                           struct k_work_q *work_q)
    : config(config), source(source), detector(config.detector), estimator(config.cadence), mapper(config.mapper),
      rsc_peripheral(host, config.peripheral, work_q), sensor_failures(0), consecutive_failures(0),
      has_report(false), last_report_ms(0), step_total(0)
{
    k_timer_init(&tick_timer, nullptr, nullptr);
    k_mutex_init(&status_mutex);
    atomic_set(&stop_requested, 0);
    atomic_set(&running, 0);
    memset(&last_cadence, 0, sizeof(last_cadence));
    memset(&last_measurement, 0, sizeof(last_measurement));
}

Orchestrator::~Orchestrator()
{
    shutdown();
}

err_t Orchestrator::init()
{
    if (rsc_config_validate(&config) != err_t::NO_ERROR)
    {
        LOG_ERR("Invalid configuration");
        return err_t::CONFIGURATION_ERROR;
    }

    int err = source.init();
    if (err)
    {
        LOG_ERR("Sample source init failed (err %d)", err);
        return err_t::SENSOR_READ_ERROR;
    }

    // A sensor that cannot be read at startup is fatal, later failures are not
    float first_reading;
    err = source.read(&first_reading);
    if (err)
    {
        LOG_ERR("First sensor read failed (err %d)", err);
        return err_t::SENSOR_READ_ERROR;
    }

    detector.reset();
    estimator.reset();

    k_mutex_lock(&status_mutex, K_FOREVER);
    sensor_failures = 0;
    consecutive_failures = 0;
    has_report = false;
    step_total = 0;
    k_mutex_unlock(&status_mutex);

    if (rsc_peripheral.registerService() != err_t::NO_ERROR)
    {
        return err_t::REGISTRATION_ERROR;
    }

    err_t ret = rsc_peripheral.startAdvertising();
    if (ret != err_t::NO_ERROR)
    {
        LOG_ERR("Advertising failed: %s", err_to_str(ret));
        return err_t::REGISTRATION_ERROR;
    }

    LOG_INF("RSC pipeline ready, sampling every %u ms", config.sample_period_ms);
    return err_t::NO_ERROR;
}

err_t Orchestrator::run()
{
    err_t result = err_t::NO_ERROR;

    atomic_set(&running, 1);
    k_timer_start(&tick_timer, K_MSEC(config.sample_period_ms), K_MSEC(config.sample_period_ms));

    while (!stopRequested())
    {
        // Returns early when requestStop() stops the timer
        k_timer_status_sync(&tick_timer);
        if (stopRequested())
        {
            break;
        }

        result = tick(k_uptime_get());
        if (result != err_t::NO_ERROR)
        {
            break;
        }
    }

    k_timer_stop(&tick_timer);
    atomic_set(&running, 0);

    if (result == err_t::NO_ERROR)
    {
        LOG_INF("Sampling loop stopped");
    }
    return result;
}

err_t Orchestrator::tick(int64_t now_ms)
{
    float value;
    int err = source.read(&value);
    if (err)
    {
        k_mutex_lock(&status_mutex, K_FOREVER);
        sensor_failures++;
        uint32_t consecutive = ++consecutive_failures;
        k_mutex_unlock(&status_mutex);

        if (consecutive > config.max_consecutive_sensor_failures)
        {
            LOG_ERR("Sensor failed %u times in a row (err %d)", consecutive, err);
            return err_t::SENSOR_READ_ERROR;
        }

        // Keep the previous cadence, skip this sample
        LOG_WRN("Sensor read failed (err %d), %u consecutive", err, consecutive);
        return err_t::NO_ERROR;
    }

    k_mutex_lock(&status_mutex, K_FOREVER);
    consecutive_failures = 0;
    bool report_due = !has_report ||
                      (now_ms - last_report_ms) >= static_cast<int64_t>(config.cadence.report_interval_ms);
    k_mutex_unlock(&status_mutex);

    accel_sample_t sample = {value, now_ms};
    step_event_t step;

    if (detector.observe(sample, &step))
    {
        report(estimator.onStep(step), now_ms);
    }
    else if (report_due)
    {
        // Lets the cadence decay to 0 once steps stop
        report(estimator.tick(now_ms), now_ms);
    }

    return err_t::NO_ERROR;
}

void Orchestrator::report(const cadence_sample_t &cadence, int64_t now_ms)
{
    rsc_measurement_t measurement = mapper.map(cadence.cadence_spm);

    rsc_peripheral.notify(measurement);

    k_mutex_lock(&status_mutex, K_FOREVER);
    last_cadence = cadence;
    last_measurement = measurement;
    step_total = detector.stepCount();
    last_report_ms = now_ms;
    has_report = true;
    k_mutex_unlock(&status_mutex);

    LOG_DBG("cadence %u spm -> %u spm, speed %u/256 m/s", cadence.cadence_spm, measurement.cadence_spm,
            measurement.speed);
}

void Orchestrator::requestStop()
{
    atomic_set(&stop_requested, 1);
    k_timer_stop(&tick_timer);
}

bool Orchestrator::stopRequested() const
{
    return atomic_get(&stop_requested) != 0;
}

void Orchestrator::shutdown()
{
    requestStop();
    rsc_peripheral.shutdown();
}

void Orchestrator::getStatus(rsc_status_t *status) const
{
    if (!status)
    {
        return;
    }

    k_mutex_lock(&status_mutex, K_FOREVER);
    status->running = atomic_get(&running) != 0;
    status->cadence = last_cadence;
    status->measurement = last_measurement;
    status->sensor_failures = sensor_failures;
    status->consecutive_sensor_failures = consecutive_failures;
    status->steps_detected = step_total;
    k_mutex_unlock(&status_mutex);

    rsc_peripheral.getStatus(&status->peripheral);
}
