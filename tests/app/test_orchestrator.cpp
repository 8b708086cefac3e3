/**
 * @file test_orchestrator.cpp
 * @brief Unit tests for configuration checks and the sampling loop
 */

#include <cerrno>
#include <cmath>
#include <cstring>

#include <zephyr/fff.h>
#include <zephyr/kernel.h>
#include <zephyr/ztest.h>

#include <orchestrator.hpp>
#include <rsc_config.hpp>
#include <rsc_encoder.hpp>

#include "../bluetooth/fake_host_stack.hpp"

DEFINE_FFF_GLOBALS;

FAKE_VALUE_FUNC(int, fake_source_init);
FAKE_VALUE_FUNC(int, fake_source_read, float *);

static constexpr float TEST_PI = 3.14159265f;
static constexpr uint32_t SETTLE_MS = 500;

class FakeSampleSource : public SampleSource
{
  public:
    int init() override { return fake_source_init(); }
    int read(float *value) override { return fake_source_read(value); }
};

// Time seen by the sine source, advanced by the test before every tick
static int64_t drive_time_ms;

static int read_gravity(float *value)
{
    *value = 9.81f;
    return 0;
}

static int read_sine_2hz(float *value)
{
    *value = 9.81f + 10.0f * sinf(2.0f * TEST_PI * 2.0f * (float)drive_time_ms / 1000.0f);
    return 0;
}

static int read_fail(float *value)
{
    ARG_UNUSED(value);
    return -EIO;
}

struct orchestrator_fixture {
    FakeHostStack host;
    FakeSampleSource source;
    rsc_config_t config;
};

static void *orchestrator_setup(void)
{
    static struct orchestrator_fixture fixture;
    return &fixture;
}

static void orchestrator_before(void *f)
{
    struct orchestrator_fixture *fixture = (struct orchestrator_fixture *)f;

    RESET_FAKE(fake_source_init);
    RESET_FAKE(fake_source_read);
    FFF_RESET_HISTORY();

    fake_source_init_fake.return_val = 0;
    fake_source_read_fake.custom_fake = read_gravity;
    drive_time_ms = 0;

    fixture->host.reset();

    fixture->config = rsc_config_default();
    fixture->config.sample_period_ms = 20;
    fixture->config.max_consecutive_sensor_failures = 3;
    fixture->config.detector.min_amplitude = 6.0f;
    fixture->config.detector.refractory_ms = 250;
    fixture->config.detector.baseline_alpha = 0.02f;
    fixture->config.cadence.horizon_ms = 5000;
    fixture->config.cadence.report_interval_ms = 1000;
    fixture->config.mapper.reference_cadence_spm = 120;
    fixture->config.mapper.reference_running_cadence_spm = 180;
    fixture->config.mapper.stride_length_mm = 1490;
    fixture->config.peripheral.adv_retry.initial_delay_ms = 1;
    fixture->config.peripheral.adv_retry.max_delay_ms = 4;
    fixture->config.peripheral.adv_retry.jitter_enabled = false;
    fixture->config.peripheral.drain_timeout_ms = 50;
}

ZTEST_SUITE(orchestrator, NULL, orchestrator_setup, orchestrator_before, NULL, NULL);

ZTEST(orchestrator, test_default_config_is_valid)
{
    rsc_config_t config = rsc_config_default();

    zassert_equal(rsc_config_validate(&config), err_t::NO_ERROR);
    zassert_true(strlen(config.peripheral.device_name) > 0);
    zassert_equal(config.peripheral.tx_power_dbm, CONFIG_RSC_ADV_TX_POWER_DBM);
    zassert_equal(rsc_config_validate(nullptr), err_t::CONFIGURATION_ERROR);
}

ZTEST_F(orchestrator, test_config_rejects_invalid_fields)
{
    const rsc_config_t good = fixture->config;
    zassert_equal(rsc_config_validate(&good), err_t::NO_ERROR);

    rsc_config_t config = good;
    config.sample_period_ms = 0;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "sample period");

    config = good;
    config.max_consecutive_sensor_failures = 0;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "failure limit");

    config = good;
    config.detector.min_amplitude = 0.0f;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "amplitude");

    config = good;
    config.detector.refractory_ms = 0;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "refractory");

    config = good;
    config.detector.baseline_alpha = 1.5f;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "alpha");

    config = good;
    config.cadence.horizon_ms = 100;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "horizon below refractory");

    config = good;
    config.detector.refractory_ms = 1;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "window capacity");

    config = good;
    config.cadence.report_interval_ms = 0;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "report interval");

    config = good;
    config.mapper.reference_cadence_spm = 0;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "reference cadence");

    config = good;
    config.mapper.stride_length_mm = 0;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "stride length");

    config = good;
    config.peripheral.device_name[0] = '\0';
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "device name");

    config = good;
    config.peripheral.adv_retry.max_attempts = 0;
    zassert_equal(rsc_config_validate(&config), err_t::CONFIGURATION_ERROR, "advertising attempts");
}

ZTEST_F(orchestrator, test_init_rejects_bad_config)
{
    fixture->config.sample_period_ms = 0;
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);

    zassert_equal(orchestrator.init(), err_t::CONFIGURATION_ERROR);
    zassert_equal(fake_source_init_fake.call_count, 0);
    zassert_equal(fixture->host.callCount("register"), 0);
}

ZTEST_F(orchestrator, test_init_source_failure)
{
    fake_source_init_fake.return_val = -ENODEV;
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);

    zassert_equal(orchestrator.init(), err_t::SENSOR_READ_ERROR);
    zassert_equal(fixture->host.callCount("register"), 0, "Service published without a sensor");
}

ZTEST_F(orchestrator, test_init_first_read_failure)
{
    fake_source_read_fake.custom_fake = read_fail;
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);

    zassert_equal(orchestrator.init(), err_t::SENSOR_READ_ERROR);
    zassert_equal(fake_source_read_fake.call_count, 1);
    zassert_equal(fixture->host.callCount("register"), 0);
}

ZTEST_F(orchestrator, test_init_registration_failure)
{
    fixture->host.register_result = -ENOMEM;
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);

    zassert_equal(orchestrator.init(), err_t::REGISTRATION_ERROR);
    zassert_equal(orchestrator.peripheral().state(), adv_state_t::IDLE);
}

ZTEST_F(orchestrator, test_init_advertising_failure)
{
    fixture->host.adv_failures_remaining = 100;
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);

    zassert_equal(orchestrator.init(), err_t::REGISTRATION_ERROR);
    zassert_equal(orchestrator.peripheral().state(), adv_state_t::REGISTERED);
}

ZTEST_F(orchestrator, test_init_starts_advertising)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);

    zassert_equal(orchestrator.init(), err_t::NO_ERROR);
    zassert_equal(orchestrator.peripheral().state(), adv_state_t::ADVERTISING);
    zassert_equal(fixture->host.adv_uuids.size(), 1);
    zassert_equal(fixture->host.adv_uuids[0], RSC_UUID_SERVICE);
}

ZTEST_F(orchestrator, test_idle_machine_reports_zero)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);

    orchestrator.peripheral().onCentralConnected(0);
    zassert_equal(orchestrator.peripheral().onSubscriptionChanged(0, true), 0);

    zassert_equal(orchestrator.tick(0), err_t::NO_ERROR);
    zassert_true(orchestrator.peripheral().flush(SETTLE_MS));

    zassert_equal(fixture->host.sentCount(0), 1);
    rsc_payload_t payload = fixture->host.sentAt(0, 0);
    const uint8_t expected[] = {0x04, 0x00, 0x00, 0x00};
    zassert_mem_equal(payload.data(), expected, sizeof(expected));

    // No new report before the interval has elapsed
    zassert_equal(orchestrator.tick(500), err_t::NO_ERROR);
    zassert_true(orchestrator.peripheral().flush(SETTLE_MS));
    zassert_equal(fixture->host.sentCount(0), 1);

    zassert_equal(orchestrator.tick(1000), err_t::NO_ERROR);
    zassert_true(orchestrator.peripheral().flush(SETTLE_MS));
    zassert_equal(fixture->host.sentCount(0), 2);
}

ZTEST_F(orchestrator, test_sensor_failures_escalate)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);

    fake_source_read_fake.custom_fake = read_fail;
    zassert_equal(orchestrator.tick(0), err_t::NO_ERROR);
    zassert_equal(orchestrator.tick(20), err_t::NO_ERROR);
    zassert_equal(orchestrator.tick(40), err_t::NO_ERROR);
    zassert_equal(orchestrator.tick(60), err_t::SENSOR_READ_ERROR);

    rsc_status_t status;
    orchestrator.getStatus(&status);
    zassert_equal(status.sensor_failures, 4);
    zassert_equal(status.consecutive_sensor_failures, 4);
}

ZTEST_F(orchestrator, test_successful_read_resets_failure_count)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);

    int64_t now = 0;
    for (int round = 0; round < 3; round++) {
        fake_source_read_fake.custom_fake = read_fail;
        for (uint32_t i = 0; i < fixture->config.max_consecutive_sensor_failures; i++) {
            zassert_equal(orchestrator.tick(now), err_t::NO_ERROR);
            now += 20;
        }
        fake_source_read_fake.custom_fake = read_gravity;
        zassert_equal(orchestrator.tick(now), err_t::NO_ERROR);
        now += 20;
    }

    rsc_status_t status;
    orchestrator.getStatus(&status);
    zassert_equal(status.sensor_failures, 9);
    zassert_equal(status.consecutive_sensor_failures, 0);
}

ZTEST_F(orchestrator, test_running_cadence_reaches_subscriber)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);

    orchestrator.peripheral().onCentralConnected(0);
    zassert_equal(orchestrator.peripheral().onSubscriptionChanged(0, true), 0);

    fake_source_read_fake.custom_fake = read_sine_2hz;
    for (drive_time_ms = 0; drive_time_ms <= 10000; drive_time_ms += 20) {
        zassert_equal(orchestrator.tick(drive_time_ms), err_t::NO_ERROR);
    }
    zassert_true(orchestrator.peripheral().flush(SETTLE_MS));

    rsc_status_t status;
    orchestrator.getStatus(&status);
    zassert_true(status.steps_detected >= 19 && status.steps_detected <= 21, "steps %u", status.steps_detected);
    zassert_true(status.cadence.cadence_spm >= 118 && status.cadence.cadence_spm <= 122, "cadence %u",
                 status.cadence.cadence_spm);
    zassert_true(status.measurement.cadence_spm >= 175 && status.measurement.cadence_spm <= 185,
                 "reported cadence %u", status.measurement.cadence_spm);
    zassert_true(status.measurement.speed > 0);

    size_t sent = fixture->host.sentCount(0);
    zassert_true(sent > 0);

    rsc_measurement_t last;
    rsc_payload_t payload = fixture->host.sentAt(0, sent - 1);
    zassert_equal(rsc_measurement_decode(payload.data(), payload.size(), &last), 0);
    zassert_equal(last.cadence_spm, status.measurement.cadence_spm);
    zassert_equal(last.speed, status.measurement.speed);
}

ZTEST_F(orchestrator, test_cadence_decays_after_steps_stop)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);

    fake_source_read_fake.custom_fake = read_sine_2hz;
    for (drive_time_ms = 0; drive_time_ms <= 5000; drive_time_ms += 20) {
        orchestrator.tick(drive_time_ms);
    }

    fake_source_read_fake.custom_fake = read_gravity;
    for (; drive_time_ms <= 12000; drive_time_ms += 20) {
        orchestrator.tick(drive_time_ms);
    }

    rsc_status_t status;
    orchestrator.getStatus(&status);
    zassert_equal(status.cadence.cadence_spm, 0);
    zassert_equal(status.measurement.cadence_spm, 0);
    zassert_equal(status.measurement.speed, 0);
}

ZTEST_F(orchestrator, test_stop_before_run)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);

    orchestrator.requestStop();
    zassert_true(orchestrator.stopRequested());
    zassert_equal(orchestrator.run(), err_t::NO_ERROR);

    rsc_status_t status;
    orchestrator.getStatus(&status);
    zassert_false(status.running);
}

static Orchestrator *stop_target;

static void stop_work_handler(struct k_work *work)
{
    ARG_UNUSED(work);
    stop_target->requestStop();
}

static struct k_work_delayable stop_work;

ZTEST_F(orchestrator, test_run_until_stopped)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);
    uint32_t reads_after_init = fake_source_read_fake.call_count;

    stop_target = &orchestrator;
    k_work_init_delayable(&stop_work, stop_work_handler);
    k_work_schedule(&stop_work, K_MSEC(200));

    zassert_equal(orchestrator.run(), err_t::NO_ERROR);

    uint32_t ticks = fake_source_read_fake.call_count - reads_after_init;
    zassert_true(ticks >= 5 && ticks <= 11, "%u ticks in 200 ms", ticks);

    orchestrator.shutdown();
    zassert_equal(orchestrator.peripheral().state(), adv_state_t::IDLE);
    zassert_equal(fixture->host.callCount("unregister"), 1);
}

ZTEST_F(orchestrator, test_run_stops_on_sensor_failure)
{
    Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
    zassert_equal(orchestrator.init(), err_t::NO_ERROR);

    fake_source_read_fake.custom_fake = read_fail;
    zassert_equal(orchestrator.run(), err_t::SENSOR_READ_ERROR);
    zassert_equal(fake_source_read_fake.call_count, 1 + fixture->config.max_consecutive_sensor_failures + 1);
}

ZTEST_F(orchestrator, test_shutdown_tears_down_peripheral)
{
    {
        Orchestrator orchestrator(fixture->config, fixture->source, fixture->host, &k_sys_work_q);
        zassert_equal(orchestrator.init(), err_t::NO_ERROR);

        orchestrator.peripheral().onCentralConnected(0);
        zassert_equal(orchestrator.peripheral().onSubscriptionChanged(0, true), 0);

        orchestrator.shutdown();
        zassert_equal(orchestrator.peripheral().state(), adv_state_t::IDLE);
        zassert_true(orchestrator.stopRequested());

        // Ticks after shutdown notify nobody
        zassert_equal(orchestrator.tick(0), err_t::NO_ERROR);
        zassert_equal(fixture->host.sentCount(0), 0);
    }

    zassert_equal(fixture->host.callCount("adv_stop"), 1);
    zassert_equal(fixture->host.callCount("unregister"), 1);
}
