/**
 * @file test_speed_cadence_mapper.cpp
 * @brief Unit tests for the cadence to speed mapping
 */

#include <zephyr/ztest.h>

#include <speed_cadence_mapper.hpp>

static const mapper_config_t default_mapper = {
    .reference_cadence_spm = 120,
    .reference_running_cadence_spm = 180,
    .stride_length_mm = 1490,
};

ZTEST_SUITE(speed_cadence_mapper, NULL, NULL, NULL, NULL, NULL);

ZTEST(speed_cadence_mapper, test_zero_maps_to_zero)
{
    SpeedCadenceMapper mapper(default_mapper);

    rsc_measurement_t m = mapper.map(0);
    zassert_equal(m.speed, 0);
    zassert_equal(m.cadence_spm, 0);
}

ZTEST(speed_cadence_mapper, test_reference_cadence_is_six_minute_mile)
{
    SpeedCadenceMapper mapper(default_mapper);

    rsc_measurement_t m = mapper.map(120);
    zassert_equal(m.cadence_spm, 180);
    // 180 * 1.49 m / 60 s = 4.47 m/s
    zassert_equal(m.speed, 1144);
    zassert_within((float)m.speed / 256.0f, 4.47f, 0.01f);
}

ZTEST(speed_cadence_mapper, test_monotonic_over_cadence_range)
{
    SpeedCadenceMapper mapper(default_mapper);
    rsc_measurement_t prev = mapper.map(0);

    for (uint16_t c = 1; c <= 255; c++) {
        rsc_measurement_t m = mapper.map(c);
        zassert_true(m.speed >= prev.speed, "Speed decreased at %u spm", c);
        zassert_true(m.cadence_spm >= prev.cadence_spm, "Cadence decreased at %u spm", c);
        prev = m;
    }
}

ZTEST(speed_cadence_mapper, test_cadence_clamped_to_255)
{
    SpeedCadenceMapper mapper(default_mapper);

    zassert_equal(mapper.map(170).cadence_spm, 255);
    zassert_equal(mapper.map(200).cadence_spm, 255);
    zassert_equal(mapper.map(200).speed, 1907);
}

ZTEST(speed_cadence_mapper, test_speed_clamped_to_uint16)
{
    mapper_config_t config = default_mapper;
    config.stride_length_mm = 60000;
    SpeedCadenceMapper mapper(config);

    zassert_equal(mapper.map(255).speed, UINT16_MAX);
    zassert_equal(mapper.map(UINT16_MAX).speed, UINT16_MAX);
    zassert_equal(mapper.map(UINT16_MAX).cadence_spm, UINT8_MAX);
}
