/**
 * @file test_rsc_encoder.cpp
 * @brief Unit tests for RSC Measurement encoding
 */

#include <cerrno>

#include <zephyr/ztest.h>

#include <rsc_encoder.hpp>

ZTEST_SUITE(rsc_encoder, NULL, NULL, NULL, NULL, NULL);

ZTEST(rsc_encoder, test_zero_measurement_bytes)
{
    rsc_measurement_t m = {0, 0};
    rsc_payload_t payload = rsc_measurement_encode(m);

    const uint8_t expected[] = {0x04, 0x00, 0x00, 0x00};
    zassert_mem_equal(payload.data(), expected, sizeof(expected));
}

ZTEST(rsc_encoder, test_speed_is_little_endian)
{
    rsc_measurement_t m = {0x1234, 0x56};
    rsc_payload_t payload = rsc_measurement_encode(m);

    const uint8_t expected[] = {0x04, 0x34, 0x12, 0x56};
    zassert_mem_equal(payload.data(), expected, sizeof(expected));
}

ZTEST(rsc_encoder, test_decode_recovers_extremes)
{
    const rsc_measurement_t cases[] = {{0, 0}, {UINT16_MAX, UINT8_MAX}, {1144, 180}};

    for (const auto &in : cases) {
        rsc_payload_t payload = rsc_measurement_encode(in);
        rsc_measurement_t out = {};

        zassert_equal(rsc_measurement_decode(payload.data(), payload.size(), &out), 0);
        zassert_equal(out.speed, in.speed);
        zassert_equal(out.cadence_spm, in.cadence_spm);
    }
}

ZTEST(rsc_encoder, test_decode_rejects_wrong_length)
{
    const uint8_t data[] = {0x04, 0x00, 0x00, 0x00, 0x00};
    rsc_measurement_t out;

    zassert_equal(rsc_measurement_decode(data, 3, &out), -EINVAL);
    zassert_equal(rsc_measurement_decode(data, 5, &out), -EINVAL);
    zassert_equal(rsc_measurement_decode(data, 0, &out), -EINVAL);
    zassert_equal(rsc_measurement_decode(NULL, 4, &out), -EINVAL);
    zassert_equal(rsc_measurement_decode(data, 4, NULL), -EINVAL);
}

ZTEST(rsc_encoder, test_decode_rejects_optional_fields)
{
    const uint8_t stride[] = {0x05, 0x00, 0x01, 0x50};
    const uint8_t distance[] = {0x06, 0x00, 0x01, 0x50};
    rsc_measurement_t out;

    zassert_equal(rsc_measurement_decode(stride, sizeof(stride), &out), -ENOTSUP);
    zassert_equal(rsc_measurement_decode(distance, sizeof(distance), &out), -ENOTSUP);
}

ZTEST(rsc_encoder, test_decode_accepts_walking_flag)
{
    const uint8_t walking[] = {0x00, 0x80, 0x00, 0x3c};
    rsc_measurement_t out;

    zassert_equal(rsc_measurement_decode(walking, sizeof(walking), &out), 0);
    zassert_equal(out.speed, 0x0080);
    zassert_equal(out.cadence_spm, 60);
}
