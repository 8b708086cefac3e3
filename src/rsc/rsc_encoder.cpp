/**
 * @file rsc_encoder.cpp
 * @brief RSC Measurement characteristic encoding
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#include <cerrno>

#include <rsc_encoder.hpp>
#include <zephyr/sys/byteorder.h>

rsc_payload_t rsc_measurement_encode(const rsc_measurement_t &measurement)
{
    rsc_payload_t payload;

    payload[0] = RSC_FLAG_RUNNING;
    sys_put_le16(measurement.speed, &payload[1]);
    payload[3] = measurement.cadence_spm;

    return payload;
}

int rsc_measurement_decode(const uint8_t *data, size_t len, rsc_measurement_t *measurement)
{
    if (!data || !measurement || len != RSC_MEASUREMENT_LEN) {
        return -EINVAL;
    }

    if (data[0] & (RSC_FLAG_STRIDE_LENGTH_PRESENT | RSC_FLAG_TOTAL_DISTANCE_PRESENT)) {
        return -ENOTSUP;
    }

    measurement->speed = sys_get_le16(&data[1]);
    measurement->cadence_spm = data[3];
    return 0;
}
