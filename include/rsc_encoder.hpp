/**
 * @file rsc_encoder.hpp
 * @brief RSC Measurement characteristic encoding
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#ifndef APP_INCLUDE_RSC_ENCODER_HEADER_
#define APP_INCLUDE_RSC_ENCODER_HEADER_

#include <array>
#include <cstddef>
#include <cstdint>

#include <rsc_types.hpp>

// RSC Measurement flags (Bluetooth RSC service, 0x2A53)
#define RSC_FLAG_STRIDE_LENGTH_PRESENT  0x01
#define RSC_FLAG_TOTAL_DISTANCE_PRESENT 0x02
#define RSC_FLAG_RUNNING                0x04

// Flags + speed (uint16 LE) + cadence (uint8)
constexpr size_t RSC_MEASUREMENT_LEN = 4;

// RSC Feature bit 2: walking or running status supported
constexpr uint16_t RSC_FEATURE_WALK_RUN_STATUS = 0x0004;

using rsc_payload_t = std::array<uint8_t, RSC_MEASUREMENT_LEN>;

/**
 * @brief Encodes a measurement without optional fields.
 *
 * Output is always 4 bytes: 0x04, speed LSB, speed MSB, cadence.
 */
rsc_payload_t rsc_measurement_encode(const rsc_measurement_t &measurement);

/**
 * @brief Decodes a payload produced by rsc_measurement_encode().
 *
 * @param data Payload bytes
 * @param len Payload length
 * @param measurement Output
 * @return 0 on success
 * @return -EINVAL if the length is not 4 or an argument is NULL
 * @return -ENOTSUP if the flags announce optional fields
 */
int rsc_measurement_decode(const uint8_t *data, size_t len, rsc_measurement_t *measurement);

#endif // APP_INCLUDE_RSC_ENCODER_HEADER_
