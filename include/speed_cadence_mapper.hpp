/**
 * @file speed_cadence_mapper.hpp
 * @brief Machine cadence to equivalent running cadence and speed
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#ifndef APP_INCLUDE_SPEED_CADENCE_MAPPER_HEADER_
#define APP_INCLUDE_SPEED_CADENCE_MAPPER_HEADER_

#include <cstdint>

#include <rsc_config.hpp>
#include <rsc_types.hpp>

// Speed unit of the RSC Measurement characteristic is 1/256 m/s
constexpr uint32_t RSC_SPEED_RESOLUTION = 256;

/**
 * @brief Linear mapping through the origin.
 *
 * adjusted = round(c * ref_run / ref_machine), clamped to 255
 * speed    = round(c * ref_run * stride_mm * 256 / (ref_machine * 60 * 1000)),
 *            clamped to 65535
 *
 * With the defaults (120 -> 180 spm, 1490 mm stride) the reference cadence
 * maps to about 4.47 m/s.
 */
class SpeedCadenceMapper {
public:
    explicit SpeedCadenceMapper(const mapper_config_t &config);

    rsc_measurement_t map(uint16_t cadence_spm) const;

private:
    mapper_config_t config;
};

#endif // APP_INCLUDE_SPEED_CADENCE_MAPPER_HEADER_
