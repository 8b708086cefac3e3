/**
 * @file speed_cadence_mapper.cpp
 * @brief Machine cadence to equivalent running cadence and speed
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#include <speed_cadence_mapper.hpp>

static constexpr uint64_t MS_PER_MINUTE = 60000;

// round(num / den) for unsigned operands
static inline uint64_t div_round(uint64_t num, uint64_t den)
{
    return (num + den / 2) / den;
}

SpeedCadenceMapper::SpeedCadenceMapper(const mapper_config_t &config) : config(config)
{
}

rsc_measurement_t SpeedCadenceMapper::map(uint16_t cadence_spm) const
{
    rsc_measurement_t m = {0, 0};

    if (cadence_spm == 0 || config.reference_cadence_spm == 0) {
        return m;
    }

    uint64_t scaled = static_cast<uint64_t>(cadence_spm) * config.reference_running_cadence_spm;

    uint64_t adjusted = div_round(scaled, config.reference_cadence_spm);
    m.cadence_spm = adjusted > UINT8_MAX ? UINT8_MAX : static_cast<uint8_t>(adjusted);

    // steps/min * mm/step -> mm/min, then to 1/256 m/s
    uint64_t speed = div_round(scaled * config.stride_length_mm * RSC_SPEED_RESOLUTION,
                               static_cast<uint64_t>(config.reference_cadence_spm) * MS_PER_MINUTE);
    m.speed = speed > UINT16_MAX ? UINT16_MAX : static_cast<uint16_t>(speed);

    return m;
}
