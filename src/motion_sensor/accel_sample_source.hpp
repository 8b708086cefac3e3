/**
 * @file accel_sample_source.hpp
 * @brief SampleSource reading one axis of a Zephyr accelerometer
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#ifndef APP_MOTION_SENSOR_ACCEL_SAMPLE_SOURCE_HEADER_
#define APP_MOTION_SENSOR_ACCEL_SAMPLE_SOURCE_HEADER_

#include <zephyr/device.h>
#include <zephyr/drivers/sensor.h>

#include <sample_source.hpp>

class AccelSampleSource : public SampleSource {
public:
    AccelSampleSource(const struct device *dev, enum sensor_channel channel);

    int init() override;
    int read(float *value) override;

private:
    const struct device *dev;
    enum sensor_channel channel;
};

#endif // APP_MOTION_SENSOR_ACCEL_SAMPLE_SOURCE_HEADER_
