/**
 * @file accel_sample_source.cpp
 * @brief SampleSource reading one axis of a Zephyr accelerometer
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#include <cerrno>

#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include "accel_sample_source.hpp"

LOG_MODULE_REGISTER(accel_source, CONFIG_RSC_PIPELINE_LOG_LEVEL);

AccelSampleSource::AccelSampleSource(const struct device *dev, enum sensor_channel channel) : dev(dev), channel(channel)
{
}

int AccelSampleSource::init()
{
    if (!dev || !device_is_ready(dev)) {
        LOG_ERR("Accelerometer device not ready");
        return -ENODEV;
    }

    // Full scale in m/s^2
    struct sensor_value range;
    sensor_g_to_ms2(CONFIG_RSC_ACCEL_FULL_SCALE_G, &range);

    int err = sensor_attr_set(dev, SENSOR_CHAN_ACCEL_XYZ, SENSOR_ATTR_FULL_SCALE, &range);
    if (err) {
        // Some drivers only take the range from devicetree
        LOG_WRN("Could not set +/-%d g range on %s (err %d)", CONFIG_RSC_ACCEL_FULL_SCALE_G, dev->name, err);
    }

    LOG_INF("Accelerometer %s ready", dev->name);
    return 0;
}

int AccelSampleSource::read(float *value)
{
    if (!value) {
        return -EINVAL;
    }

    int err = sensor_sample_fetch(dev);
    if (err) {
        LOG_DBG("sensor_sample_fetch failed (err %d)", err);
        return err;
    }

    struct sensor_value val;
    err = sensor_channel_get(dev, channel, &val);
    if (err) {
        LOG_DBG("sensor_channel_get failed (err %d)", err);
        return err;
    }

    *value = static_cast<float>(sensor_value_to_double(&val));
    return 0;
}
