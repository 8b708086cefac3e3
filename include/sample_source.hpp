/**
 * @file sample_source.hpp
 * @brief Single axis acceleration input
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 */

#ifndef APP_INCLUDE_SAMPLE_SOURCE_HEADER_
#define APP_INCLUDE_SAMPLE_SOURCE_HEADER_

class SampleSource {
public:
    virtual ~SampleSource() = default;

    // 0 or negative errno
    virtual int init() = 0;

    /**
     * @brief Reads the configured axis.
     *
     * @param value Acceleration in m/s^2
     * @return 0 or negative errno
     */
    virtual int read(float *value) = 0;
};

#endif // APP_INCLUDE_SAMPLE_SOURCE_HEADER_
