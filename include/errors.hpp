/**
 * @file errors.hpp
 * @brief Module level error codes
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_ERRORS_H_
#define APP_INCLUDE_ERRORS_H_

#include <stdint.h>

enum class err_t
{
    NO_ERROR = 0,
    BLUETOOTH_ERROR = -5,
    HARDWARE = -15,
    INVALID_PARAMETER = -29,

    // RSC pipeline and peripheral errors continue from here
    SENSOR_READ_ERROR = -40,
    REGISTRATION_ERROR = -41,
    NOTIFY_DELIVERY_ERROR = -42,
    CONFIGURATION_ERROR = -43,
};

const char *err_to_str(err_t err);

#endif // APP_INCLUDE_ERRORS_H_
