/**
 * @file app.hpp
 * @brief Application module owning the RSC orchestrator
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */
#ifndef APP_INCLUDE_APP_HEADER_
#define APP_INCLUDE_APP_HEADER_

#include <errors.hpp>
#include <orchestrator.hpp>

/**
 * @brief Blocks until the sampling loop has ended and the peripheral is down.
 *
 * @return 0 after a requested stop, the err_t value of a fatal error otherwise
 */
int app_wait_for_exit(void);

// Snapshot for diagnostics, err_t::HARDWARE before the module started
err_t app_get_status(rsc_status_t *status);

#endif // APP_INCLUDE_APP_HEADER_
