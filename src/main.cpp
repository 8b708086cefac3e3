/**
 * @file main.cpp
 * @brief Firmware entry point
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */
#define MODULE main

#include <app_event_manager.h>
#include <caf/events/module_state_event.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <app.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_APP_MODULE_LOG_LEVEL);

int main(void)
{
    if (app_event_manager_init() != 0)
    {
        LOG_ERR("Application Event Manager not initialized");
        return -1;
    }

    LOG_INF("Starting up");
    module_set_state(MODULE_STATE_READY);

    int rc = app_wait_for_exit();
    if (rc != 0)
    {
        LOG_ERR("Exiting with error %d", rc);
    }
    else
    {
        LOG_INF("Stopped");
    }
    return rc;
}
