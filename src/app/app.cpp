/**
 * @file app.cpp
 * @brief Application module owning the RSC orchestrator
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE app

/*************************** INCLUDE HEADERS ********************************/
#include <app_event_manager.h>
#include <caf/events/module_state_event.h>
#include <events/app_state_event.h>
#include <events/rsc_state_event.h>
#include <zephyr/device.h>
#include <zephyr/devicetree.h>
#include <zephyr/drivers/sensor.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <app.hpp>
#include <errors.hpp>
#include <orchestrator.hpp>
#include <rsc_config.hpp>

#include "../bluetooth/zephyr_host_stack.hpp"
#include "../motion_sensor/accel_sample_source.hpp"

LOG_MODULE_DECLARE(MODULE, CONFIG_APP_MODULE_LOG_LEVEL);

#define ACCEL_NODE DT_ALIAS(accel0)

#if IS_ENABLED(CONFIG_RSC_ACCEL_AXIS_Y)
static constexpr enum sensor_channel accel_channel = SENSOR_CHAN_ACCEL_Y;
#elif IS_ENABLED(CONFIG_RSC_ACCEL_AXIS_Z)
static constexpr enum sensor_channel accel_channel = SENSOR_CHAN_ACCEL_Z;
#else
static constexpr enum sensor_channel accel_channel = SENSOR_CHAN_ACCEL_X;
#endif

/********************************** APP THREAD ********************************/
static constexpr int app_stack_size = CONFIG_APP_MODULE_STACK_SIZE;
static constexpr int app_priority = CONFIG_APP_MODULE_PRIORITY;
K_THREAD_STACK_DEFINE(app_stack_area, app_stack_size);
static struct k_thread app_thread_data;
static k_tid_t app_tid;

/********************************** WORK QUEUE ********************************/
// Notification delivery, keeps the host stack off the sampling thread
static constexpr int notify_workq_stack_size = CONFIG_BLUETOOTH_MODULE_STACK_SIZE;
static constexpr int notify_workq_priority = CONFIG_BLUETOOTH_MODULE_PRIORITY;
K_THREAD_STACK_DEFINE(notify_workq_stack, notify_workq_stack_size);
static struct k_work_q notify_work_q;

static const struct device *const accel_dev = DEVICE_DT_GET(ACCEL_NODE);

static ZephyrHostStack host_stack;
static AccelSampleSource accel_source(accel_dev, accel_channel);
static Orchestrator orchestrator(rsc_config_default(), accel_source, host_stack, &notify_work_q);

static atomic_t app_started;
static int app_exit_code;
static K_SEM_DEFINE(app_exit_sem, 0, 1);

void app_entry(void * /*unused*/, void * /*unused*/, void * /*unused*/);

static enum rsc_state_t to_rsc_state(adv_state_t state)
{
    switch (state)
    {
        case adv_state_t::REGISTERED:
            return RSC_STATE_REGISTERED;
        case adv_state_t::ADVERTISING:
            return RSC_STATE_ADVERTISING;
        case adv_state_t::IDLE:
        default:
            return RSC_STATE_IDLE;
    }
}

static void peripheral_state_changed(adv_state_t state, void *user_data)
{
    ARG_UNUSED(user_data);

    struct rsc_state_event *event = new_rsc_state_event();
    event->state = to_rsc_state(state);
    APP_EVENT_SUBMIT(event);
}

static void app_init()
{
    if (atomic_set(&app_started, 1) != 0)
    {
        return;
    }

    k_work_queue_init(&notify_work_q);
    k_work_queue_start(&notify_work_q, notify_workq_stack, K_THREAD_STACK_SIZEOF(notify_workq_stack),
                       notify_workq_priority, NULL);
    k_thread_name_set(&notify_work_q.thread, "rsc_notify_wq");

    orchestrator.peripheral().setStateCallback(peripheral_state_changed, nullptr);

    app_tid = k_thread_create(&app_thread_data, app_stack_area, K_THREAD_STACK_SIZEOF(app_stack_area), app_entry,
                              nullptr, nullptr, nullptr, app_priority, 0, K_NO_WAIT);

    LOG_INF("APP Module Initialised");
}

void app_entry(void * /*unused*/, void * /*unused*/, void * /*unused*/)
{
    k_thread_name_set(app_tid, "app");

    err_t err = orchestrator.init();
    if (err != err_t::NO_ERROR)
    {
        LOG_ERR("RSC startup failed: %s", err_to_str(err));
    }
    else
    {
        module_set_state(MODULE_STATE_READY);
        err = orchestrator.run();
        if (err != err_t::NO_ERROR)
        {
            LOG_ERR("RSC sampling stopped: %s", err_to_str(err));
        }
    }

    orchestrator.shutdown();

    if (err != err_t::NO_ERROR)
    {
        module_set_state(MODULE_STATE_ERROR);
        app_exit_code = static_cast<int>(err);
    }
    else
    {
        module_set_state(MODULE_STATE_OFF);
        app_exit_code = 0;
    }

    k_sem_give(&app_exit_sem);
}

int app_wait_for_exit(void)
{
    k_sem_take(&app_exit_sem, K_FOREVER);
    return app_exit_code;
}

err_t app_get_status(rsc_status_t *status)
{
    if (!status)
    {
        return err_t::INVALID_PARAMETER;
    }
    if (atomic_get(&app_started) == 0)
    {
        return err_t::HARDWARE;
    }

    orchestrator.getStatus(status);
    return err_t::NO_ERROR;
}

// Return type dictates if event is consumed. False = Not Consumed, True =
// Consumed.
static bool app_event_handler(const struct app_event_header *aeh)
{
    if (is_module_state_event(aeh))
    {
        auto *event = cast_module_state_event(aeh);

        if (check_state(event, MODULE_ID(main), MODULE_STATE_READY))
        {
            app_init();
        }
        return false;
    }

    if (is_app_state_event(aeh))
    {
        auto *event = cast_app_state_event(aeh);

        if (event->state == APP_STATE_SHUTDOWN_PREPARING)
        {
            LOG_INF("Shutdown requested");
            orchestrator.requestStop();
        }
        return false;
    }

    if (is_rsc_state_event(aeh))
    {
        auto *event = cast_rsc_state_event(aeh);
        LOG_DBG("RSC peripheral state %d", event->state);
        return false;
    }

    return false;
}

APP_EVENT_LISTENER(MODULE, app_event_handler);
APP_EVENT_SUBSCRIBE(MODULE, app_state_event);
APP_EVENT_SUBSCRIBE(MODULE, rsc_state_event);
APP_EVENT_SUBSCRIBE(MODULE, module_state_event);
