/**
 * @file rsc_cmd.cpp
 * @brief Shell commands for the RSC peripheral
 *
 * Commands:
 *   - rsc status: Peripheral state, subscribers, last cadence and counters
 *   - rsc stop: Stop sampling and shut the peripheral down
 */

#include <zephyr/kernel.h>
#include <zephyr/shell/shell.h>

#include <app.hpp>
#include <events/app_state_event.h>
#include <gatt_peripheral.hpp>

static int cmd_rsc_status(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);

    rsc_status_t status;
    err_t err = app_get_status(&status);
    if (err != err_t::NO_ERROR) {
        shell_error(sh, "RSC module not running: %s", err_to_str(err));
        return -ENODEV;
    }

    shell_print(sh, "Peripheral: %s", adv_state_to_str(status.peripheral.state));
    shell_print(sh, "Sampling:   %s", status.running ? "running" : "stopped");
    shell_print(sh, "Centrals:   %u connected, %u subscribed", status.peripheral.connected,
                status.peripheral.subscribed);
    shell_print(sh, "Cadence:    %u spm (%u steps in window), reported %u spm", status.cadence.cadence_spm,
                status.cadence.steps_in_window, status.measurement.cadence_spm);
    // 1/256 m/s to mm/s
    shell_print(sh, "Speed:      %u mm/s", (unsigned int)((status.measurement.speed * 1000U) / 256U));
    shell_print(sh, "Steps:      %u", status.steps_detected);
    shell_print(sh, "Sensor:     %u failures (%u in a row)", status.sensor_failures,
                status.consecutive_sensor_failures);
    shell_print(sh, "Notify:     %u sent, %u dropped, %u failed", status.peripheral.notifications_sent,
                status.peripheral.notifications_dropped, status.peripheral.notifications_failed);
    shell_print(sh, "Advertise:  %u attempts, %u failed (last err %d)", status.peripheral.adv_attempts,
                status.peripheral.adv_failures, status.peripheral.adv_last_error);
    return 0;
}

static int cmd_rsc_stop(const struct shell *sh, size_t argc, char **argv)
{
    ARG_UNUSED(argc);
    ARG_UNUSED(argv);

    struct app_state_event *event = new_app_state_event();
    event->state = APP_STATE_SHUTDOWN_PREPARING;
    APP_EVENT_SUBMIT(event);

    shell_print(sh, "Shutdown requested");
    return 0;
}

SHELL_STATIC_SUBCMD_SET_CREATE(rsc_cmds,
    SHELL_CMD(status, NULL, "Show RSC peripheral status", cmd_rsc_status),
    SHELL_CMD(stop, NULL, "Stop sampling and shut the peripheral down", cmd_rsc_stop),
    SHELL_SUBCMD_SET_END
);

SHELL_CMD_REGISTER(rsc, &rsc_cmds, "Running Speed and Cadence commands", NULL);
