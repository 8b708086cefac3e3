/**
 * @file gatt_peripheral.hpp
 * @brief RSC GATT peripheral: service lifecycle, subscriptions, notification delivery
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_INCLUDE_GATT_PERIPHERAL_HEADER_
#define APP_INCLUDE_GATT_PERIPHERAL_HEADER_

#include <cstdint>

#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include <errors.hpp>
#include <host_stack.hpp>
#include <retry_manager.hpp>
#include <rsc_config.hpp>
#include <rsc_encoder.hpp>
#include <rsc_types.hpp>

enum class adv_state_t : uint8_t
{
    IDLE,
    REGISTERED,
    ADVERTISING,
};

const char *adv_state_to_str(adv_state_t state);

typedef struct
{
    adv_state_t state;
    uint8_t connected;
    uint8_t subscribed;
    uint32_t notifications_sent;
    uint32_t notifications_dropped; // Overwritten in a mailbox or cancelled
    uint32_t notifications_failed;
    uint32_t adv_attempts;
    uint32_t adv_failures;
    int adv_last_error; // 0 until an advertising start fails
} peripheral_status_t;

typedef void (*peripheral_state_cb_t)(adv_state_t state, void *user_data);

/**
 * @brief State machine Idle -> Registered -> Advertising -> Idle.
 *
 * Every subscribed central has a single entry mailbox holding the latest
 * encoded measurement and at most one notification outstanding in the host.
 * Delivery runs on the work queue given at construction, never on the caller
 * of notify(). A central that is slow to complete only gets its mailbox
 * overwritten.
 */
class GattPeripheral : public GattEventListener
{
  public:
    GattPeripheral(HostStack &host, const peripheral_config_t &config, struct k_work_q *work_q);
    ~GattPeripheral() override;

    GattPeripheral(const GattPeripheral &) = delete;
    GattPeripheral &operator=(const GattPeripheral &) = delete;

    // Idle -> Registered. err_t::REGISTRATION_ERROR on failure.
    err_t registerService();

    /**
     * @brief Registered -> Advertising.
     *
     * Retries with exponential backoff. Aborted by shutdown().
     *
     * @return err_t::NO_ERROR, err_t::REGISTRATION_ERROR after the last
     * attempt, err_t::BLUETOOTH_ERROR if called in the wrong state or aborted
     */
    err_t startAdvertising();

    // No-op unless Advertising with at least one subscriber
    void notify(const rsc_measurement_t &measurement);

    /**
     * @brief Any -> Idle.
     *
     * Stops advertising, waits up to drain_timeout_ms for notifications in
     * flight, cancels the rest, unregisters the service and forgets every
     * central. Safe to call more than once.
     */
    void shutdown();

    /**
     * @brief Waits until no notification is pending or in flight.
     *
     * @return true if everything was delivered or failed within timeout_ms
     */
    bool flush(uint32_t timeout_ms);

    adv_state_t state() const;
    void getStatus(peripheral_status_t *status) const;
    void setStateCallback(peripheral_state_cb_t cb, void *user_data);

    // GattEventListener
    void onCentralConnected(central_id_t central) override;
    void onCentralDisconnected(central_id_t central) override;
    int onSubscriptionChanged(central_id_t central, bool enabled) override;
    void onNotifyComplete(central_id_t central, int err) override;
    uint8_t sensorLocation() const override;

  private:
    struct central_slot_t
    {
        GattPeripheral *owner;
        struct k_work work;
        bool in_use;
        bool subscribed;
        central_id_t id;
        bool has_pending; // Mailbox holds a value not yet handed to the host
        bool busy;        // One notification outstanding in the host
        rsc_payload_t pending;
    };

    static void deliverHandler(struct k_work *work);
    void deliver(central_slot_t *slot);

    central_slot_t *findSlot(central_id_t central);
    void releaseMailbox(central_slot_t *slot);
    void publishState(adv_state_t new_state);

    HostStack &host;
    peripheral_config_t config;
    struct k_work_q *work_q;
    RetryManager adv_retry;

    mutable struct k_mutex mutex;
    adv_state_t current_state;
    bool draining;

    central_slot_t slots[RSC_MAX_CENTRALS];

    // Mailboxes filled plus notifications outstanding in the host
    atomic_t in_flight;

    uint32_t sent_count;
    uint32_t dropped_count;
    uint32_t failed_count;

    peripheral_state_cb_t state_cb;
    void *state_cb_user_data;
};

#endif // APP_INCLUDE_GATT_PERIPHERAL_HEADER_
