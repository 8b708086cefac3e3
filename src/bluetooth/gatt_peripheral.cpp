/**
 * @file gatt_peripheral.cpp
 * @brief RSC GATT peripheral: service lifecycle, subscriptions, notification delivery
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE bluetooth

#include <cerrno>
#include <cstring>

#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include <gatt_peripheral.hpp>

LOG_MODULE_REGISTER(MODULE, CONFIG_BLUETOOTH_MODULE_LOG_LEVEL); // NOLINT

static const uint16_t rsc_adv_uuids[] = {RSC_UUID_SERVICE};

// Poll period while waiting for in-flight notifications
static constexpr uint32_t DRAIN_POLL_MS = 5;

const char *adv_state_to_str(adv_state_t state)
{
    switch (state)
    {
        case adv_state_t::IDLE:
            return "idle";
        case adv_state_t::REGISTERED:
            return "registered";
        case adv_state_t::ADVERTISING:
            return "advertising";
    }
    return "unknown";
}

GattPeripheral::GattPeripheral(HostStack &host, const peripheral_config_t &config, struct k_work_q *work_q)
    : host(host), config(config), work_q(work_q), adv_retry("rsc_adv", config.adv_retry),
      current_state(adv_state_t::IDLE), draining(false), sent_count(0), dropped_count(0), failed_count(0),
      state_cb(nullptr), state_cb_user_data(nullptr)
{
    k_mutex_init(&mutex);
    atomic_set(&in_flight, 0);

    for (auto &slot : slots)
    {
        memset(&slot.pending, 0, sizeof(slot.pending));
        slot.owner = this;
        slot.in_use = false;
        slot.subscribed = false;
        slot.id = 0;
        slot.has_pending = false;
        slot.busy = false;
        k_work_init(&slot.work, deliverHandler);
    }
}

GattPeripheral::~GattPeripheral()
{
    shutdown();

    for (auto &slot : slots)
    {
        k_work_cancel_sync(&slot.work, nullptr);
    }
}

err_t GattPeripheral::registerService()
{
    k_mutex_lock(&mutex, K_FOREVER);
    if (current_state != adv_state_t::IDLE)
    {
        adv_state_t state = current_state;
        k_mutex_unlock(&mutex);
        LOG_WRN("Service already registered (state %s)", adv_state_to_str(state));
        return err_t::NO_ERROR;
    }

    k_mutex_unlock(&mutex);

    // Host callbacks take the host lock before ours, never call in with ours held
    int err = host.registerService(this);
    if (err != 0)
    {
        LOG_ERR("RSC service registration failed (err %d)", err);
        return err_t::REGISTRATION_ERROR;
    }

    k_mutex_lock(&mutex, K_FOREVER);
    current_state = adv_state_t::REGISTERED;
    k_mutex_unlock(&mutex);

    LOG_INF("RSC service registered");
    publishState(adv_state_t::REGISTERED);
    return err_t::NO_ERROR;
}

err_t GattPeripheral::startAdvertising()
{
    k_mutex_lock(&mutex, K_FOREVER);
    if (current_state == adv_state_t::ADVERTISING)
    {
        k_mutex_unlock(&mutex);
        return err_t::NO_ERROR;
    }
    if (current_state != adv_state_t::REGISTERED)
    {
        k_mutex_unlock(&mutex);
        LOG_ERR("Cannot advertise before the service is registered");
        return err_t::BLUETOOTH_ERROR;
    }
    // shutdown() aborts after leaving Registered, so rearming here cannot lose its abort
    adv_retry.rearm();
    k_mutex_unlock(&mutex);

    advertisement_t adv = {
        .name = config.device_name,
        .service_uuids = rsc_adv_uuids,
        .uuid_count = ARRAY_SIZE(rsc_adv_uuids),
        .tx_power_dbm = config.tx_power_dbm,
    };

    retry_result result = adv_retry.execute([this, &adv]() -> int { return host.startAdvertising(adv); });

    if (result == RETRY_FAILED)
    {
        LOG_ERR("Advertising could not be started");
        return err_t::REGISTRATION_ERROR;
    }
    if (result == RETRY_ABORTED)
    {
        LOG_INF("Advertising start aborted");
        return err_t::BLUETOOTH_ERROR;
    }

    k_mutex_lock(&mutex, K_FOREVER);
    if (current_state != adv_state_t::REGISTERED)
    {
        // Shut down while the last attempt was running
        k_mutex_unlock(&mutex);
        int err = host.stopAdvertising();
        if (err != 0)
        {
            LOG_WRN("Failed to stop advertising (err %d)", err);
        }
        return err_t::BLUETOOTH_ERROR;
    }
    current_state = adv_state_t::ADVERTISING;
    k_mutex_unlock(&mutex);

    LOG_INF("Advertising as \"%s\"", config.device_name);
    publishState(adv_state_t::ADVERTISING);
    return err_t::NO_ERROR;
}

void GattPeripheral::notify(const rsc_measurement_t &measurement)
{
    rsc_payload_t payload = rsc_measurement_encode(measurement);

    k_mutex_lock(&mutex, K_FOREVER);
    if (current_state != adv_state_t::ADVERTISING)
    {
        k_mutex_unlock(&mutex);
        return;
    }

    for (auto &slot : slots)
    {
        if (!slot.in_use || !slot.subscribed)
        {
            continue;
        }

        if (slot.has_pending)
        {
            // Central has not taken the previous value yet, keep only the latest
            dropped_count++;
        }
        else
        {
            atomic_inc(&in_flight);
        }

        slot.pending = payload;
        slot.has_pending = true;

        if (!slot.busy)
        {
            int ret = k_work_submit_to_queue(work_q, &slot.work);
            if (ret < 0)
            {
                LOG_WRN("Delivery work submit failed for central %u (err %d)", slot.id, ret);
            }
        }
    }
    k_mutex_unlock(&mutex);
}

void GattPeripheral::deliverHandler(struct k_work *work)
{
    central_slot_t *slot = CONTAINER_OF(work, central_slot_t, work);
    slot->owner->deliver(slot);
}

void GattPeripheral::deliver(central_slot_t *slot)
{
    k_mutex_lock(&mutex, K_FOREVER);

    bool active = current_state == adv_state_t::ADVERTISING || draining;
    if (!active || !slot->in_use || !slot->subscribed || !slot->has_pending || slot->busy)
    {
        k_mutex_unlock(&mutex);
        return;
    }

    rsc_payload_t payload = slot->pending;
    central_id_t central = slot->id;
    slot->has_pending = false;
    slot->busy = true;
    k_mutex_unlock(&mutex);

    int err = host.notify(central, payload.data(), payload.size());
    if (err == 0)
    {
        return;
    }

    // Never reaches onNotifyComplete, fail it here
    k_mutex_lock(&mutex, K_FOREVER);
    if (slot->in_use && slot->id == central && slot->busy)
    {
        slot->busy = false;
        atomic_dec(&in_flight);
        failed_count++;
        slot->subscribed = false;
        releaseMailbox(slot);
        LOG_WRN("%s: central %u (err %d), subscription cleared", err_to_str(err_t::NOTIFY_DELIVERY_ERROR), central,
                err);
    }
    k_mutex_unlock(&mutex);
}

void GattPeripheral::onNotifyComplete(central_id_t central, int err)
{
    k_mutex_lock(&mutex, K_FOREVER);

    central_slot_t *slot = findSlot(central);
    if (!slot || !slot->busy)
    {
        // Central already gone
        k_mutex_unlock(&mutex);
        LOG_DBG("Late completion for central %u ignored", central);
        return;
    }

    slot->busy = false;
    atomic_dec(&in_flight);

    if (err == 0)
    {
        sent_count++;
    }
    else
    {
        failed_count++;
        slot->subscribed = false;
        releaseMailbox(slot);
        LOG_WRN("%s: central %u (err %d), subscription cleared", err_to_str(err_t::NOTIFY_DELIVERY_ERROR), central,
                err);
    }

    if (slot->has_pending)
    {
        int ret = k_work_submit_to_queue(work_q, &slot->work);
        if (ret < 0)
        {
            LOG_WRN("Delivery work submit failed for central %u (err %d)", central, ret);
        }
    }

    k_mutex_unlock(&mutex);
}

void GattPeripheral::onCentralConnected(central_id_t central)
{
    k_mutex_lock(&mutex, K_FOREVER);

    if (findSlot(central))
    {
        k_mutex_unlock(&mutex);
        LOG_WRN("Central %u already tracked", central);
        return;
    }

    for (auto &slot : slots)
    {
        if (!slot.in_use)
        {
            slot.in_use = true;
            slot.subscribed = false;
            slot.id = central;
            slot.has_pending = false;
            slot.busy = false;
            k_mutex_unlock(&mutex);
            LOG_INF("Central %u connected", central);
            return;
        }
    }

    k_mutex_unlock(&mutex);
    LOG_WRN("No free slot for central %u, it will not receive notifications", central);
}

void GattPeripheral::onCentralDisconnected(central_id_t central)
{
    k_mutex_lock(&mutex, K_FOREVER);

    central_slot_t *slot = findSlot(central);
    if (!slot)
    {
        k_mutex_unlock(&mutex);
        return;
    }

    releaseMailbox(slot);
    if (slot->busy)
    {
        // Completion may still arrive, findSlot() will no longer match
        slot->busy = false;
        atomic_dec(&in_flight);
        dropped_count++;
    }
    slot->in_use = false;
    slot->subscribed = false;

    k_mutex_unlock(&mutex);
    LOG_INF("Central %u disconnected", central);
}

int GattPeripheral::onSubscriptionChanged(central_id_t central, bool enabled)
{
    k_mutex_lock(&mutex, K_FOREVER);

    central_slot_t *slot = findSlot(central);
    if (!slot)
    {
        k_mutex_unlock(&mutex);
        LOG_WRN("Subscription change from unknown central %u", central);
        return -ENOTCONN;
    }

    slot->subscribed = enabled;
    if (!enabled)
    {
        releaseMailbox(slot);
    }

    k_mutex_unlock(&mutex);
    LOG_INF("Central %u %s RSC notifications", central, enabled ? "enabled" : "disabled");
    return 0;
}

uint8_t GattPeripheral::sensorLocation() const
{
    return config.sensor_location;
}

void GattPeripheral::shutdown()
{
    k_mutex_lock(&mutex, K_FOREVER);
    adv_state_t previous = current_state;
    if (previous == adv_state_t::IDLE)
    {
        k_mutex_unlock(&mutex);
        adv_retry.abort();
        return;
    }
    current_state = adv_state_t::IDLE;
    draining = true;
    k_mutex_unlock(&mutex);

    adv_retry.abort();
    publishState(adv_state_t::IDLE);

    if (previous == adv_state_t::ADVERTISING)
    {
        int err = host.stopAdvertising();
        if (err != 0)
        {
            LOG_WRN("Failed to stop advertising (err %d)", err);
        }
    }

    bool drained = flush(config.drain_timeout_ms);

    k_mutex_lock(&mutex, K_FOREVER);
    draining = false;

    uint32_t cancelled = 0;
    for (auto &slot : slots)
    {
        if (slot.has_pending)
        {
            cancelled++;
        }
        if (slot.busy)
        {
            cancelled++;
        }
        slot.in_use = false;
        slot.subscribed = false;
        slot.has_pending = false;
        slot.busy = false;
        k_work_cancel(&slot.work);
    }
    dropped_count += cancelled;
    atomic_set(&in_flight, 0);
    k_mutex_unlock(&mutex);

    if (!drained)
    {
        LOG_WRN("Shutdown cancelled %u undelivered notification(s)", cancelled);
    }

    int err = host.unregisterService();
    if (err != 0)
    {
        LOG_WRN("Failed to unregister RSC service (err %d)", err);
    }

    LOG_INF("RSC peripheral stopped");
}

bool GattPeripheral::flush(uint32_t timeout_ms)
{
    int64_t deadline = k_uptime_get() + timeout_ms;

    while (atomic_get(&in_flight) > 0)
    {
        if (k_uptime_get() >= deadline)
        {
            return false;
        }
        k_sleep(K_MSEC(DRAIN_POLL_MS));
    }
    return true;
}

adv_state_t GattPeripheral::state() const
{
    k_mutex_lock(&mutex, K_FOREVER);
    adv_state_t state = current_state;
    k_mutex_unlock(&mutex);
    return state;
}

void GattPeripheral::getStatus(peripheral_status_t *status) const
{
    if (!status)
    {
        return;
    }

    k_mutex_lock(&mutex, K_FOREVER);
    status->state = current_state;
    status->connected = 0;
    status->subscribed = 0;
    for (const auto &slot : slots)
    {
        if (slot.in_use)
        {
            status->connected++;
            if (slot.subscribed)
            {
                status->subscribed++;
            }
        }
    }
    status->notifications_sent = sent_count;
    status->notifications_dropped = dropped_count;
    status->notifications_failed = failed_count;
    k_mutex_unlock(&mutex);

    RetryManager::retry_stats adv_stats;
    adv_retry.getStats(&adv_stats);
    status->adv_attempts = adv_stats.total_attempts;
    status->adv_failures = adv_stats.failed_attempts;
    status->adv_last_error = adv_stats.last_error;
}

void GattPeripheral::setStateCallback(peripheral_state_cb_t cb, void *user_data)
{
    k_mutex_lock(&mutex, K_FOREVER);
    state_cb = cb;
    state_cb_user_data = user_data;
    k_mutex_unlock(&mutex);
}

GattPeripheral::central_slot_t *GattPeripheral::findSlot(central_id_t central)
{
    for (auto &slot : slots)
    {
        if (slot.in_use && slot.id == central)
        {
            return &slot;
        }
    }
    return nullptr;
}

// Caller holds the mutex
void GattPeripheral::releaseMailbox(central_slot_t *slot)
{
    if (slot->has_pending)
    {
        slot->has_pending = false;
        atomic_dec(&in_flight);
        dropped_count++;
    }
}

void GattPeripheral::publishState(adv_state_t new_state)
{
    k_mutex_lock(&mutex, K_FOREVER);
    peripheral_state_cb_t cb = state_cb;
    void *user_data = state_cb_user_data;
    k_mutex_unlock(&mutex);

    if (cb)
    {
        cb(new_state, user_data);
    }
}
