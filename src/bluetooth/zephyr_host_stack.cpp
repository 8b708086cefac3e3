/**
 * @file zephyr_host_stack.cpp
 * @brief HostStack backed by the Zephyr Bluetooth host
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#define MODULE bluetooth

#include <cerrno>
#include <cstring>

#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/bluetooth/conn.h>
#include <zephyr/bluetooth/gap.h>
#include <zephyr/bluetooth/gatt.h>
#include <zephyr/bluetooth/hci.h>
#include <zephyr/bluetooth/uuid.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>
#include <zephyr/settings/settings.h>
#include <zephyr/sys/byteorder.h>

#include <rsc_encoder.hpp>

#include "zephyr_host_stack.hpp"

LOG_MODULE_DECLARE(MODULE, CONFIG_BLUETOOTH_MODULE_LOG_LEVEL);

// Largest 16-bit UUID list placed in the advertising data
static constexpr size_t ADV_MAX_UUIDS = 4;

/********************************** STATE *************************************/
static K_MUTEX_DEFINE(host_mutex);

static bool bt_ready;
static bool service_registered;
static GattEventListener *listener;

// Indexed by bt_conn_index()
static struct bt_conn *conns[CONFIG_BT_MAX_CONN];
static bool conn_subscribed[CONFIG_BT_MAX_CONN];
static struct bt_gatt_notify_params notify_params[CONFIG_BT_MAX_CONN];

// Advertising request kept so it can be resumed after connections
static bool adv_requested;
static char adv_name[CONFIG_BT_DEVICE_NAME_MAX + 1];
static uint8_t adv_uuid_bytes[ADV_MAX_UUIDS * sizeof(uint16_t)];
static size_t adv_uuid_len;
static uint8_t adv_flags;
static int8_t adv_tx_power;
static struct bt_data adv_data[3];

// Name goes in the scan response so a full length name always fits
static struct bt_data scan_data[1];

static const struct bt_le_adv_param adv_param = {
    .id = BT_ID_DEFAULT,
    .sid = 0,
    .secondary_max_skip = 0,
    .options = BT_LE_ADV_OPT_CONN,
    .interval_min = BT_GAP_ADV_FAST_INT_MIN_2,
    .interval_max = BT_GAP_ADV_FAST_INT_MAX_2,
    .peer = NULL,
};

static void adv_resume_work_handler(struct k_work *work);
static K_WORK_DEFINE(adv_resume_work, adv_resume_work_handler);

/********************************** GATT **************************************/
static void rsc_ccc_changed(const struct bt_gatt_attr *attr, uint16_t value);
static ssize_t read_rsc_feature(struct bt_conn *conn, const struct bt_gatt_attr *attr, void *buf, uint16_t len,
                                uint16_t offset);
static ssize_t read_sensor_location(struct bt_conn *conn, const struct bt_gatt_attr *attr, void *buf, uint16_t len,
                                    uint16_t offset);

static struct bt_gatt_attr rsc_attrs[] = {
    BT_GATT_PRIMARY_SERVICE(BT_UUID_RSCS),
    BT_GATT_CHARACTERISTIC(BT_UUID_RSC_MEASUREMENT, BT_GATT_CHRC_NOTIFY, BT_GATT_PERM_NONE, NULL, NULL, NULL),
    BT_GATT_CCC(rsc_ccc_changed, BT_GATT_PERM_READ | BT_GATT_PERM_WRITE),
    BT_GATT_CHARACTERISTIC(BT_UUID_RSC_FEATURE, BT_GATT_CHRC_READ, BT_GATT_PERM_READ, read_rsc_feature, NULL, NULL),
    BT_GATT_CHARACTERISTIC(BT_UUID_SENSOR_LOCATION, BT_GATT_CHRC_READ, BT_GATT_PERM_READ, read_sensor_location, NULL,
                           NULL),
};

static struct bt_gatt_service rsc_service = BT_GATT_SERVICE(rsc_attrs);

// Characteristic declaration of RSC Measurement
static const struct bt_gatt_attr *const rsc_measurement_attr = &rsc_attrs[1];

static ssize_t read_rsc_feature(struct bt_conn *conn, const struct bt_gatt_attr *attr, void *buf, uint16_t len,
                                uint16_t offset)
{
    uint16_t feature = sys_cpu_to_le16(RSC_FEATURE_WALK_RUN_STATUS);

    return bt_gatt_attr_read(conn, attr, buf, len, offset, &feature, sizeof(feature));
}

static ssize_t read_sensor_location(struct bt_conn *conn, const struct bt_gatt_attr *attr, void *buf, uint16_t len,
                                    uint16_t offset)
{
    uint8_t location = 0;

    k_mutex_lock(&host_mutex, K_FOREVER);
    if (listener)
    {
        location = listener->sensorLocation();
    }
    k_mutex_unlock(&host_mutex);

    return bt_gatt_attr_read(conn, attr, buf, len, offset, &location, sizeof(location));
}

/**
 * @brief Pushes per connection subscription changes to the listener.
 *
 * The CCC changed callback only reports the aggregate value, so every
 * connection is compared against the last state seen. Caller holds host_mutex.
 */
static void reconcile_subscriptions(void)
{
    for (size_t i = 0; i < ARRAY_SIZE(conns); i++)
    {
        if (!conns[i])
        {
            continue;
        }

        bool subscribed = bt_gatt_is_subscribed(conns[i], rsc_measurement_attr, BT_GATT_CCC_NOTIFY);
        if (subscribed == conn_subscribed[i])
        {
            continue;
        }
        conn_subscribed[i] = subscribed;

        if (listener)
        {
            int ret = listener->onSubscriptionChanged(static_cast<central_id_t>(i), subscribed);
            if (ret != 0)
            {
                LOG_WRN("Subscription change on conn %u not accepted (err %d)", static_cast<unsigned int>(i), ret);
            }
        }
    }
}

static void rsc_ccc_changed(const struct bt_gatt_attr *attr, uint16_t value)
{
    if (!attr)
    {
        LOG_ERR("rsc_ccc_changed: attr is NULL");
        return;
    }
    LOG_DBG("RSC Measurement CCC changed to 0x%04x", value);

    k_mutex_lock(&host_mutex, K_FOREVER);
    reconcile_subscriptions();
    k_mutex_unlock(&host_mutex);
}

static void rsc_notify_sent(struct bt_conn *conn, void *user_data)
{
    ARG_UNUSED(user_data);

    central_id_t central = static_cast<central_id_t>(bt_conn_index(conn));

    k_mutex_lock(&host_mutex, K_FOREVER);
    if (listener)
    {
        listener->onNotifyComplete(central, 0);
    }
    k_mutex_unlock(&host_mutex);
}

/******************************** CONNECTIONS *********************************/
static void connected(struct bt_conn *conn, uint8_t err)
{
    if (err != 0)
    {
        LOG_ERR("Connection failed (err 0x%02x)", err);
        k_work_submit(&adv_resume_work);
        return;
    }

    uint8_t index = bt_conn_index(conn);
    char addr[BT_ADDR_LE_STR_LEN];
    bt_addr_le_to_str(bt_conn_get_dst(conn), addr, sizeof(addr));
    LOG_INF("Connected: %s (conn %u)", addr, index);

    k_mutex_lock(&host_mutex, K_FOREVER);
    if (conns[index])
    {
        bt_conn_unref(conns[index]);
    }
    conns[index] = bt_conn_ref(conn);
    conn_subscribed[index] = false;

    if (listener)
    {
        listener->onCentralConnected(index);
    }
    // A bonded central may already have notifications enabled
    reconcile_subscriptions();
    k_mutex_unlock(&host_mutex);

    // Connectable advertising stops on connection
    k_work_submit(&adv_resume_work);
}

static void disconnected(struct bt_conn *conn, uint8_t reason)
{
    uint8_t index = bt_conn_index(conn);
    LOG_INF("Disconnected (conn %u, reason 0x%02x)", index, reason);

    k_mutex_lock(&host_mutex, K_FOREVER);
    if (conns[index])
    {
        bt_conn_unref(conns[index]);
        conns[index] = NULL;
    }
    conn_subscribed[index] = false;

    if (listener)
    {
        listener->onCentralDisconnected(index);
    }
    k_mutex_unlock(&host_mutex);
}

static void recycled(void)
{
    // Connection object free again, advertising can use it
    k_work_submit(&adv_resume_work);
}

BT_CONN_CB_DEFINE(rsc_conn_callbacks) = {
    .connected = connected,
    .disconnected = disconnected,
    .recycled = recycled,
};

/******************************** ADVERTISING *********************************/
static int adv_start_locked(void)
{
    int err = bt_le_adv_start(&adv_param, adv_data, ARRAY_SIZE(adv_data), scan_data, ARRAY_SIZE(scan_data));
    if (err == -EALREADY)
    {
        return 0;
    }
    return err;
}

static void adv_resume_work_handler(struct k_work *work)
{
    ARG_UNUSED(work);

    k_mutex_lock(&host_mutex, K_FOREVER);
    if (!adv_requested)
    {
        k_mutex_unlock(&host_mutex);
        return;
    }

    int err = adv_start_locked();
    k_mutex_unlock(&host_mutex);

    if (err == -ECONNREFUSED || err == -ENOMEM)
    {
        // All connection objects in use, recycled() retries
        LOG_DBG("Advertising deferred until a connection is free");
    }
    else if (err != 0)
    {
        LOG_ERR("Failed to resume advertising (err %d)", err);
    }
    else
    {
        LOG_DBG("Advertising resumed");
    }
}

/******************************** HOST STACK **********************************/
ZephyrHostStack::~ZephyrHostStack()
{
    int err = unregisterService();
    if (err != 0 && err != -EALREADY)
    {
        LOG_WRN("RSC service cleanup failed (err %d)", err);
    }
}

int ZephyrHostStack::enable()
{
    k_mutex_lock(&host_mutex, K_FOREVER);
    if (bt_ready)
    {
        k_mutex_unlock(&host_mutex);
        return 0;
    }

    int err = bt_enable(NULL);
    if (err)
    {
        k_mutex_unlock(&host_mutex);
        LOG_ERR("Bluetooth init failed (err %d)", err);
        return err;
    }

#if IS_ENABLED(CONFIG_SETTINGS)
    err = settings_load();
    if (err)
    {
        k_mutex_unlock(&host_mutex);
        LOG_ERR("Bluetooth settings_load() call failed (err %d)", err);
        return err;
    }
#endif

    bt_ready = true;
    k_mutex_unlock(&host_mutex);

    LOG_INF("Bluetooth initialized");
    return 0;
}

int ZephyrHostStack::registerService(GattEventListener *new_listener)
{
    if (!new_listener)
    {
        return -EINVAL;
    }

    int err = enable();
    if (err)
    {
        return err;
    }

    k_mutex_lock(&host_mutex, K_FOREVER);
    if (service_registered)
    {
        k_mutex_unlock(&host_mutex);
        LOG_ERR("RSC service already registered");
        return -EALREADY;
    }

    err = bt_gatt_service_register(&rsc_service);
    if (err)
    {
        k_mutex_unlock(&host_mutex);
        LOG_ERR("bt_gatt_service_register failed (err %d)", err);
        return err;
    }

    service_registered = true;
    listener = new_listener;

    // Centrals connected before registration
    for (size_t i = 0; i < ARRAY_SIZE(conns); i++)
    {
        if (conns[i])
        {
            listener->onCentralConnected(static_cast<central_id_t>(i));
        }
    }
    k_mutex_unlock(&host_mutex);

    return 0;
}

int ZephyrHostStack::unregisterService()
{
    k_mutex_lock(&host_mutex, K_FOREVER);
    if (!service_registered)
    {
        k_mutex_unlock(&host_mutex);
        return -EALREADY;
    }

    listener = nullptr;
    int err = bt_gatt_service_unregister(&rsc_service);
    service_registered = false;
    memset(conn_subscribed, 0, sizeof(conn_subscribed));
    k_mutex_unlock(&host_mutex);

    if (err)
    {
        LOG_ERR("bt_gatt_service_unregister failed (err %d)", err);
    }
    return err;
}

int ZephyrHostStack::startAdvertising(const advertisement_t &advertisement)
{
    if (!advertisement.name || advertisement.uuid_count > ADV_MAX_UUIDS)
    {
        return -EINVAL;
    }

    k_mutex_lock(&host_mutex, K_FOREVER);

    int err = bt_set_name(advertisement.name);
    if (err)
    {
        k_mutex_unlock(&host_mutex);
        LOG_ERR("bt_set_name failed (err %d)", err);
        return err;
    }

    strncpy(adv_name, advertisement.name, sizeof(adv_name) - 1);
    adv_name[sizeof(adv_name) - 1] = '\0';

    adv_uuid_len = 0;
    for (size_t i = 0; i < advertisement.uuid_count; i++)
    {
        sys_put_le16(advertisement.service_uuids[i], &adv_uuid_bytes[adv_uuid_len]);
        adv_uuid_len += sizeof(uint16_t);
    }

    adv_flags = BT_LE_AD_GENERAL | BT_LE_AD_NO_BREDR;
    adv_data[0].type = BT_DATA_FLAGS;
    adv_data[0].data_len = sizeof(adv_flags);
    adv_data[0].data = &adv_flags;
    adv_data[1].type = BT_DATA_UUID16_ALL;
    adv_data[1].data_len = static_cast<uint8_t>(adv_uuid_len);
    adv_data[1].data = adv_uuid_bytes;
    adv_tx_power = advertisement.tx_power_dbm;
    adv_data[2].type = BT_DATA_TX_POWER;
    adv_data[2].data_len = sizeof(adv_tx_power);
    adv_data[2].data = (const uint8_t *)&adv_tx_power;

    scan_data[0].type = BT_DATA_NAME_COMPLETE;
    scan_data[0].data_len = static_cast<uint8_t>(strlen(adv_name));
    scan_data[0].data = (const uint8_t *)adv_name;

    err = adv_start_locked();
    if (err == 0)
    {
        adv_requested = true;
    }
    k_mutex_unlock(&host_mutex);

    if (err)
    {
        LOG_WRN("bt_le_adv_start failed (err %d)", err);
    }
    return err;
}

int ZephyrHostStack::stopAdvertising()
{
    k_mutex_lock(&host_mutex, K_FOREVER);
    adv_requested = false;
    int err = bt_le_adv_stop();
    k_mutex_unlock(&host_mutex);

    if (err)
    {
        LOG_ERR("bt_le_adv_stop failed (err %d)", err);
    }
    return err;
}

int ZephyrHostStack::notify(central_id_t central, const uint8_t *data, size_t len)
{
    if (!data || central >= ARRAY_SIZE(conns))
    {
        return -EINVAL;
    }

    k_mutex_lock(&host_mutex, K_FOREVER);
    if (!service_registered || !conns[central])
    {
        k_mutex_unlock(&host_mutex);
        return -ENOTCONN;
    }

    if (!bt_gatt_is_subscribed(conns[central], rsc_measurement_attr, BT_GATT_CCC_NOTIFY))
    {
        k_mutex_unlock(&host_mutex);
        return -EACCES;
    }

    // Reference held across the send so a disconnect cannot free it
    struct bt_conn *conn = bt_conn_ref(conns[central]);

    struct bt_gatt_notify_params *params = &notify_params[central];
    memset(params, 0, sizeof(*params));
    params->attr = rsc_measurement_attr;
    params->data = data;
    params->len = static_cast<uint16_t>(len);
    params->func = rsc_notify_sent;
    k_mutex_unlock(&host_mutex);

    int err = bt_gatt_notify_cb(conn, params);
    bt_conn_unref(conn);

    if (err)
    {
        LOG_DBG("bt_gatt_notify_cb on conn %u failed (err %d)", central, err);
    }
    return err;
}
