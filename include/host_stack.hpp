/**
 * @file host_stack.hpp
 * @brief Boundary between the RSC peripheral and the Bluetooth host
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 * Everything the peripheral needs from the host goes through HostStack; the
 * host reports back through GattEventListener. Callbacks may arrive on any
 * thread (BT RX thread in firmware).
 */

#ifndef APP_INCLUDE_HOST_STACK_HEADER_
#define APP_INCLUDE_HOST_STACK_HEADER_

#include <cstddef>
#include <cstdint>

// Bluetooth SIG assigned numbers used by the RSC service
#define RSC_UUID_SERVICE         0x1814
#define RSC_UUID_MEASUREMENT     0x2A53
#define RSC_UUID_FEATURE         0x2A54
#define RSC_UUID_SENSOR_LOCATION 0x2A5D

// Host assigned connection index, stable while the central is connected
typedef uint8_t central_id_t;

typedef struct
{
    const char *name;
    const uint16_t *service_uuids; // 16-bit service UUIDs to list
    size_t uuid_count;
    int8_t tx_power_dbm; // Advertised TX power level
} advertisement_t;

class GattEventListener
{
  public:
    virtual ~GattEventListener() = default;

    virtual void onCentralConnected(central_id_t central) = 0;
    virtual void onCentralDisconnected(central_id_t central) = 0;

    /**
     * @brief CCC write on the RSC Measurement characteristic.
     *
     * @return 0 to acknowledge, negative errno otherwise
     */
    virtual int onSubscriptionChanged(central_id_t central, bool enabled) = 0;

    // Completion of a HostStack::notify() that returned 0
    virtual void onNotifyComplete(central_id_t central, int err) = 0;

    // Value of the Sensor Location characteristic
    virtual uint8_t sensorLocation() const = 0;
};

class HostStack
{
  public:
    virtual ~HostStack() = default;

    // Publishes the RSC service tree and routes its callbacks to listener
    virtual int registerService(GattEventListener *listener) = 0;
    virtual int unregisterService() = 0;

    virtual int startAdvertising(const advertisement_t &advertisement) = 0;
    virtual int stopAdvertising() = 0;

    /**
     * @brief Queues one RSC Measurement notification.
     *
     * Does not block on the radio. Completion is reported through
     * GattEventListener::onNotifyComplete() only when 0 is returned.
     *
     * @return 0 if queued, negative errno otherwise
     */
    virtual int notify(central_id_t central, const uint8_t *data, size_t len) = 0;
};

#endif // APP_INCLUDE_HOST_STACK_HEADER_
