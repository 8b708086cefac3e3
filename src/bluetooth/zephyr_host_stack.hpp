/**
 * @file zephyr_host_stack.hpp
 * @brief HostStack backed by the Zephyr Bluetooth host
 * @version 1.0
 * @date 2025
 *
 * @copyright Botz Innovation 2025
 *
 */

#ifndef APP_BLUETOOTH_ZEPHYR_HOST_STACK_HEADER_
#define APP_BLUETOOTH_ZEPHYR_HOST_STACK_HEADER_

#include <host_stack.hpp>

/**
 * @brief Owns the RSC GATT table and the connection table.
 *
 * The Zephyr host keeps its callbacks in static tables, so only one instance
 * may have the service registered at a time.
 */
class ZephyrHostStack : public HostStack
{
  public:
    ZephyrHostStack() = default;
    ~ZephyrHostStack() override;

    // bt_enable() and settings_load(), once
    int enable();

    int registerService(GattEventListener *listener) override;
    int unregisterService() override;

    int startAdvertising(const advertisement_t &advertisement) override;
    int stopAdvertising() override;

    int notify(central_id_t central, const uint8_t *data, size_t len) override;
};

#endif // APP_BLUETOOTH_ZEPHYR_HOST_STACK_HEADER_
