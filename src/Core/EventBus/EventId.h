#pragma once
/**
 * @file EventId.h
 * @brief Events exchanged between modules over the EventBus.
 */
#include <stdint.h>

/**
 * @brief Event identifiers, grouped by producer in ranges of ten.
 *
 * Payload types are listed in EventPayloads.h; ids without one carry none.
 */
enum class EventId : uint16_t {
    None = 0,
    SystemStarted = 1,        ///< main, after every task is running

    WifiNetReady = 20,        ///< WifiNetReadyPayload
    WifiNetLost = 21,
    MqttConnected = 30,       ///< broker session up, routes subscribed
    MqttDisconnected = 31,

    ConfigChanged = 100,      ///< ConfigChangedPayload

    InventoryReloaded = 200,  ///< InventoryReloadedPayload
    ReconcileCompleted = 210, ///< ReconcileCompletedPayload
};

/** @brief Name used in log lines. */
inline const char* eventName(EventId id)
{
    switch (id) {
    case EventId::None:               return "None";
    case EventId::SystemStarted:      return "SystemStarted";
    case EventId::WifiNetReady:       return "WifiNetReady";
    case EventId::WifiNetLost:        return "WifiNetLost";
    case EventId::MqttConnected:      return "MqttConnected";
    case EventId::MqttDisconnected:   return "MqttDisconnected";
    case EventId::ConfigChanged:      return "ConfigChanged";
    case EventId::InventoryReloaded:  return "InventoryReloaded";
    case EventId::ReconcileCompleted: return "ReconcileCompleted";
    }
    return "?";
}
