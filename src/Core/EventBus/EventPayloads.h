#pragma once
/**
 * @file EventPayloads.h
 * @brief Payloads copied by value into the EventBus queue.
 */
#include <stdint.h>
#include <type_traits>

/** @brief NVS key of the variable whose value changed. */
struct ConfigChangedPayload {
    char nvsKey[32];
};

/** @brief IPv4 settings of the station once it has an address. */
struct WifiNetReadyPayload {
    uint8_t ip[4];
    uint8_t gw[4];
    uint8_t mask[4];
};

/** @brief Counters of an inventory (re)load. */
struct InventoryReloadedPayload {
    uint8_t types;
    uint8_t devices;
    uint8_t validDevices;
    uint8_t rejected;         ///< Rejected types plus rejected device entries.
};

/** @brief Outcome counters of one reconcile pass. */
struct ReconcileCompletedPayload {
    uint8_t ok;
    uint8_t mismatch;
    uint8_t timeout;
    uint8_t skipped;          ///< Devices without a usable configuration.
};

static_assert(std::is_trivially_copyable<ConfigChangedPayload>::value, "copied with memcpy");
static_assert(std::is_trivially_copyable<WifiNetReadyPayload>::value, "copied with memcpy");
static_assert(std::is_trivially_copyable<InventoryReloadedPayload>::value, "copied with memcpy");
static_assert(std::is_trivially_copyable<ReconcileCompletedPayload>::value, "copied with memcpy");
