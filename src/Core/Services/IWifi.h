#pragma once
/**
 * @file IWifi.h
 * @brief WiFi service interface.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief WiFi connection state. */
enum class WifiState : uint8_t {
    Disabled,
    Idle,
    Connecting,
    Connected,
    ErrorWait
};

/** @brief Short name of a WiFi state. */
static inline const char* wifiStateStr(WifiState s)
{
    switch (s) {
        case WifiState::Disabled:   return "disabled";
        case WifiState::Idle:       return "idle";
        case WifiState::Connecting: return "connecting";
        case WifiState::Connected:  return "connected";
        case WifiState::ErrorWait:  return "error_wait";
        default:                    return "?";
    }
}

/** @brief Read-only WiFi status, used by `system.info`. */
struct WifiService {
    WifiState (*state)(void* ctx);
    /** Dotted address, false and empty while not connected. */
    bool (*getIP)(void* ctx, char* out, size_t len);
    /** Signal strength in dBm, 0 when not connected. */
    int8_t (*rssi)(void* ctx);
    void* ctx;
};
