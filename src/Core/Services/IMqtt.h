#pragma once
/**
 * @file IMqtt.h
 * @brief MQTT service interface.
 */

#include <stddef.h>
#include <stdint.h>

/**
 * @brief Inbound message callback, invoked on the MQTT task.
 *
 * @p payload is NUL-terminated and only valid during the call.
 * @p receivedAt is epoch seconds when time is synced, 0 otherwise.
 */
using MqttMessageHandler = void (*)(void* handlerCtx,
                                    const char* topic,
                                    const char* payload,
                                    size_t len,
                                    uint32_t receivedAt);

/** @brief Service wrapper for publishing, topic formatting and routing via MQTTModule. */
struct MqttService {
    bool (*publish)(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    void (*formatTopic)(void* ctx, const char* suffix, char* out, size_t outLen);
    bool (*isConnected)(void* ctx);
    /**
     * Register an absolute topic filter (`+` and `#` allowed). Routes are kept for the
     * process lifetime and re-subscribed on every connect. Call from init/onConfigLoaded.
     */
    bool (*subscribe)(void* ctx, const char* topicFilter, uint8_t qos,
                      MqttMessageHandler handler, void* handlerCtx);
    void* ctx;
};
