#pragma once
/**
 * @file EventBus.h
 * @brief Queued events with copied payloads, fanned out by the eventbus task.
 */
#include <stdint.h>
#include <stddef.h>

#include "EventId.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

/** @brief Event handed to subscribers. @p payload points into the dequeued copy. */
struct Event {
    EventId id;
    const void* payload;
    size_t len;
};

using EventCallback = void(*)(const Event& e, void* user);

/**
 * @brief Fixed subscriber table in front of a FreeRTOS queue.
 *
 * post() never blocks: a full queue drops the event and counts it. Callbacks
 * run on the eventbus task and must return quickly.
 */
class EventBus {
public:
    static constexpr uint8_t MAX_SUBSCRIBERS = 16;
    /** @brief Largest payload copied into the queue (ConfigChangedPayload). */
    static constexpr uint8_t MAX_PAYLOAD = 32;

    EventBus();

    /** @brief Register @p cb for @p id. Init phase only. */
    bool subscribe(EventId id, EventCallback cb, void* user);
    /** @brief Queue an event; false when the payload is too large or the queue is full. */
    bool post(EventId id, const void* payload = nullptr, size_t len = 0);
    /**
     * @brief Deliver at most @p maxEvents queued events.
     * Waits up to @p wait for the first one. Returns how many were delivered.
     */
    uint8_t dispatch(uint8_t maxEvents, TickType_t wait = 0);

    uint32_t dropped() const { return dropped_; }

private:
    struct Slot {
        EventId id;
        uint8_t len;
        uint8_t data[MAX_PAYLOAD];
    };
    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    Subscriber subs_[MAX_SUBSCRIBERS] = {};
    uint8_t subCount_ = 0;
    QueueHandle_t queue_ = nullptr;
    volatile uint32_t dropped_ = 0;
};
