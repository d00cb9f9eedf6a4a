/**
 * @file EventBus.cpp
 * @brief EventBus queue and fan-out.
 */
#include "EventBus.h"
#include "EventPayloads.h"
#include "Core/Log.h"
#include <string.h>

static_assert(sizeof(ConfigChangedPayload) <= EventBus::MAX_PAYLOAD, "payload slot too small");
static_assert(sizeof(WifiNetReadyPayload) <= EventBus::MAX_PAYLOAD, "payload slot too small");

EventBus::EventBus()
{
    queue_ = xQueueCreate(Limits::EventQueueLen, sizeof(Slot));
}

bool EventBus::subscribe(EventId id, EventCallback cb, void* user)
{
    if (!cb) return false;
    if (subCount_ >= MAX_SUBSCRIBERS) {
        Log::error("EventBus", "no subscriber slot for %s", eventName(id));
        return false;
    }
    subs_[subCount_++] = Subscriber{id, cb, user};
    return true;
}

bool EventBus::post(EventId id, const void* payload, size_t len)
{
    if (!queue_ || len > MAX_PAYLOAD || (len > 0 && !payload)) return false;
    Slot slot;
    slot.id = id;
    slot.len = (uint8_t)len;
    if (len) memcpy(slot.data, payload, len);
    if (xQueueSend(queue_, &slot, 0) == pdTRUE) return true;
    dropped_ = dropped_ + 1;
    return false;
}

uint8_t EventBus::dispatch(uint8_t maxEvents, TickType_t wait)
{
    if (!queue_) return 0;
    Slot slot;
    uint8_t delivered = 0;
    // Only the first receive may block; the rest drain what is already queued.
    while (delivered < maxEvents && xQueueReceive(queue_, &slot, delivered ? 0 : wait) == pdTRUE) {
        const Event e{slot.id, slot.len ? slot.data : nullptr, slot.len};
        for (uint8_t i = 0; i < subCount_; ++i) {
            if (subs_[i].id == slot.id) subs_[i].cb(e, subs_[i].user);
        }
        ++delivered;
    }
    return delivered;
}
