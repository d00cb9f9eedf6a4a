/**
 * @file LivenessTracker.cpp
 * @brief Thread-safe access to a LivenessTable.
 */
#include "Modules/MonitorModule/LivenessTracker.h"
#include "Core/Log.h"

static constexpr const char* kTag = "Liveness";

bool LivenessTracker::begin()
{
    if (!mutex_) mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) Log::error(kTag, "mutex creation failed");
    return mutex_ != nullptr;
}

bool LivenessTracker::lock_()
{
    if (!mutex_) return false;
    return xSemaphoreTake(mutex_, portMAX_DELAY) == pdTRUE;
}

void LivenessTracker::unlock_()
{
    xSemaphoreGive(mutex_);
}

bool LivenessTracker::addDevice(const char* name)
{
    if (!lock_()) return false;
    const bool ok = table_.addDevice(name);
    unlock_();
    return ok;
}

bool LivenessTracker::record(const char* name, uint32_t timestamp, const char* payload, size_t len)
{
    if (!lock_()) return false;
    const bool ok = table_.record(name, timestamp, payload, len);
    unlock_();
    return ok;
}

bool LivenessTracker::snapshot(const char* name, DeviceStateView& out)
{
    if (!lock_()) return false;
    const bool ok = table_.snapshot(name, out);
    unlock_();
    return ok;
}

bool LivenessTracker::snapshotAt(uint8_t idx, DeviceStateView& out)
{
    if (!lock_()) return false;
    const bool ok = table_.snapshotAt(idx, out);
    unlock_();
    return ok;
}

bool LivenessTracker::stalenessReport(uint32_t now, uint32_t thresholdS, StaleEntry* out, uint8_t maxOut,
                                      uint8_t& count)
{
    count = 0;
    if (!lock_()) return false;
    count = table_.stalenessReport(now, thresholdS, out, maxOut);
    unlock_();
    return true;
}

void LivenessTracker::resetSeen()
{
    if (!lock_()) return;
    table_.resetSeen();
    unlock_();
}

void LivenessTracker::clear()
{
    if (!lock_()) return;
    table_.clear();
    unlock_();
}

uint8_t LivenessTracker::count()
{
    if (!lock_()) return 0;
    const uint8_t n = table_.count();
    unlock_();
    return n;
}

uint8_t LivenessTracker::seenCount()
{
    if (!lock_()) return 0;
    const uint8_t n = table_.seenCount();
    unlock_();
    return n;
}
