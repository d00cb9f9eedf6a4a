#pragma once
/**
 * @file LivenessTracker.h
 * @brief Thread-safe access to a LivenessTable.
 */
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "Modules/MonitorModule/LivenessTable.h"

/**
 * @brief Single owner of a device state table shared between tasks.
 *
 * Writers are the MQTT task callbacks, readers copy entries out. The mutex is
 * only held for the table operation itself, never across network calls, so
 * callers wait for it instead of giving up. Every operation fails before begin().
 */
class LivenessTracker {
public:
    explicit LivenessTracker(size_t payloadLimit = LIVENESS_PAYLOAD_MAX) : table_(payloadLimit) {}

    /** @brief Create the mutex. */
    bool begin();

    bool addDevice(const char* name);
    bool record(const char* name, uint32_t timestamp, const char* payload, size_t len);
    bool snapshot(const char* name, DeviceStateView& out);
    bool snapshotAt(uint8_t idx, DeviceStateView& out);
    /**
     * @brief Stale devices, see LivenessTable::stalenessReport.
     * @param count Number of entries written; only meaningful when true is returned.
     */
    bool stalenessReport(uint32_t now, uint32_t thresholdS, StaleEntry* out, uint8_t maxOut, uint8_t& count);
    void resetSeen();
    /** @brief Drop every tracked device. */
    void clear();

    uint8_t count();
    uint8_t seenCount();

private:
    bool lock_();
    void unlock_();

    SemaphoreHandle_t mutex_ = nullptr;
    LivenessTable table_;
};
