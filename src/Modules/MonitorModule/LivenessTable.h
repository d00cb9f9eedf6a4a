#pragma once
/**
 * @file LivenessTable.h
 * @brief Last-seen time and last payload per device.
 */

#include <stddef.h>
#include <stdint.h>
#include <ArduinoJson.h>

constexpr uint8_t LIVENESS_MAX_DEVICES = 16;
constexpr size_t LIVENESS_NAME_MAX = 32;
constexpr size_t LIVENESS_PAYLOAD_MAX = 1536;
constexpr size_t LIVENESS_DOC_CAPACITY = 1536;
/// Heap pool used when a valid payload needs more slots than the static pool.
constexpr size_t LIVENESS_LARGE_DOC_CAPACITY = 16 * LIVENESS_PAYLOAD_MAX;

/** @brief Copy of one device entry. */
struct DeviceStateView {
    char name[LIVENESS_NAME_MAX] = {0};
    bool seen = false;               ///< false: never seen, lastSeen and payload meaningless.
    uint32_t lastSeen = 0;           ///< Epoch seconds of the last message.
    bool structured = false;         ///< payload is one JSON object or array, re-serialized.
    bool truncated = false;          ///< payload was cut to fit (kept as raw).
    char payload[LIVENESS_PAYLOAD_MAX] = {0};
};

/** @brief Device name and last-seen time of a stale entry. */
struct StaleEntry {
    char name[LIVENESS_NAME_MAX] = {0};
    bool seen = false;
    uint32_t lastSeen = 0;
};

/**
 * @brief Fixed table of device states.
 *
 * Not synchronized; see LivenessTracker for the shared instance.
 * Entries are only overwritten, never removed.
 */
class LivenessTable {
public:
    /** @param payloadLimit Stored payload size including the terminator, at most LIVENESS_PAYLOAD_MAX. */
    explicit LivenessTable(size_t payloadLimit = LIVENESS_PAYLOAD_MAX);

    size_t payloadLimit() const { return payloadLimit_; }

    /** @brief Track a device (idempotent). false when the table is full or the name too long. */
    bool addDevice(const char* name);

    /**
     * @brief Store a message for a tracked device.
     *
     * A payload made of one JSON object or array (surrounding whitespace allowed)
     * is stored in its compact serialized form and flagged structured. Anything
     * else, including trailing text after the value, is stored verbatim as raw.
     * Payloads of payloadLimit() bytes or more are cut and kept raw.
     * @return false when the device is not tracked.
     */
    bool record(const char* name, uint32_t timestamp, const char* payload, size_t len);

    bool snapshot(const char* name, DeviceStateView& out) const;
    bool snapshotAt(uint8_t idx, DeviceStateView& out) const;

    /**
     * @brief Devices never seen or with (now - lastSeen) > thresholdS.
     * @return Number of entries written to @p out (capped at maxOut).
     */
    uint8_t stalenessReport(uint32_t now, uint32_t thresholdS, StaleEntry* out, uint8_t maxOut) const;

    /** @brief Forget all messages, keep the device list. */
    void resetSeen();
    /** @brief Drop every device. */
    void clear() { count_ = 0; }

    uint8_t count() const { return count_; }
    uint8_t seenCount() const;

private:
    struct Entry {
        char name[LIVENESS_NAME_MAX];
        bool seen;
        uint32_t lastSeen;
        bool structured;
        bool truncated;
        char payload[LIVENESS_PAYLOAD_MAX];
    };

    int8_t find_(const char* name) const;
    static void copyOut_(const Entry& e, DeviceStateView& out);
    /** @brief Decode e.payload (len bytes) and rewrite it compact; false leaves it untouched. */
    bool storeStructured_(Entry& e, size_t len);

    Entry entries_[LIVENESS_MAX_DEVICES] = {};
    uint8_t count_ = 0;
    size_t payloadLimit_;
    char scratch_[LIVENESS_PAYLOAD_MAX] = {0};
    StaticJsonDocument<LIVENESS_DOC_CAPACITY> decodeDoc_;
};
