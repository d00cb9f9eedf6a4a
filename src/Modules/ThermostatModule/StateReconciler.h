#pragma once
/**
 * @file StateReconciler.h
 * @brief Expected vs reported device state comparison.
 */

#include <stddef.h>
#include <stdint.h>
#include <ArduinoJson.h>

constexpr uint8_t MISMATCH_MAX = 24;

/**
 * @brief One comparison rule of the reconciler chain.
 *
 * The first comparator that accepts both values decides equality.
 */
class ValueComparator {
public:
    virtual ~ValueComparator() = default;
    virtual const char* name() const = 0;
    virtual bool accepts(JsonVariantConst expected, JsonVariantConst reported) const = 0;
    virtual bool equal(JsonVariantConst expected, JsonVariantConst reported) const = 0;
};

/** @brief Numbers or decimal strings, absolute tolerance 1e-6. */
class NumericComparator : public ValueComparator {
public:
    const char* name() const override { return "numeric"; }
    bool accepts(JsonVariantConst expected, JsonVariantConst reported) const override;
    bool equal(JsonVariantConst expected, JsonVariantConst reported) const override;
};

/** @brief "HH:MM/temp" token strings; exact times, canonical temperatures. */
class ScheduleComparator : public ValueComparator {
public:
    const char* name() const override { return "schedule"; }
    bool accepts(JsonVariantConst expected, JsonVariantConst reported) const override;
    bool equal(JsonVariantConst expected, JsonVariantConst reported) const override;
};

/** @brief Strings with whitespace runs collapsed and trimmed. */
class TextComparator : public ValueComparator {
public:
    const char* name() const override { return "text"; }
    bool accepts(JsonVariantConst expected, JsonVariantConst reported) const override;
    bool equal(JsonVariantConst expected, JsonVariantConst reported) const override;
};

/** @brief Fallback: strict JSON equality. */
class StrictComparator : public ValueComparator {
public:
    const char* name() const override { return "strict"; }
    bool accepts(JsonVariantConst, JsonVariantConst) const override { return true; }
    bool equal(JsonVariantConst expected, JsonVariantConst reported) const override;
};

/** @brief One differing key. Values point into the caller's documents. */
struct Mismatch {
    const char* key = nullptr;
    JsonVariantConst expected;
    JsonVariantConst reported;
    bool reportedPresent = false;
};

/** @brief Mismatches sorted by key. */
struct MismatchReport {
    Mismatch entries[MISMATCH_MAX];
    uint8_t count = 0;
    bool overflow = false;   ///< More mismatches than entries could hold.

    bool empty() const { return count == 0 && !overflow; }
    void clear() { count = 0; overflow = false; }
};

enum class BatteryStatus : uint8_t {
    None = 0,   ///< Battery info present and fine.
    Low,        ///< Low battery flag set.
    Level,      ///< Numeric level under threshold.
    Unknown     ///< No battery info at all.
};

struct BatteryAnnotation {
    BatteryStatus status = BatteryStatus::None;
    float level = 0.0f;
};

/**
 * @brief Compares expected payloads against reported device state.
 *
 * Only expected keys are examined; extra reported keys are ignored.
 */
class StateReconciler {
public:
    StateReconciler();

    /**
     * @brief Build the mismatch report for one device.
     *
     * A reported value that is not a JSON object marks every expected key
     * as mismatched with the reported side absent.
     */
    void reconcile(JsonObjectConst expected, JsonVariantConst reported, MismatchReport& out) const;

    /** @brief True when the two values are equal under the comparator chain. */
    bool valuesEqual(JsonVariantConst expected, JsonVariantConst reported) const;

    /** @brief Battery annotation from "battery_low" and "battery" of the reported state. */
    static BatteryAnnotation annotateBattery(JsonVariantConst reported, float lowThresholdPct);

    /** @brief "battery low", "battery 12" or "battery unknown"; empty for None. */
    static bool formatBattery(const BatteryAnnotation& battery, char* out, size_t outLen);

private:
    static constexpr uint8_t COMPARATOR_COUNT = 4;
    const ValueComparator* chain_[COMPARATOR_COUNT];
};
