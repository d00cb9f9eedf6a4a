#pragma once
/**
 * @file ThermostatModule.h
 * @brief Schedule apply and state reconciliation for the configured thermostats.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include "Domain/ThermostatDefaults.h"
#include "Modules/MonitorModule/LivenessTracker.h"
#include "Modules/ThermostatModule/DeviceReconcile.h"
#include "Modules/ThermostatModule/ExpectedPayload.h"
#include "Modules/ThermostatModule/StateReconciler.h"
#include <ArduinoJson.h>

/** @brief Thermostat configuration values. */
struct ThermostatConfig {
    uint32_t reconcileTimeoutMs = ThermoDefaults::ReconcileTimeoutMs;
    uint8_t batteryLowPct = (uint8_t)ThermoDefaults::BatteryLowPct;
    bool applyOnConnect = false;
    uint32_t applyGapMs = ThermoDefaults::ApplyGapMs;
};

/**
 * @brief Active module that pushes schedules and checks reported device state.
 *
 * Commands only queue work; publishing and the reconciliation pass run on the
 * module task. Monitor replies are collected by an MQTT route into a private
 * reply table, which is cleared at the start of every pass.
 */
class ThermostatModule : public ActiveModule {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "thermostat"; }
    uint8_t dependencyCount() const override { return 6; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        if (i == 3) return "mqtt";
        if (i == 4) return "time";
        if (i == 5) return "inventory";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Register the monitor reply route. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    TaskSpec taskSpec() const override { return TaskSpec{"thermo", Limits::Thermostat::TaskStackSize}; }

private:
    ThermostatConfig cfgData;
    StateReconciler reconciler_;
    LivenessTracker replies_;

    const MqttService* mqttSvc = nullptr;
    const TimeService* timeSvc = nullptr;
    const InventoryService* invSvc = nullptr;
    EventBus* eventBus = nullptr;

    char replyPrefix_[Limits::Inventory::MonitorTopic + 1] = {0};

    // ---- queued work (set by commands/events, consumed by loop) ----
    portMUX_TYPE pendingMux_ = portMUX_INITIALIZER_UNLOCKED;
    bool pendingApply_ = false;
    char applyName_[DEVICE_NAME_MAX] = {0};   ///< empty: every valid device
    bool pendingReconcile_ = false;
    volatile bool reconcileRunning_ = false;
    volatile bool pendingCheck_ = true;
    uint32_t passCount_ = 0;

    // ---- task buffers ----
    StaticJsonDocument<EXPECTED_PAYLOAD_CAPACITY> expectedDoc_;
    StaticJsonDocument<Limits::Thermostat::ReplyDoc> replyDoc_;
    StaticJsonDocument<Limits::Thermostat::ReportDoc> reportDoc_;
    StaticJsonDocument<Limits::Thermostat::ReportDoc> summaryDoc_;
    DeviceOutcome outcome_;
    DeviceStateView replyView_;
    DeviceConfig device_;
    char topicBuf_[Limits::Thermostat::Topic] = {0};
    char suffixBuf_[Limits::Thermostat::Topic] = {0};
    char scheduleBuf_[SCHEDULE_TEXT_MAX] = {0};
    char payloadBuf_[Limits::Thermostat::PayloadBuf] = {0};
    char reportBuf_[Limits::Thermostat::ReportBuf] = {0};

    ConfigVariable<uint32_t> reconcileTimeoutVar {
        NVS_KEY(NvsKeys::Thermostat::ReconcileTimeoutMs),"reconcile_timeout_ms","thermostat",ConfigType::UInt32,
        &cfgData.reconcileTimeoutMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t> batteryLowVar {
        NVS_KEY(NvsKeys::Thermostat::BatteryLowPct),"battery_low_pct","thermostat",ConfigType::UInt8,
        &cfgData.batteryLowPct,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> applyOnConnectVar {
        NVS_KEY(NvsKeys::Thermostat::ApplyOnConnect),"apply_on_connect","thermostat",ConfigType::Bool,
        &cfgData.applyOnConnect,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint32_t> applyGapVar {
        NVS_KEY(NvsKeys::Thermostat::ApplyGapMs),"apply_gap_ms","thermostat",ConfigType::UInt32,
        &cfgData.applyGapMs,ConfigPersistence::Persistent,0
    };

    bool requestApply_(const char* name);
    bool requestReconcile_();

    void checkAll_();
    void runApply_();
    bool applyOne_(const char* name);
    void runReconcile_();
    /** @brief Compare one device and publish its report; the result stays in outcome_. */
    const DeviceOutcome& reconcileOne_(const DeviceConfig& dev);
    bool publishJson_(const char* suffix, JsonDocument& doc);

    static void onReplyMsg(void* ctx, const char* topic, const char* payload, size_t len, uint32_t receivedAt);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static bool cmdApply(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSchedule(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdReconcile(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
