#pragma once
/**
 * @file MonitorModule.h
 * @brief Device liveness monitor: state recording, query replies and staleness report.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include "Domain/ThermostatDefaults.h"
#include "Modules/MonitorModule/LivenessTracker.h"
#include "Modules/MonitorModule/MonitorReply.h"
#include <ArduinoJson.h>

/** @brief Monitor configuration values. */
struct MonitorConfig {
    uint32_t staleThresholdS = ThermoDefaults::StaleThresholdS;
    uint32_t reportPeriodS = ThermoDefaults::ReportPeriodS;
    char reportSuffix[Limits::Monitor::ReportSuffix] = {0};
};

/**
 * @brief Active module tracking when each thermostat last reported.
 *
 * Device states are recorded on the MQTT task through the route handler.
 * Query answers and the periodic staleness report are produced on the monitor
 * task; the tracker lock is never held while publishing.
 */
class MonitorModule : public ActiveModule {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "monitor"; }
    uint8_t dependencyCount() const override { return 6; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        if (i == 2) return "mqtt";
        if (i == 3) return "time";
        if (i == 4) return "inventory";
        if (i == 5) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Track every inventory device and register the MQTT routes. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    TaskSpec taskSpec() const override { return TaskSpec{"monitor", Limits::Monitor::TaskStackSize}; }

private:
    struct DeviceRoute {
        char topic[Limits::Thermostat::Topic];
        char name[LIVENESS_NAME_MAX];
    };

    MonitorConfig cfgData;
    LivenessTracker tracker_{DEVICE_STATE_MAX};

    const MqttService* mqttSvc = nullptr;
    const TimeService* timeSvc = nullptr;
    const InventoryService* invSvc = nullptr;

    DeviceRoute routes_[Limits::Monitor::MaxDeviceRoutes] = {};
    uint8_t routeCount_ = 0;
    char queryTopic_[Limits::Inventory::MonitorTopic] = {0};
    uint32_t inventoryGen_ = 0;

    volatile bool pendingQuery_ = false;
    uint32_t lastReportMs_ = 0;
    uint32_t queryCount_ = 0;
    uint32_t reportCount_ = 0;

    // Monitor task buffers.
    DeviceStateView view_;
    StaleEntry stale_[LIVENESS_MAX_DEVICES];
    char publishBuf_[Limits::Monitor::PublishBuf] = {0};
    char listBuf_[Limits::Monitor::ListBuf] = {0};
    char topicBuf_[Limits::Thermostat::Topic] = {0};

    // Command buffers (commands run on the MQTT task).
    DeviceStateView cmdView_;
    StaleEntry cmdStale_[LIVENESS_MAX_DEVICES];

    ConfigVariable<uint32_t> staleThresholdVar {
        NVS_KEY(NvsKeys::Monitor::StaleThresholdS),"stale_threshold_s","monitor",ConfigType::UInt32,
        &cfgData.staleThresholdS,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint32_t> reportPeriodVar {
        NVS_KEY(NvsKeys::Monitor::ReportPeriodS),"report_period_s","monitor",ConfigType::UInt32,
        &cfgData.reportPeriodS,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char> reportSuffixVar {
        NVS_KEY(NvsKeys::Monitor::ReportSuffix),"report_suffix","monitor",ConfigType::CharArray,
        (char*)cfgData.reportSuffix,ConfigPersistence::Persistent,sizeof(cfgData.reportSuffix)
    };

    uint32_t now_() const;
    bool formatIso_(uint32_t epoch, char* out, size_t len) const;
    const char* nameForTopic_(const char* topic) const;

    /** @brief Formatted last-seen time of a snapshot, nullptr when unknown. */
    const char* lastSeenIso_(const DeviceStateView& v, char* buf, size_t len) const;
    /**
     * @brief `{"timestamp":iso,"unseen":[..]}` into @p doc.
     * @return false when the table could not be read; @p count is then 0.
     */
    bool buildStaleReport_(JsonDocument& doc, StaleEntry* buf, uint8_t& count);

    void answerQuery_();
    void publishStaleReport_();

    static void onStateMsg(void* ctx, const char* topic, const char* payload, size_t len, uint32_t receivedAt);
    static void onQueryMsg(void* ctx, const char* topic, const char* payload, size_t len, uint32_t receivedAt);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static bool cmdStatus(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStale(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
