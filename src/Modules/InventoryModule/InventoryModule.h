#pragma once
/**
 * @file InventoryModule.h
 * @brief Module owning the thermostat device/type inventory.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include "Modules/ThermostatModule/ThermostatInventory.h"
#include "freertos/semphr.h"

/** @brief Inventory configuration values. */
struct InventoryConfig {
    char json[Limits::Inventory::JsonBuf] = {0};
    char deviceBaseTopic[Limits::Inventory::BaseTopic] = {0};
    char displaySuffix[Limits::Inventory::DisplaySuffix] = {0};
    char monitorTopic[Limits::Inventory::MonitorTopic] = {0};
};

/**
 * @brief Passive module that parses the inventory document and serves it.
 *
 * The document is parsed after config load and again on every change of an
 * `inventory.*` key. A document that fails to parse leaves the previous tables
 * in place. Readers only ever get copies taken under the inventory mutex.
 */
class InventoryModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "inventory"; }

    /** @brief Depends on log hub, event bus and command service. */
    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        return nullptr;
    }

    /** @brief Register config and the inventory service. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief First parse of the (possibly persisted) document. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static constexpr uint32_t LOCK_TIMEOUT_MS = 200;

    InventoryConfig cfgData;
    SemaphoreHandle_t mutex_ = nullptr;
    EventBus* eventBus = nullptr;
    InventoryService svc_{};

    ThermostatInventory live_;
    ThermostatInventory staging_;
    uint32_t generation_ = 0;

    // Topic settings in effect, copied from cfgData under the mutex.
    char baseTopic_[Limits::Inventory::BaseTopic] = {0};
    char displaySuffix_[Limits::Inventory::DisplaySuffix] = {0};
    char monitorTopic_[Limits::Inventory::MonitorTopic] = {0};

    ConfigVariable<char> jsonVar {
        NVS_KEY(NvsKeys::Inventory::Json),"json","inventory",ConfigType::CharArray,
        (char*)cfgData.json,ConfigPersistence::Persistent,sizeof(cfgData.json)
    };
    ConfigVariable<char> baseTopicVar {
        NVS_KEY(NvsKeys::Inventory::DeviceBaseTopic),"device_base_topic","inventory",ConfigType::CharArray,
        (char*)cfgData.deviceBaseTopic,ConfigPersistence::Persistent,sizeof(cfgData.deviceBaseTopic)
    };
    ConfigVariable<char> displaySuffixVar {
        NVS_KEY(NvsKeys::Inventory::DisplaySuffix),"display_suffix","inventory",ConfigType::CharArray,
        (char*)cfgData.displaySuffix,ConfigPersistence::Persistent,sizeof(cfgData.displaySuffix)
    };
    ConfigVariable<char> monitorTopicVar {
        NVS_KEY(NvsKeys::Inventory::MonitorTopic),"monitor_topic","inventory",ConfigType::CharArray,
        (char*)cfgData.monitorTopic,ConfigPersistence::Persistent,sizeof(cfgData.monitorTopic)
    };

    bool lock_();
    void unlock_();

    /** @brief Parse cfgData.json into staging_ and swap it in on success. */
    bool reload_();
    /** @brief Copy the topic settings in effect. */
    void applyTopics_();
    void postReloaded_();
    void logDeviceErrors_(const ThermostatInventory& inv);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static bool cmdList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    static uint32_t svcGeneration(void* ctx);
    static uint8_t svcDeviceCount(void* ctx);
    static bool svcDeviceAt(void* ctx, uint8_t idx, DeviceConfig* out);
    static bool svcFindDevice(void* ctx, const char* name, DeviceConfig* out);
    static bool svcBuildExpected(void* ctx, const char* name, JsonDocument* out,
                                 char* topic, size_t topicLen,
                                 char* schedule, size_t scheduleLen,
                                 ErrorCode* err);
    static bool svcStateTopic(void* ctx, const char* name, char* out, size_t len);
    static bool svcMonitorTopic(void* ctx, char* out, size_t len);
};
