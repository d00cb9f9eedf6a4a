/**
 * @file InventoryModule.cpp
 * @brief Inventory load, validation and the `inventory` service.
 */
#include "InventoryModule.h"
#include "Core/CommandRegistry.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Domain/ThermostatDefaults.h"
#include "Modules/ThermostatModule/ExpectedPayload.h"
#include "Modules/ThermostatModule/ScheduleGenerator.h"
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "InvModul"
#include "Core/ModuleLog.h"

static void copyStr_(char* dst, size_t dstLen, const char* src)
{
    if (!dst || dstLen == 0) return;
    if (!src) src = "";
    strncpy(dst, src, dstLen - 1);
    dst[dstLen - 1] = '\0';
}

bool InventoryModule::lock_()
{
    if (!mutex_) return false;
    if (xSemaphoreTake(mutex_, pdMS_TO_TICKS(LOCK_TIMEOUT_MS)) == pdTRUE) return true;
    LOGW("inventory lock timeout");
    return false;
}

void InventoryModule::unlock_()
{
    xSemaphoreGive(mutex_);
}

void InventoryModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        LOGE("mutex creation failed");
    }

    // Defaults before loadPersistent() overrides them.
    copyStr_(cfgData.json, sizeof(cfgData.json), ThermoDefaults::InventoryJson);
    copyStr_(cfgData.deviceBaseTopic, sizeof(cfgData.deviceBaseTopic), ThermoDefaults::DeviceBaseTopic);
    copyStr_(cfgData.displaySuffix, sizeof(cfgData.displaySuffix), ThermoDefaults::DisplaySuffix);
    copyStr_(cfgData.monitorTopic, sizeof(cfgData.monitorTopic), ThermoDefaults::MonitorTopic);

    cfg.registerVar(jsonVar);
    cfg.registerVar(baseTopicVar);
    cfg.registerVar(displaySuffixVar);
    cfg.registerVar(monitorTopicVar);

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus) {
        eventBus->subscribe(EventId::ConfigChanged, &InventoryModule::onEventStatic, this);
    }

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc) {
        cmdSvc->add(cmdSvc->ctx, "inventory.list", cmdList, this);
    }

    svc_.generation = svcGeneration;
    svc_.deviceCount = svcDeviceCount;
    svc_.deviceAt = svcDeviceAt;
    svc_.findDevice = svcFindDevice;
    svc_.buildExpected = svcBuildExpected;
    svc_.stateTopic = svcStateTopic;
    svc_.monitorTopic = svcMonitorTopic;
    svc_.ctx = this;
    if (!services.add("inventory", &svc_)) LOGE("inventory service not registered");

    LOGI("InventoryService registered");
}

void InventoryModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    applyTopics_();
    if (!reload_()) {
        // Persisted document is unusable: fall back to the built-in one.
        LOGW("stored inventory rejected, using built-in inventory");
        copyStr_(cfgData.json, sizeof(cfgData.json), ThermoDefaults::InventoryJson);
        if (!reload_()) {
            LOGE("built-in inventory rejected");
        }
    }
}

void InventoryModule::applyTopics_()
{
    if (!lock_()) return;
    copyStr_(baseTopic_, sizeof(baseTopic_), cfgData.deviceBaseTopic);
    copyStr_(displaySuffix_, sizeof(displaySuffix_), cfgData.displaySuffix);
    copyStr_(monitorTopic_, sizeof(monitorTopic_), cfgData.monitorTopic);
    ++generation_;
    unlock_();
    LOGI("topics base=%s suffix='%s' monitor=%s", baseTopic_, displaySuffix_, monitorTopic_);
}

bool InventoryModule::reload_()
{
    // staging_ is only touched from the task applying config changes.
    ErrorCode err = ErrorCode::Failed;
    if (!staging_.load(cfgData.json, err)) {
        LOGE("inventory rejected (%s), keeping previous tables", errorCodeStr(err));
        return false;
    }

    logDeviceErrors_(staging_);

    if (!lock_()) return false;
    live_ = staging_;
    ++generation_;
    unlock_();

    LOGI("inventory loaded types=%u devices=%u valid=%u",
         (unsigned)staging_.types().count(), (unsigned)staging_.deviceCount(),
         (unsigned)staging_.validCount());
    postReloaded_();
    return true;
}

void InventoryModule::postReloaded_()
{
    if (!eventBus) return;
    InventoryReloadedPayload p{};
    p.types = staging_.types().count();
    p.devices = staging_.deviceCount();
    p.validDevices = staging_.validCount();
    p.rejected = (uint8_t)(staging_.rejectedTypes() + staging_.rejectedDevices());
    (void)eventBus->post(EventId::InventoryReloaded, &p, sizeof(p));
}

void InventoryModule::logDeviceErrors_(const ThermostatInventory& inv)
{
    if (inv.rejectedTypes() > 0) {
        LOGE("%u type entr%s rejected", (unsigned)inv.rejectedTypes(), inv.rejectedTypes() == 1 ? "y" : "ies");
    }
    if (inv.rejectedDevices() > 0) {
        LOGE("%u device entr%s dropped (table full or bad name)",
             (unsigned)inv.rejectedDevices(), inv.rejectedDevices() == 1 ? "y" : "ies");
    }
    for (uint8_t i = 0; i < inv.deviceCount(); ++i) {
        const DeviceConfig* d = inv.device(i);
        if (!d || d->valid) continue;
        LOGE("device '%s' (type=%s) invalid: %s", d->name, d->type, errorCodeStr(d->error));
    }
}

void InventoryModule::onEventStatic(const Event& e, void* user)
{
    static_cast<InventoryModule*>(user)->onEvent(e);
}

void InventoryModule::onEvent(const Event& e)
{
    if (e.id != EventId::ConfigChanged) return;
    const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
    if (!p) return;

    const char* key = p->nvsKey;
    if (strcmp(key, NvsKeys::Inventory::Json) == 0) {
        LOGI("inventory document changed -> reload");
        (void)reload_();
        return;
    }
    if (strcmp(key, NvsKeys::Inventory::DeviceBaseTopic) == 0 ||
        strcmp(key, NvsKeys::Inventory::DisplaySuffix) == 0 ||
        strcmp(key, NvsKeys::Inventory::MonitorTopic) == 0) {
        applyTopics_();
    }
}

uint32_t InventoryModule::svcGeneration(void* ctx)
{
    InventoryModule* self = static_cast<InventoryModule*>(ctx);
    if (!self->lock_()) return 0;
    const uint32_t g = self->generation_;
    self->unlock_();
    return g;
}

uint8_t InventoryModule::svcDeviceCount(void* ctx)
{
    InventoryModule* self = static_cast<InventoryModule*>(ctx);
    if (!self->lock_()) return 0;
    const uint8_t n = self->live_.deviceCount();
    self->unlock_();
    return n;
}

bool InventoryModule::svcDeviceAt(void* ctx, uint8_t idx, DeviceConfig* out)
{
    InventoryModule* self = static_cast<InventoryModule*>(ctx);
    if (!out || !self->lock_()) return false;
    const DeviceConfig* d = self->live_.device(idx);
    if (d) *out = *d;
    self->unlock_();
    return d != nullptr;
}

bool InventoryModule::svcFindDevice(void* ctx, const char* name, DeviceConfig* out)
{
    InventoryModule* self = static_cast<InventoryModule*>(ctx);
    if (!out || !self->lock_()) return false;
    const DeviceConfig* d = self->live_.findDevice(name);
    if (d) *out = *d;
    self->unlock_();
    return d != nullptr;
}

bool InventoryModule::svcBuildExpected(void* ctx, const char* name, JsonDocument* out,
                                       char* topic, size_t topicLen,
                                       char* schedule, size_t scheduleLen,
                                       ErrorCode* err)
{
    InventoryModule* self = static_cast<InventoryModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    ErrorCode& e = err ? *err : local;
    if (!out) {
        e = ErrorCode::MissingArgs;
        return false;
    }
    if (!self->lock_()) {
        e = ErrorCode::Busy;
        return false;
    }

    bool ok = false;
    const DeviceConfig* d = self->live_.findDevice(name);
    if (!d) {
        e = ErrorCode::UnknownDevice;
    } else if (!d->valid) {
        e = d->error;
    } else {
        TopicLayout layout;
        layout.baseTopic = self->baseTopic_;
        layout.displaySuffix = self->displaySuffix_;
        ok = buildExpectedPayload(*d, self->live_.types(), layout, *out,
                                  topic, topicLen, schedule, scheduleLen, e);
    }
    self->unlock_();
    return ok;
}

bool InventoryModule::svcStateTopic(void* ctx, const char* name, char* out, size_t len)
{
    InventoryModule* self = static_cast<InventoryModule*>(ctx);
    if (!self->lock_()) return false;
    TopicLayout layout;
    layout.baseTopic = self->baseTopic_;
    layout.displaySuffix = self->displaySuffix_;
    const bool ok = formatDeviceTopic(layout, name, nullptr, out, len);
    self->unlock_();
    return ok;
}

bool InventoryModule::svcMonitorTopic(void* ctx, char* out, size_t len)
{
    InventoryModule* self = static_cast<InventoryModule*>(ctx);
    if (!out || len == 0 || !self->lock_()) return false;
    const size_t n = strlen(self->monitorTopic_);
    const bool ok = (n > 0 && n < len);
    if (ok) memcpy(out, self->monitorTopic_, n + 1);
    self->unlock_();
    return ok;
}

bool InventoryModule::cmdList(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    InventoryModule* self = static_cast<InventoryModule*>(userCtx);

    static StaticJsonDocument<Limits::Thermostat::ReportDoc> doc;
    doc.clear();
    doc["ok"] = true;

    if (!self->lock_()) {
        writeErrorJson(reply, replyLen, ErrorCode::Busy, "inventory.list");
        return false;
    }
    doc["generation"] = self->generation_;
    doc["types"] = self->live_.types().count();
    JsonArray arr = doc.createNestedArray("devices");
    char tbuf[8];
    for (uint8_t i = 0; i < self->live_.deviceCount(); ++i) {
        const DeviceConfig* d = self->live_.device(i);
        if (!d) continue;
        JsonObject o = arr.createNestedObject();
        o["name"] = (char*)d->name;   // copied: the table may be swapped after unlock
        o["type"] = (char*)d->type;
        o["valid"] = d->valid;
        if (d->valid) {
            if (formatTimeOfDay(d->dayMinute, tbuf, sizeof(tbuf))) o["day_time"] = (char*)tbuf;
            o["day_temperature"] = d->dayTemperature;
            if (formatTimeOfDay(d->nightMinute, tbuf, sizeof(tbuf))) o["night_time"] = (char*)tbuf;
            o["night_temperature"] = d->nightTemperature;
        } else {
            o["error"] = errorCodeStr(d->error);
        }
    }
    self->unlock_();

    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::BufferTooSmall, "inventory.list");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}
