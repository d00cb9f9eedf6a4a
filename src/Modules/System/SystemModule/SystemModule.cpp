/**
 * @file SystemModule.cpp
 * @brief Device-level commands.
 */
#include "SystemModule.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventBus.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <WiFi.h>
#include <esp_system.h>
#include <esp_wifi.h>
#define LOG_TAG "SysModul"
#include "Core/ModuleLog.h"

namespace {

bool writeReply(JsonDocument& doc, char* reply, size_t replyLen, const char* where)
{
    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::BufferTooSmall, where);
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

// Station settings a previous firmware may have left in the driver's own NVS.
bool forgetDriverCredentials()
{
    if (WiFi.getMode() == WIFI_MODE_NULL) return true;
    const esp_err_t err = esp_wifi_restore();
    if (err != ESP_OK) LOGE("esp_wifi_restore: %s", esp_err_to_name(err));
    return err == ESP_OK;
}

void restartNow(TimerHandle_t)
{
    esp_restart();
}

}  // namespace

void SystemModule::init(ConfigStore&, ServiceRegistry& services)
{
    log_ = services.get<LogHubService>("loghub");
    cmd_ = services.get<CommandService>("cmd");
    config_ = services.get<ConfigStoreService>("config");
    wifi_ = services.get<WifiService>("wifi");
    time_ = services.get<TimeService>("time");
    const EventBusService* eb = services.get<EventBusService>("eventbus");
    bus_ = eb ? eb->bus : nullptr;

    if (!cmd_) {
        LOGE("no cmd service, system.* unavailable");
        return;
    }
    cmd_->add(cmd_->ctx, "system.ping", cmdPing, this);
    cmd_->add(cmd_->ctx, "system.info", cmdInfo, this);
    cmd_->add(cmd_->ctx, "system.reboot", cmdReboot, this);
    cmd_->add(cmd_->ctx, "system.factory_reset", cmdFactoryReset, this);
}

bool SystemModule::scheduleRestart_(const char* why)
{
    if (!restartTimer_) {
        restartTimer_ = xTimerCreate("restart", pdMS_TO_TICKS(Limits::System::RestartDelayMs), pdFALSE,
                                     this, restartNow);
    }
    if (!restartTimer_ || xTimerStart(restartTimer_, 0) != pdPASS) {
        LOGE("restart timer not started");
        return false;
    }
    LOGW("restarting in %lu ms (%s)", (unsigned long)Limits::System::RestartDelayMs, why);
    return true;
}

bool SystemModule::cmdPing(void*, const CommandRequest&, char* reply, size_t replyLen)
{
    StaticJsonDocument<64> doc;
    doc["ok"] = true;
    doc["pong"] = true;
    return writeReply(doc, reply, replyLen, "system.ping");
}

bool SystemModule::cmdInfo(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    const SystemModule* self = static_cast<SystemModule*>(userCtx);

    StaticJsonDocument<512> doc;
    doc["ok"] = true;
    doc["uptime_s"] = millis() / 1000UL;
    doc["heap_free"] = ESP.getFreeHeap();
    doc["heap_min"] = ESP.getMinFreeHeap();
    doc["sdk"] = ESP.getSdkVersion();

    if (self->wifi_) {
        char ip[16];
        JsonObject wifi = doc.createNestedObject("wifi");
        wifi["state"] = wifiStateStr(self->wifi_->state(self->wifi_->ctx));
        if (self->wifi_->getIP(self->wifi_->ctx, ip, sizeof(ip))) {
            wifi["ip"] = (const char*)ip;  // copied
            wifi["rssi"] = self->wifi_->rssi(self->wifi_->ctx);
        }
    }

    char iso[24];
    const uint64_t epoch = self->time_ ? self->time_->epoch(self->time_->ctx) : 0;
    if (epoch != 0 && self->time_->formatIso(self->time_->ctx, epoch, iso, sizeof(iso))) {
        doc["time"] = (const char*)iso;
    } else {
        doc["time"] = nullptr;
    }

    JsonObject drops = doc.createNestedObject("dropped");
    drops["log"] = self->log_ ? self->log_->dropped(self->log_->ctx) : 0U;
    drops["events"] = self->bus_ ? self->bus_->dropped() : 0U;
    doc["commands"] = self->cmd_ ? self->cmd_->count(self->cmd_->ctx) : 0U;

    return writeReply(doc, reply, replyLen, "system.info");
}

bool SystemModule::cmdReboot(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    SystemModule* self = static_cast<SystemModule*>(userCtx);
    if (!self->scheduleRestart_("system.reboot")) {
        writeErrorJson(reply, replyLen, ErrorCode::Failed, "system.reboot");
        return false;
    }
    StaticJsonDocument<64> doc;
    doc["ok"] = true;
    doc["restart_ms"] = Limits::System::RestartDelayMs;
    return writeReply(doc, reply, replyLen, "system.reboot");
}

bool SystemModule::cmdFactoryReset(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    SystemModule* self = static_cast<SystemModule*>(userCtx);
    if (!self->config_) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "system.factory_reset");
        return false;
    }
    // Both stores are wiped even when the first one fails.
    const bool configErased = self->config_->erase(self->config_->ctx);
    const bool driverErased = forgetDriverCredentials();
    if (!configErased || !driverErased) {
        LOGE("factory reset incomplete (config %d, wifi driver %d)", (int)configErased, (int)driverErased);
        writeErrorJson(reply, replyLen, ErrorCode::Failed, "system.factory_reset");
        return false;
    }
    if (!self->scheduleRestart_("system.factory_reset")) {
        writeErrorJson(reply, replyLen, ErrorCode::Failed, "system.factory_reset");
        return false;
    }
    StaticJsonDocument<64> doc;
    doc["ok"] = true;
    doc["restart_ms"] = Limits::System::RestartDelayMs;
    return writeReply(doc, reply, replyLen, "system.factory_reset");
}
