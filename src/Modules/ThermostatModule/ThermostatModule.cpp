/**
 * @file ThermostatModule.cpp
 * @brief Schedule apply, reconcile passes and the `thermostat.*` commands.
 */
#include "ThermostatModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/MqttTopics.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include <Arduino.h>
#include <string.h>
#define LOG_TAG "ThermMod"
#include "Core/ModuleLog.h"

// Optional {"name":"x"} argument. false only on malformed args.
static bool parseNameArg_(const char* args, char* out, size_t outLen, ErrorCode& err)
{
    out[0] = '\0';
    if (!args || args[0] == '\0') return true;

    StaticJsonDocument<Limits::JsonCmdArgsBuf> doc;
    if (deserializeJson(doc, args) || !doc.is<JsonObject>()) {
        err = ErrorCode::BadCmdJson;
        return false;
    }
    const char* name = doc["name"] | (const char*)nullptr;
    if (!name) return true;
    if (strlen(name) >= outLen) {
        err = ErrorCode::UnknownDevice;
        return false;
    }
    strncpy(out, name, outLen - 1);
    out[outLen - 1] = '\0';
    return true;
}

void ThermostatModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(reconcileTimeoutVar);
    cfg.registerVar(batteryLowVar);
    cfg.registerVar(applyOnConnectVar);
    cfg.registerVar(applyGapVar);

    mqttSvc = services.get<MqttService>("mqtt");
    timeSvc = services.get<TimeService>("time");
    invSvc = services.get<InventoryService>("inventory");

    if (!replies_.begin()) LOGE("reply table unavailable");

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc) {
        cmdSvc->add(cmdSvc->ctx, "thermostat.apply", cmdApply, this);
        cmdSvc->add(cmdSvc->ctx, "thermostat.schedule", cmdSchedule, this);
        cmdSvc->add(cmdSvc->ctx, "thermostat.reconcile", cmdReconcile, this);
    }

    auto* ebSvc = services.get<EventBusService>("eventbus");
    eventBus = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus) {
        eventBus->subscribe(EventId::MqttConnected, &ThermostatModule::onEventStatic, this);
        eventBus->subscribe(EventId::InventoryReloaded, &ThermostatModule::onEventStatic, this);
    }
}

void ThermostatModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (!invSvc || !mqttSvc) {
        LOGE("inventory or mqtt service missing, thermostat idle");
        return;
    }
    if (!invSvc->monitorTopic(invSvc->ctx, replyPrefix_, sizeof(replyPrefix_))) {
        LOGE("monitor topic not configured, reconcile disabled");
        replyPrefix_[0] = '\0';
        return;
    }

    char filter[Limits::Inventory::MonitorTopic + 3];
    snprintf(filter, sizeof(filter), "%s/+", replyPrefix_);
    if (!mqttSvc->subscribe(mqttSvc->ctx, filter, 1, onReplyMsg, this)) {
        LOGE("subscribe failed for %s", filter);
    }
    LOGI("timeout=%lums battery_low=%u%% apply_on_connect=%d",
         (unsigned long)cfgData.reconcileTimeoutMs, (unsigned)cfgData.batteryLowPct,
         (int)cfgData.applyOnConnect);
}

void ThermostatModule::onReplyMsg(void* ctx, const char* topic, const char* payload, size_t len, uint32_t receivedAt)
{
    ThermostatModule* self = static_cast<ThermostatModule*>(ctx);
    if (!topic || self->replyPrefix_[0] == '\0') return;

    const size_t plen = strlen(self->replyPrefix_);
    if (strncmp(topic, self->replyPrefix_, plen) != 0 || topic[plen] != '/') return;
    const char* name = topic + plen + 1;
    if (name[0] == '\0') return;

    // Replies outside a pass land on an empty table and are dropped.
    if (!self->replies_.record(name, receivedAt, payload, len)) {
        LOGD("reply for '%s' ignored", name);
    }
}

bool ThermostatModule::requestApply_(const char* name)
{
    bool accepted = false;
    portENTER_CRITICAL(&pendingMux_);
    if (!pendingApply_) {
        pendingApply_ = true;
        strncpy(applyName_, name ? name : "", sizeof(applyName_) - 1);
        applyName_[sizeof(applyName_) - 1] = '\0';
        accepted = true;
    }
    portEXIT_CRITICAL(&pendingMux_);
    return accepted;
}

bool ThermostatModule::requestReconcile_()
{
    bool accepted = false;
    portENTER_CRITICAL(&pendingMux_);
    if (!pendingReconcile_ && !reconcileRunning_) {
        pendingReconcile_ = true;
        accepted = true;
    }
    portEXIT_CRITICAL(&pendingMux_);
    return accepted;
}

void ThermostatModule::checkAll_()
{
    if (!invSvc) return;
    const uint8_t n = invSvc->deviceCount(invSvc->ctx);
    uint8_t good = 0;
    for (uint8_t i = 0; i < n; ++i) {
        if (!invSvc->deviceAt(invSvc->ctx, i, &device_) || !device_.valid) continue;

        ErrorCode err = ErrorCode::Failed;
        expectedDoc_.clear();
        if (!invSvc->buildExpected(invSvc->ctx, device_.name, &expectedDoc_,
                                   topicBuf_, sizeof(topicBuf_),
                                   scheduleBuf_, sizeof(scheduleBuf_), &err)) {
            LOGE("'%s': expected payload failed (%s)", device_.name, errorCodeStr(err));
            continue;
        }
        ++good;
        LOGI("'%s' -> %s %s", device_.name, topicBuf_, scheduleBuf_);
    }
    LOGI("%u/%u device(s) ready", (unsigned)good, (unsigned)n);
}

bool ThermostatModule::applyOne_(const char* name)
{
    ErrorCode err = ErrorCode::Failed;
    expectedDoc_.clear();
    if (!invSvc->buildExpected(invSvc->ctx, name, &expectedDoc_,
                               topicBuf_, sizeof(topicBuf_),
                               scheduleBuf_, sizeof(scheduleBuf_), &err)) {
        LOGE("'%s': apply skipped (%s)", name, errorCodeStr(err));
        return false;
    }

    if (expectedDoc_.overflowed() || measureJson(expectedDoc_) >= sizeof(payloadBuf_)) {
        LOGE("'%s': payload too large", name);
        return false;
    }
    serializeJson(expectedDoc_, payloadBuf_, sizeof(payloadBuf_));
    if (!mqttSvc->publish(mqttSvc->ctx, topicBuf_, payloadBuf_, 1, false)) {
        LOGW("'%s': publish failed", name);
        return false;
    }
    LOGI("'%s' applied: %s", name, scheduleBuf_);
    return true;
}

void ThermostatModule::runApply_()
{
    char name[DEVICE_NAME_MAX];
    portENTER_CRITICAL(&pendingMux_);
    memcpy(name, applyName_, sizeof(name));
    portEXIT_CRITICAL(&pendingMux_);

    if (!invSvc || !mqttSvc || !mqttSvc->isConnected(mqttSvc->ctx)) {
        LOGW("apply dropped, mqtt not connected");
        return;
    }

    if (name[0] != '\0') {
        (void)applyOne_(name);
        return;
    }

    const uint8_t n = invSvc->deviceCount(invSvc->ctx);
    uint8_t applied = 0;
    bool first = true;
    for (uint8_t i = 0; i < n; ++i) {
        if (!invSvc->deviceAt(invSvc->ctx, i, &device_) || !device_.valid) continue;
        if (!first && cfgData.applyGapMs > 0) vTaskDelay(pdMS_TO_TICKS(cfgData.applyGapMs));
        first = false;
        if (applyOne_(device_.name)) ++applied;
    }
    LOGI("apply done: %u device(s)", (unsigned)applied);
}

bool ThermostatModule::publishJson_(const char* suffix, JsonDocument& doc)
{
    if (doc.overflowed() || measureJson(doc) >= sizeof(reportBuf_)) {
        LOGW("report %s too large", suffix);
        return false;
    }
    serializeJson(doc, reportBuf_, sizeof(reportBuf_));
    mqttSvc->formatTopic(mqttSvc->ctx, suffix, topicBuf_, sizeof(topicBuf_));
    return mqttSvc->publish(mqttSvc->ctx, topicBuf_, reportBuf_, 1, false);
}

const DeviceOutcome& ThermostatModule::reconcileOne_(const DeviceConfig& dev)
{
    ErrorCode err = ErrorCode::Failed;
    expectedDoc_.clear();

    if (!dev.valid) {
        markSkipped(outcome_, dev.error);
    } else if (!invSvc->buildExpected(invSvc->ctx, dev.name, &expectedDoc_,
                                      topicBuf_, sizeof(topicBuf_),
                                      scheduleBuf_, sizeof(scheduleBuf_), &err)) {
        LOGE("'%s': expected payload failed (%s)", dev.name, errorCodeStr(err));
        markSkipped(outcome_, err);
    } else {
        if (!replies_.snapshot(dev.name, replyView_)) replyView_.seen = false;
        reconcileReply(reconciler_, expectedDoc_.as<JsonObjectConst>(), replyView_, replyDoc_,
                       (float)cfgData.batteryLowPct, outcome_);
    }

    const int w = snprintf(suffixBuf_, sizeof(suffixBuf_), "%s/%s", MqttTopics::SuffixReconcile, dev.name);
    if (w <= 0 || (size_t)w >= sizeof(suffixBuf_)) {
        LOGW("'%s': report topic too long", dev.name);
    } else if (!buildDeviceReport(dev.name, outcome_, reportDoc_)) {
        LOGW("'%s': report too large", dev.name);
    } else if (!publishJson_(suffixBuf_, reportDoc_)) {
        LOGW("'%s': report publish failed", dev.name);
    }

    if (outcome_.status == ReconcileStatus::Mismatch) {
        LOGW("'%s': %u mismatch(es)%s", dev.name, (unsigned)outcome_.mismatches.count,
             outcome_.mismatches.overflow ? " (more omitted)" : "");
    } else if (outcome_.status == ReconcileStatus::Timeout) {
        LOGW("'%s': no state reply", dev.name);
    }
    return outcome_;
}

void ThermostatModule::runReconcile_()
{
    if (!invSvc || !mqttSvc || replyPrefix_[0] == '\0') return;
    if (!mqttSvc->isConnected(mqttSvc->ctx)) {
        LOGW("reconcile dropped, mqtt not connected");
        return;
    }

    // 1) fresh reply table for every inventory device.
    replies_.clear();
    const uint8_t n = invSvc->deviceCount(invSvc->ctx);
    for (uint8_t i = 0; i < n; ++i) {
        if (!invSvc->deviceAt(invSvc->ctx, i, &device_)) continue;
        if (!replies_.addDevice(device_.name)) LOGW("reply table rejected '%s'", device_.name);
    }
    const uint8_t tracked = replies_.count();

    // 2) ask the monitor.
    if (!mqttSvc->publish(mqttSvc->ctx, replyPrefix_, MqttTopics::MonitorQueryGet, 1, false)) {
        LOGW("monitor query publish failed");
        return;
    }

    // 3) wait for replies.
    const uint32_t start = millis();
    while ((millis() - start) < cfgData.reconcileTimeoutMs) {
        if (tracked > 0 && replies_.seenCount() >= tracked) break;
        vTaskDelay(pdMS_TO_TICKS(Limits::Thermostat::WaitSliceMs));
    }
    LOGD("%u/%u reply(ies) after %lums", (unsigned)replies_.seenCount(), (unsigned)tracked,
         (unsigned long)(millis() - start));

    // 4) compare device by device.
    ReconcileCompletedPayload counts{};
    summaryDoc_.clear();
    char iso[32];
    const uint64_t now = (timeSvc && timeSvc->epoch) ? timeSvc->epoch(timeSvc->ctx) : 0;
    if (now != 0 && timeSvc->formatIso && timeSvc->formatIso(timeSvc->ctx, now, iso, sizeof(iso))) {
        summaryDoc_["timestamp"] = iso;
    } else {
        summaryDoc_["timestamp"] = nullptr;
    }
    JsonArray devs = summaryDoc_.createNestedArray("devices");

    for (uint8_t i = 0; i < n; ++i) {
        if (!invSvc->deviceAt(invSvc->ctx, i, &device_)) continue;
        const DeviceOutcome& res = reconcileOne_(device_);
        JsonObject o = devs.createNestedObject();
        o["name"] = (char*)device_.name;
        o["status"] = reconcileStatusStr(res.status);
        switch (res.status) {
        case ReconcileStatus::Ok: ++counts.ok; break;
        case ReconcileStatus::Mismatch: ++counts.mismatch; break;
        case ReconcileStatus::Timeout: ++counts.timeout; break;
        case ReconcileStatus::Skipped:
            ++counts.skipped;
            o["error"] = errorCodeStr(res.error);
            break;
        }
    }

    // 5) summary.
    summaryDoc_["ok"] = counts.ok;
    summaryDoc_["mismatch"] = counts.mismatch;
    summaryDoc_["timeout"] = counts.timeout;
    summaryDoc_["skipped"] = counts.skipped;
    if (!publishJson_(MqttTopics::SuffixReconcile, summaryDoc_)) {
        LOGW("reconcile summary publish failed");
    }

    ++passCount_;
    LOGI("reconcile #%lu: ok=%u mismatch=%u timeout=%u skipped=%u",
         (unsigned long)passCount_, (unsigned)counts.ok, (unsigned)counts.mismatch,
         (unsigned)counts.timeout, (unsigned)counts.skipped);

    if (eventBus) {
        eventBus->post(EventId::ReconcileCompleted, &counts, sizeof(counts));
    }
}

void ThermostatModule::loop()
{
    if (pendingCheck_) {
        pendingCheck_ = false;
        checkAll_();
    }

    bool doApply = false;
    bool doReconcile = false;
    portENTER_CRITICAL(&pendingMux_);
    doApply = pendingApply_;
    doReconcile = pendingReconcile_;
    if (doReconcile) {
        pendingReconcile_ = false;
        reconcileRunning_ = true;
    }
    portEXIT_CRITICAL(&pendingMux_);

    if (doApply) {
        runApply_();
        portENTER_CRITICAL(&pendingMux_);
        pendingApply_ = false;
        portEXIT_CRITICAL(&pendingMux_);
    }
    if (doReconcile) {
        runReconcile_();
        reconcileRunning_ = false;
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Thermostat::LoopDelayMs));
}

void ThermostatModule::onEventStatic(const Event& e, void* user)
{
    static_cast<ThermostatModule*>(user)->onEvent(e);
}

void ThermostatModule::onEvent(const Event& e)
{
    switch (e.id) {
    case EventId::MqttConnected:
        if (cfgData.applyOnConnect && !requestApply_(nullptr)) {
            LOGD("apply already queued");
        }
        break;
    case EventId::InventoryReloaded:
        pendingCheck_ = true;
        break;
    default:
        break;
    }
}

bool ThermostatModule::cmdApply(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ThermostatModule* self = static_cast<ThermostatModule*>(userCtx);
    char name[DEVICE_NAME_MAX];
    ErrorCode err = ErrorCode::Failed;
    if (!parseNameArg_(req.args, name, sizeof(name), err)) {
        writeErrorJson(reply, replyLen, err, "thermostat.apply");
        return false;
    }
    if (!self->invSvc || !self->mqttSvc) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "thermostat.apply");
        return false;
    }
    if (name[0] != '\0') {
        DeviceConfig dev;
        if (!self->invSvc->findDevice(self->invSvc->ctx, name, &dev)) {
            writeErrorJson(reply, replyLen, ErrorCode::UnknownDevice, "thermostat.apply");
            return false;
        }
        if (!dev.valid) {
            writeErrorJson(reply, replyLen, dev.error, "thermostat.apply");
            return false;
        }
    }
    if (!self->mqttSvc->isConnected(self->mqttSvc->ctx)) {
        writeErrorJson(reply, replyLen, ErrorCode::MqttUnavailable, "thermostat.apply");
        return false;
    }
    if (!self->requestApply_(name)) {
        writeErrorJson(reply, replyLen, ErrorCode::Busy, "thermostat.apply");
        return false;
    }

    StaticJsonDocument<JSON_OBJECT_SIZE(2)> doc;
    doc["ok"] = true;
    doc["queued"] = name[0] != '\0' ? (const char*)name : "all";
    if (measureJson(doc) < replyLen) serializeJson(doc, reply, replyLen);
    return true;
}

bool ThermostatModule::cmdSchedule(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ThermostatModule* self = static_cast<ThermostatModule*>(userCtx);
    char name[DEVICE_NAME_MAX];
    ErrorCode err = ErrorCode::Failed;
    if (!parseNameArg_(req.args, name, sizeof(name), err)) {
        writeErrorJson(reply, replyLen, err, "thermostat.schedule");
        return false;
    }
    if (name[0] == '\0') {
        writeErrorJson(reply, replyLen, ErrorCode::MissingValue, "thermostat.schedule");
        return false;
    }
    if (!self->invSvc) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "thermostat.schedule");
        return false;
    }

    static StaticJsonDocument<EXPECTED_PAYLOAD_CAPACITY> expected;
    static StaticJsonDocument<Limits::Thermostat::ReportDoc> doc;
    char topic[Limits::Thermostat::Topic];
    char schedule[SCHEDULE_TEXT_MAX];
    expected.clear();
    doc.clear();

    err = ErrorCode::Failed;
    if (!self->invSvc->buildExpected(self->invSvc->ctx, name, &expected,
                                     topic, sizeof(topic), schedule, sizeof(schedule), &err)) {
        writeErrorJson(reply, replyLen, err, "thermostat.schedule");
        return false;
    }

    doc["ok"] = true;
    doc["name"] = (char*)name;
    doc["topic"] = (char*)topic;
    doc["schedule"] = (char*)schedule;
    doc["payload"] = expected.as<JsonObjectConst>();

    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::BufferTooSmall, "thermostat.schedule");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

bool ThermostatModule::cmdReconcile(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    ThermostatModule* self = static_cast<ThermostatModule*>(userCtx);
    if (!self->mqttSvc || self->replyPrefix_[0] == '\0') {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "thermostat.reconcile");
        return false;
    }
    if (!self->mqttSvc->isConnected(self->mqttSvc->ctx)) {
        writeErrorJson(reply, replyLen, ErrorCode::MqttUnavailable, "thermostat.reconcile");
        return false;
    }
    if (!self->requestReconcile_()) {
        writeErrorJson(reply, replyLen, ErrorCode::Busy, "thermostat.reconcile");
        return false;
    }
    StaticJsonDocument<JSON_OBJECT_SIZE(3)> doc;
    doc["ok"] = true;
    doc["queued"] = true;
    doc["timeout_ms"] = self->cfgData.reconcileTimeoutMs;
    if (measureJson(doc) < replyLen) serializeJson(doc, reply, replyLen);
    return true;
}
