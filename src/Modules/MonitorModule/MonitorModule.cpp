/**
 * @file MonitorModule.cpp
 * @brief Device state recording, query replies and staleness reports.
 */
#include "MonitorModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/MqttTopics.h"
#include "Core/EventBus/EventBus.h"
#include <Arduino.h>
#include <ctype.h>
#include <string.h>
#define LOG_TAG "MonModul"
#include "Core/ModuleLog.h"

static bool isGetRequest_(const char* payload, size_t len)
{
    if (!payload) return false;
    size_t b = 0;
    size_t e = len;
    while (b < e && isspace((unsigned char)payload[b])) ++b;
    while (e > b && isspace((unsigned char)payload[e - 1])) --e;

    const size_t n = strlen(MqttTopics::MonitorQueryGet);
    if (e - b != n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (tolower((unsigned char)payload[b + i]) != MqttTopics::MonitorQueryGet[i]) return false;
    }
    return true;
}

void MonitorModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    strncpy(cfgData.reportSuffix, ThermoDefaults::StaleReportSuffix, sizeof(cfgData.reportSuffix) - 1);

    cfg.registerVar(staleThresholdVar);
    cfg.registerVar(reportPeriodVar);
    cfg.registerVar(reportSuffixVar);

    mqttSvc = services.get<MqttService>("mqtt");
    timeSvc = services.get<TimeService>("time");
    invSvc = services.get<InventoryService>("inventory");

    if (!tracker_.begin()) LOGE("liveness tracker unavailable");

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc) {
        cmdSvc->add(cmdSvc->ctx, "monitor.status", cmdStatus, this);
        cmdSvc->add(cmdSvc->ctx, "monitor.stale", cmdStale, this);
    }

    auto* ebSvc = services.get<EventBusService>("eventbus");
    if (ebSvc && ebSvc->bus) {
        ebSvc->bus->subscribe(EventId::InventoryReloaded, &MonitorModule::onEventStatic, this);
    }
}

void MonitorModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (!invSvc || !mqttSvc) {
        LOGE("inventory or mqtt service missing, monitor idle");
        return;
    }

    inventoryGen_ = invSvc->generation(invSvc->ctx);
    if (!invSvc->monitorTopic(invSvc->ctx, queryTopic_, sizeof(queryTopic_))) {
        LOGE("monitor topic not configured");
    } else if (!mqttSvc->subscribe(mqttSvc->ctx, queryTopic_, 1, onQueryMsg, this)) {
        LOGE("subscribe failed for query topic %s", queryTopic_);
    }

    // Invalid devices are monitored as well.
    const uint8_t n = invSvc->deviceCount(invSvc->ctx);
    DeviceConfig dev;
    for (uint8_t i = 0; i < n; ++i) {
        if (!invSvc->deviceAt(invSvc->ctx, i, &dev)) continue;
        if (routeCount_ >= Limits::Monitor::MaxDeviceRoutes) {
            LOGE("route table full, '%s' not monitored", dev.name);
            continue;
        }
        DeviceRoute& r = routes_[routeCount_];
        if (!invSvc->stateTopic(invSvc->ctx, dev.name, r.topic, sizeof(r.topic))) {
            LOGE("state topic too long for '%s'", dev.name);
            continue;
        }
        if (!tracker_.addDevice(dev.name)) {
            LOGE("liveness table rejected '%s'", dev.name);
            continue;
        }
        strncpy(r.name, dev.name, sizeof(r.name) - 1);
        r.name[sizeof(r.name) - 1] = '\0';
        ++routeCount_;

        if (!mqttSvc->subscribe(mqttSvc->ctx, r.topic, 0, onStateMsg, this)) {
            LOGE("subscribe failed for %s", r.topic);
        }
    }
    LOGI("monitoring %u device(s), query topic %s", (unsigned)routeCount_, queryTopic_);
}

uint32_t MonitorModule::now_() const
{
    if (!timeSvc || !timeSvc->epoch) return 0;
    return (uint32_t)timeSvc->epoch(timeSvc->ctx);
}

bool MonitorModule::formatIso_(uint32_t epoch, char* out, size_t len) const
{
    if (!timeSvc || !timeSvc->formatIso || epoch == 0) return false;
    return timeSvc->formatIso(timeSvc->ctx, epoch, out, len);
}

const char* MonitorModule::nameForTopic_(const char* topic) const
{
    for (uint8_t i = 0; i < routeCount_; ++i) {
        if (strcmp(routes_[i].topic, topic) == 0) return routes_[i].name;
    }
    return nullptr;
}

void MonitorModule::onStateMsg(void* ctx, const char* topic, const char* payload, size_t len, uint32_t receivedAt)
{
    MonitorModule* self = static_cast<MonitorModule*>(ctx);
    const char* name = self->nameForTopic_(topic);
    if (!name) return;

    const uint32_t ts = receivedAt ? receivedAt : self->now_();
    if (!self->tracker_.record(name, ts, payload, len)) {
        LOGW("state of '%s' not recorded", name);
    }
}

void MonitorModule::onQueryMsg(void* ctx, const char*, const char* payload, size_t len, uint32_t)
{
    // Our own list reply arrives on the same topic and is ignored here.
    if (!isGetRequest_(payload, len)) return;
    static_cast<MonitorModule*>(ctx)->pendingQuery_ = true;
}

const char* MonitorModule::lastSeenIso_(const DeviceStateView& v, char* buf, size_t len) const
{
    return (v.seen && formatIso_(v.lastSeen, buf, len)) ? buf : nullptr;
}

bool MonitorModule::buildStaleReport_(JsonDocument& doc, StaleEntry* buf, uint8_t& count)
{
    const uint32_t now = now_();
    if (!tracker_.stalenessReport(now, cfgData.staleThresholdS, buf, LIVENESS_MAX_DEVICES, count)) {
        return false;
    }

    char iso[32];
    if (formatIso_(now, iso, sizeof(iso))) doc["timestamp"] = iso;
    else doc["timestamp"] = nullptr;

    JsonArray unseen = doc.createNestedArray("unseen");
    for (uint8_t i = 0; i < count; ++i) {
        JsonObject o = unseen.createNestedObject();
        o["name"] = (char*)buf[i].name;
        if (buf[i].seen && formatIso_(buf[i].lastSeen, iso, sizeof(iso))) o["last_seen"] = iso;
        else o["last_seen"] = nullptr;
    }
    return true;
}

void MonitorModule::answerQuery_()
{
    if (!mqttSvc || queryTopic_[0] == '\0') return;
    ++queryCount_;

    static StaticJsonDocument<Limits::Monitor::ListDoc> listDoc;
    static StaticJsonDocument<Limits::Monitor::ReplyDoc> replyDoc;

    const uint8_t n = tracker_.count();

    char iso[32];

    // 1) whole list on the query topic.
    for (uint8_t pass = 0; pass < 2; ++pass) {
        const StateForm form = (pass == 0) ? StateForm::ListItem : StateForm::Omitted;
        listDoc.clear();
        JsonArray arr = listDoc.to<JsonArray>();
        for (uint8_t i = 0; i < n; ++i) {
            if (!tracker_.snapshotAt(i, view_)) continue;
            JsonObject item = arr.createNestedObject();
            item["name"] = (char*)view_.name;
            putDeviceValue(item.createNestedObject("value"), view_, lastSeenIso_(view_, iso, sizeof(iso)), form);
        }
        const size_t need = measureJson(listDoc);
        if (!listDoc.overflowed() && need < sizeof(listBuf_)) break;
        if (pass == 0) LOGW("query list too large (%u bytes), states omitted", (unsigned)need);
    }
    serializeJson(listDoc, listBuf_, sizeof(listBuf_));
    if (!mqttSvc->publish(mqttSvc->ctx, queryTopic_, listBuf_, 1, false)) {
        LOGW("query list publish failed");
    }

    // 2) one reply per device on {query}/{name}, each small enough for one reply-table entry.
    const size_t replyMax = (sizeof(publishBuf_) < LIVENESS_PAYLOAD_MAX) ? sizeof(publishBuf_) : LIVENESS_PAYLOAD_MAX;
    for (uint8_t i = 0; i < n; ++i) {
        if (!tracker_.snapshotAt(i, view_)) continue;
        if (!writeDeviceReply(view_, lastSeenIso_(view_, iso, sizeof(iso)), replyDoc, publishBuf_, replyMax)) {
            LOGW("reply for '%s' does not fit", view_.name);
            continue;
        }

        const int wrote = snprintf(topicBuf_, sizeof(topicBuf_), "%s/%s", queryTopic_, view_.name);
        if (wrote <= 0 || (size_t)wrote >= sizeof(topicBuf_)) {
            LOGW("reply topic too long for '%s'", view_.name);
            continue;
        }
        if (!mqttSvc->publish(mqttSvc->ctx, topicBuf_, publishBuf_, 1, false)) {
            LOGW("reply publish failed for '%s'", view_.name);
        }
    }
    LOGD("query answered (%u device(s))", (unsigned)n);
}

void MonitorModule::publishStaleReport_()
{
    if (!mqttSvc || !mqttSvc->isConnected(mqttSvc->ctx)) return;
    if (now_() == 0) {
        LOGD("time not synced, staleness report skipped");
        return;
    }

    static StaticJsonDocument<Limits::Monitor::PublishBuf> doc;
    doc.clear();
    uint8_t n = 0;
    if (!buildStaleReport_(doc, stale_, n)) {
        LOGW("liveness table unavailable, staleness report skipped");
        return;
    }
    if (n == 0) return;

    if (doc.overflowed() || measureJson(doc) >= sizeof(publishBuf_)) {
        LOGW("staleness report too large");
        return;
    }
    serializeJson(doc, publishBuf_, sizeof(publishBuf_));

    mqttSvc->formatTopic(mqttSvc->ctx, cfgData.reportSuffix, topicBuf_, sizeof(topicBuf_));
    if (mqttSvc->publish(mqttSvc->ctx, topicBuf_, publishBuf_, 1, false)) {
        ++reportCount_;
        LOGI("%u device(s) stale", (unsigned)n);
    } else {
        LOGW("staleness report publish failed");
    }
}

void MonitorModule::loop()
{
    if (pendingQuery_) {
        pendingQuery_ = false;
        answerQuery_();
    }

    const uint32_t nowMs = millis();
    const uint32_t periodMs = cfgData.reportPeriodS * 1000UL;
    if (periodMs > 0 && (nowMs - lastReportMs_) >= periodMs) {
        lastReportMs_ = nowMs;
        publishStaleReport_();
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Monitor::LoopDelayMs));
}

void MonitorModule::onEventStatic(const Event& e, void* user)
{
    static_cast<MonitorModule*>(user)->onEvent(e);
}

void MonitorModule::onEvent(const Event& e)
{
    if (e.id != EventId::InventoryReloaded || !invSvc) return;
    const uint32_t gen = invSvc->generation(invSvc->ctx);
    if (gen == inventoryGen_) return;
    inventoryGen_ = gen;
    LOGW("inventory reloaded: monitored device list applies after reboot");
}

bool MonitorModule::cmdStatus(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    MonitorModule* self = static_cast<MonitorModule*>(userCtx);
    static StaticJsonDocument<Limits::Monitor::PublishBuf> doc;
    doc.clear();

    const uint32_t now = self->now_();
    doc["ok"] = true;
    doc["synced"] = (now != 0);
    doc["devices"] = self->tracker_.count();
    doc["seen"] = self->tracker_.seenCount();
    doc["queries"] = self->queryCount_;
    doc["reports"] = self->reportCount_;

    JsonArray arr = doc.createNestedArray("entries");
    char iso[32];
    for (uint8_t i = 0; i < self->tracker_.count(); ++i) {
        const DeviceStateView& v = self->cmdView_;
        if (!self->tracker_.snapshotAt(i, self->cmdView_)) continue;
        JsonObject o = arr.createNestedObject();
        o["name"] = (char*)v.name;
        if (v.seen && self->formatIso_(v.lastSeen, iso, sizeof(iso))) o["last_seen"] = iso;
        else o["last_seen"] = nullptr;
        if (v.seen && now != 0 && now >= v.lastSeen) o["age_s"] = now - v.lastSeen;
        else o["age_s"] = nullptr;
        o["structured"] = v.structured;
    }

    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::BufferTooSmall, "monitor.status");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

bool MonitorModule::cmdStale(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    MonitorModule* self = static_cast<MonitorModule*>(userCtx);
    static StaticJsonDocument<Limits::Monitor::PublishBuf> doc;
    doc.clear();
    doc["ok"] = true;
    uint8_t n = 0;
    if (!self->buildStaleReport_(doc, self->cmdStale_, n)) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "monitor.stale");
        return false;
    }

    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::BufferTooSmall, "monitor.stale");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}
