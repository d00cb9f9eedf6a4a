/**
 * @file MQTTModule.cpp
 * @brief Broker link, route table and command channel.
 */
#include "MQTTModule.h"
#include "Core/MqttTopics.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include <ArduinoJson.h>
#include <esp_system.h>
#include <string.h>
#define LOG_TAG "MqttModu"
#include "Core/ModuleLog.h"

namespace {

constexpr char kOffline[] = "{\"online\":false}";
constexpr char kOnline[] = "{\"online\":true}";

// Keys whose change requires a new session. The base topic is fixed at boot.
bool isLinkKey(const char* key)
{
    static const char* const kKeys[] = {
        NvsKeys::Mqtt::Host, NvsKeys::Mqtt::Port, NvsKeys::Mqtt::User, NvsKeys::Mqtt::Pass
    };
    for (const char* k : kKeys) {
        if (strcmp(key, k) == 0) return true;
    }
    return false;
}

size_t levelLen(const char* s, const char** next)
{
    const char* slash = strchr(s, '/');
    *next = slash ? slash + 1 : nullptr;
    return slash ? (size_t)(slash - s) : strlen(s);
}

const char* linkStateStr(LinkState s)
{
    switch (s) {
    case LinkState::Off: return "off";
    case LinkState::AwaitNetwork: return "await-network";
    case LinkState::Connecting: return "connecting";
    case LinkState::Online: return "online";
    case LinkState::Backoff: return "backoff";
    }
    return "?";
}

}  // namespace

bool MQTTModule::topicMatches(const char* filter, const char* topic)
{
    if (!filter || !topic || filter[0] == '\0') return false;

    for (;;) {
        const char* fNext = nullptr;
        const char* tNext = nullptr;
        const size_t fLen = levelLen(filter, &fNext);
        const size_t tLen = levelLen(topic, &tNext);

        if (fLen == 1 && filter[0] == '#') return fNext == nullptr;
        const bool any = (fLen == 1 && filter[0] == '+');
        if (!any && (fLen != tLen || strncmp(filter, topic, fLen) != 0)) return false;

        if (!fNext) return tNext == nullptr;
        if (!tNext) return strcmp(fNext, "#") == 0;   // "a/#" also matches "a"
        filter = fNext;
        topic = tNext;
    }
}

// ---- services --------------------------------------------------------------

bool MQTTModule::svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    return static_cast<MQTTModule*>(ctx)->publish_(topic, payload, qos, retain);
}

void MQTTModule::svcFormatTopic(void* ctx, const char* suffix, char* out, size_t outLen)
{
    static_cast<MQTTModule*>(ctx)->topicFor_(suffix, out, outLen);
}

bool MQTTModule::svcIsConnected(void* ctx)
{
    return static_cast<MQTTModule*>(ctx)->link_ == LinkState::Online;
}

bool MQTTModule::svcSubscribe(void* ctx, const char* filter, uint8_t qos, MqttMessageHandler fn, void* fnCtx)
{
    return static_cast<MQTTModule*>(ctx)->addRoute_(filter, qos, fn, fnCtx);
}

// ---- setup -----------------------------------------------------------------

void MQTTModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    snprintf(cfg_.host, sizeof(cfg_.host), "%s", Limits::Mqtt::Defaults::Host);
    snprintf(cfg_.baseTopic, sizeof(cfg_.baseTopic), "%s", Limits::Mqtt::Defaults::BaseTopic);
    cfg.registerVar(enabledVar_);
    cfg.registerVar(hostVar_);
    cfg.registerVar(portVar_);
    cfg.registerVar(userVar_);
    cfg.registerVar(passVar_);
    cfg.registerVar(baseTopicVar_);

    cmdSvc_ = services.get<CommandService>("cmd");
    timeSvc_ = services.get<TimeService>("time");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    bus_ = ebSvc ? ebSvc->bus : nullptr;
    if (bus_) {
        bus_->subscribe(EventId::WifiNetReady, &MQTTModule::onEventStatic, this);
        bus_->subscribe(EventId::WifiNetLost, &MQTTModule::onEventStatic, this);
        bus_->subscribe(EventId::ConfigChanged, &MQTTModule::onEventStatic, this);
    }

    txLock_ = xSemaphoreCreateMutex();
    inbox_ = xQueueCreate(Limits::Mqtt::Capacity::RxQueueLen, sizeof(Inbound));
    if (!txLock_ || !inbox_) {
        LOGE("link resources missing (lock=%d inbox=%d)", txLock_ ? 1 : 0, inbox_ ? 1 : 0);
    }

    svc_.publish = svcPublish;
    svc_.formatTopic = svcFormatTopic;
    svc_.isConnected = svcIsConnected;
    svc_.subscribe = svcSubscribe;
    svc_.ctx = this;
    if (!services.add("mqtt", &svc_)) LOGE("mqtt service not registered");

    uint8_t mac[6] = {0};
    esp_read_mac(mac, ESP_MAC_WIFI_STA);
    snprintf(clientId_, sizeof(clientId_), "thermio-%02x%02x%02x", mac[3], mac[4], mac[5]);

    client_.onConnect([this](bool sp) { onLinkUp_(sp); });
    client_.onDisconnect([this](AsyncMqttClientDisconnectReason r) { onLinkDown_(r); });
    client_.onMessage([this](char* t, char* p, AsyncMqttClientMessageProperties, size_t l, size_t i, size_t tot) {
        onInbound_(t, p, l, i, tot);
    });
}

void MQTTModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    topicFor_(MqttTopics::SuffixStatus, statusTopic_, sizeof(statusTopic_));
    topicFor_(MqttTopics::SuffixCmd, cmdTopic_, sizeof(cmdTopic_));
    topicFor_(MqttTopics::SuffixAck, ackTopic_, sizeof(ackTopic_));
    if (!addRoute_(cmdTopic_, 0, onCmdMsg, this)) LOGE("command route not registered");
    LOGI("client %s, commands on %s", clientId_, cmdTopic_);
}

void MQTTModule::topicFor_(const char* suffix, char* out, size_t outLen) const
{
    if (!out || outLen == 0) return;
    snprintf(out, outLen, "%s/%s/%s", cfg_.baseTopic, clientId_, suffix ? suffix : "");
}

bool MQTTModule::addRoute_(const char* filter, uint8_t qos, MqttMessageHandler fn, void* ctx)
{
    if (!filter || !fn || filter[0] == '\0') return false;
    if (routeCount_ >= Limits::Mqtt::Capacity::MaxRoutes) {
        LOGE("no route slot left for %s", filter);
        return false;
    }
    Route& r = routes_[routeCount_];
    if (snprintf(r.filter, sizeof(r.filter), "%s", filter) >= (int)sizeof(r.filter)) {
        LOGE("route filter too long: %s", filter);
        return false;
    }
    r.qos = qos > 2 ? 2 : qos;
    r.fn = fn;
    r.ctx = ctx;
    ++routeCount_;

    if (link_ == LinkState::Online && client_.subscribe(r.filter, r.qos) == 0) {
        LOGW("subscribe %s refused", r.filter);
    }
    return true;
}

// ---- link state ------------------------------------------------------------

void MQTTModule::enter_(LinkState s)
{
    if (s == link_) return;
    const LinkState was = link_;
    link_ = s;
    linkSinceMs_ = millis();
    LOGD("link %s -> %s", linkStateStr(was), linkStateStr(s));

    if (!bus_) return;
    if (s == LinkState::Online) bus_->post(EventId::MqttConnected);
    else if (was == LinkState::Online) bus_->post(EventId::MqttDisconnected);
}

void MQTTModule::connect_()
{
    client_.setClientId(clientId_);
    client_.setServer(cfg_.host, (uint16_t)cfg_.port);
    if (cfg_.user[0] != '\0') client_.setCredentials(cfg_.user, cfg_.pass);
    client_.setWill(statusTopic_, 1, true, kOffline);
    upPending_ = false;
    downPending_ = false;
    enter_(LinkState::Connecting);
    LOGI("connecting to %s:%ld", cfg_.host, (long)cfg_.port);
    client_.connect();
}

void MQTTModule::goOnline_()
{
    uint8_t refused = 0;
    for (uint8_t i = 0; i < routeCount_; ++i) {
        if (client_.subscribe(routes_[i].filter, routes_[i].qos) == 0) ++refused;
    }
    backoffMs_ = Limits::Mqtt::Backoff::MinMs;
    enter_(LinkState::Online);
    if (refused) LOGW("%u of %u subscription(s) refused", (unsigned)refused, (unsigned)routeCount_);
    LOGI("online, %u route(s)", (unsigned)routeCount_);
    if (!publish_(statusTopic_, kOnline, 1, true)) LOGW("status not published");
}

void MQTTModule::retryLater_()
{
    // +/- JitterPct around the base delay, then double the base for the next failure.
    const uint32_t span = backoffMs_ * Limits::Mqtt::Backoff::JitterPct / 100U;
    waitMs_ = backoffMs_ - span + (span ? esp_random() % (2U * span + 1U) : 0U);
    backoffMs_ = (backoffMs_ >= Limits::Mqtt::Backoff::MaxMs / 2U) ? Limits::Mqtt::Backoff::MaxMs
                                                                 : backoffMs_ * 2U;
    enter_(LinkState::Backoff);
    LOGI("next attempt in %lu ms", (unsigned long)waitMs_);
}

void MQTTModule::loop()
{
    if (!cfg_.enabled) {
        if (link_ != LinkState::Off) {
            client_.disconnect();
            enter_(LinkState::Off);
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::DisabledDelayMs));
        return;
    }

    if (relink_ || (!netUp_ && (link_ == LinkState::Connecting || link_ == LinkState::Online))) {
        relink_ = false;
        client_.disconnect();
        enter_(LinkState::AwaitNetwork);
    }
    if (downPending_) {
        downPending_ = false;
        if (link_ == LinkState::Connecting || link_ == LinkState::Online) {
            LOGW("link down (reason=%u)", (unsigned)downReason_);
            retryLater_();
        }
    }

    const uint32_t now = millis();
    switch (link_) {
    case LinkState::Off:
        enter_(LinkState::AwaitNetwork);
        break;
    case LinkState::AwaitNetwork:
        if (netUp_ && now - netUpSinceMs_ >= Limits::Mqtt::Timing::NetWarmupMs) connect_();
        break;
    case LinkState::Connecting:
        if (upPending_) {
            upPending_ = false;
            goOnline_();
        } else if (now - linkSinceMs_ > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            LOGW("no CONNACK from %s", cfg_.host);
            client_.disconnect();
            retryLater_();
        }
        break;
    case LinkState::Online:
        drainInbox_();
        break;
    case LinkState::Backoff:
        if (!netUp_ || now - linkSinceMs_ >= waitMs_) enter_(LinkState::AwaitNetwork);
        break;
    }

    const uint32_t dropped = dropped_;
    if (dropped != droppedLogged_) {
        LOGW("%lu inbound message(s) dropped", (unsigned long)(dropped - droppedLogged_));
        droppedLogged_ = dropped;
    }
    vTaskDelay(pdMS_TO_TICKS(Limits::Mqtt::Timing::LoopDelayMs));
}

// ---- network task callbacks -----------------------------------------------

void MQTTModule::onLinkUp_(bool)
{
    upPending_ = true;
}

void MQTTModule::onLinkDown_(AsyncMqttClientDisconnectReason reason)
{
    downReason_ = (uint8_t)reason;
    downPending_ = true;
}

void MQTTModule::onInbound_(char* topic, char* payload, size_t len, size_t index, size_t total)
{
    // Only whole messages that fit an inbox slot are kept.
    if (!inbox_ || !topic || index != 0 || len != total || (len > 0 && !payload)) {
        ++dropped_;
        return;
    }
    const size_t topicLen = strlen(topic);
    if (topicLen >= sizeof(rx_.topic) || len >= sizeof(rx_.payload)) {
        ++dropped_;
        return;
    }

    // Static: the async_tcp stack is small. Only this callback writes it.
    static Inbound in;
    memcpy(in.topic, topic, topicLen + 1);
    if (len) memcpy(in.payload, payload, len);
    in.payload[len] = '\0';
    in.len = (uint16_t)len;
    in.at = timeSvc_ ? (uint32_t)timeSvc_->epoch(timeSvc_->ctx) : 0;
    if (xQueueSend(inbox_, &in, 0) != pdTRUE) ++dropped_;
}

// ---- inbound dispatch ------------------------------------------------------

void MQTTModule::drainInbox_()
{
    while (xQueueReceive(inbox_, &rx_, 0) == pdTRUE) {
        if (!deliver_(rx_)) {
            ++unrouted_;
            LOGD("no route for %s (%lu total)", rx_.topic, (unsigned long)unrouted_);
        }
    }
}

bool MQTTModule::deliver_(const Inbound& msg)
{
    bool any = false;
    for (uint8_t i = 0; i < routeCount_; ++i) {
        if (!topicMatches(routes_[i].filter, msg.topic)) continue;
        routes_[i].fn(routes_[i].ctx, msg.topic, msg.payload, msg.len, msg.at);
        any = true;
    }
    return any;
}

bool MQTTModule::publish_(const char* topic, const char* payload, int qos, bool retain)
{
    if (!topic || !payload || link_ != LinkState::Online) return false;
    if (txLock_ && xSemaphoreTake(txLock_, pdMS_TO_TICKS(Limits::Mqtt::Timing::PublishLockMs)) != pdTRUE) {
        LOGW("publish lock busy, %s not sent", topic);
        return false;
    }
    const uint16_t id = client_.publish(topic, qos, retain, payload);
    if (txLock_) xSemaphoreGive(txLock_);
    if (id == 0) {
        LOGW("publish to %s refused", topic);
        return false;
    }
    return true;
}

// ---- command channel -------------------------------------------------------

void MQTTModule::onCmdMsg(void* ctx, const char*, const char* payload, size_t, uint32_t)
{
    static_cast<MQTTModule*>(ctx)->runCommand_(payload);
}

void MQTTModule::ackError_(ErrorCode code)
{
    if (!writeErrorJson(ack_, sizeof(ack_), code, "cmd")) {
        snprintf(ack_, sizeof(ack_), "{\"ok\":false}");
    }
    if (!publish_(ackTopic_, ack_, 0, false)) LOGW("error ack %s not published", errorCodeStr(code));
}

void MQTTModule::runCommand_(const char* payload)
{
    // {"cmd":"name","args":{...}}; args may carry a whole config patch.
    static StaticJsonDocument<Limits::JsonCmdBuf> req;
    req.clear();
    if (deserializeJson(req, payload) != DeserializationError::Ok || !req.is<JsonObject>()) {
        return ackError_(ErrorCode::BadCmdJson);
    }
    const char* cmd = req["cmd"] | "";
    if (cmd[0] == '\0') return ackError_(ErrorCode::MissingCmd);
    if (!cmdSvc_ || !cmdSvc_->run) return ackError_(ErrorCode::CmdServiceUnavailable);

    const char* args = nullptr;
    JsonVariantConst argsVar = req["args"];
    if (!argsVar.isNull()) {
        if (measureJson(argsVar) >= sizeof(args_)) return ackError_(ErrorCode::ArgsTooLarge);
        serializeJson(argsVar, args_, sizeof(args_));
        args = args_;
    }

    reply_[0] = '\0';
    if (!cmdSvc_->run(cmdSvc_->ctx, cmd, args, reply_, sizeof(reply_))) {
        LOGW("%s failed", cmd);
        // Handlers describe their own failure.
        if (reply_[0] != '{') return ackError_(ErrorCode::CmdHandlerFailed);
        if (!publish_(ackTopic_, reply_, 0, false)) LOGW("ack for %s not published", cmd);
        return;
    }

    StaticJsonDocument<128> ack;
    ack["ok"] = true;
    ack["cmd"] = cmd;
    if (reply_[0] != '\0') ack["reply"] = serialized((const char*)reply_);
    else ack["reply"] = nullptr;
    if (measureJson(ack) >= sizeof(ack_)) return ackError_(ErrorCode::ReplyOverflow);
    serializeJson(ack, ack_, sizeof(ack_));
    if (!publish_(ackTopic_, ack_, 0, false)) LOGW("ack for %s not published", cmd);
}

// ---- events ----------------------------------------------------------------

void MQTTModule::onEventStatic(const Event& e, void* user)
{
    static_cast<MQTTModule*>(user)->onEvent(e);
}

void MQTTModule::onEvent(const Event& e)
{
    switch (e.id) {
    case EventId::WifiNetReady:
        if (!netUp_) netUpSinceMs_ = millis();
        netUp_ = true;
        break;
    case EventId::WifiNetLost:
        netUp_ = false;
        break;
    case EventId::ConfigChanged: {
        const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
        if (!p) break;
        if (isLinkKey(p->nvsKey)) {
            LOGI("%s changed, reconnecting", p->nvsKey);
            relink_ = true;
        } else if (strcmp(p->nvsKey, NvsKeys::Mqtt::BaseTopic) == 0) {
            LOGW("base topic change applies after reboot");
        }
        break;
    }
    default:
        break;
    }
}
