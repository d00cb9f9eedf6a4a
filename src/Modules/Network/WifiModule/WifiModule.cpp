/**
 * @file WifiModule.cpp
 * @brief Station join/retry loop and network readiness events.
 */
#include "WifiModule.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/SystemLimits.h"
#include <string.h>
#define LOG_TAG "WifiModu"
#include "Core/ModuleLog.h"

WifiState WifiModule::svcState(void* ctx)
{
    return static_cast<WifiModule*>(ctx)->state_;
}

bool WifiModule::svcGetIP(void*, char* out, size_t len)
{
    if (!out || len == 0) return false;
    out[0] = '\0';
    if (!WiFi.isConnected()) return false;
    const IPAddress ip = WiFi.localIP();
    snprintf(out, len, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    return true;
}

int8_t WifiModule::svcRssi(void*)
{
    return WiFi.isConnected() ? (int8_t)WiFi.RSSI() : 0;
}

void WifiModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar_);
    cfg.registerVar(ssidVar_);
    cfg.registerVar(passVar_);
    cfg.registerVar(mdnsVar_);

    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    bus_ = ebSvc ? ebSvc->bus : nullptr;
    if (bus_) bus_->subscribe(EventId::ConfigChanged, &WifiModule::onEventStatic, this);

    svc_.state = svcState;
    svc_.getIP = svcGetIP;
    svc_.rssi = svcRssi;
    svc_.ctx = this;
    if (!services.add("wifi", &svc_)) LOGE("wifi service not registered");

    // Credentials live in the config store only.
    WiFi.persistent(false);
}

void WifiModule::enter_(WifiState s)
{
    if (s == state_) return;
    state_ = s;
    sinceMs_ = millis();
    if (s == WifiState::Connected) return;

    if (mdnsUp_) {
        MDNS.end();
        mdnsUp_ = false;
    }
    if (announced_) {
        announced_ = false;
        if (bus_) bus_->post(EventId::WifiNetLost);
    }
}

void WifiModule::join_()
{
    if (cfg_.ssid[0] == '\0') {
        if (millis() - noSsidLogMs_ >= Limits::Wifi::NoSsidLogMs) {
            noSsidLogMs_ = millis();
            LOGW("wifi.ssid not set");
        }
        return;
    }
    LOGI("joining '%s'", cfg_.ssid);
    WiFi.disconnect(false, false);
    WiFi.mode(WIFI_MODE_STA);
    WiFi.setSleep(false);
    WiFi.begin(cfg_.ssid, cfg_.pass);
    enter_(WifiState::Connecting);
}

bool WifiModule::announce_()
{
    const IPAddress ip = WiFi.localIP();
    if ((uint32_t)ip == 0) return false;

    WifiNetReadyPayload p{};
    const IPAddress gw = WiFi.gatewayIP();
    const IPAddress mask = WiFi.subnetMask();
    for (uint8_t i = 0; i < 4; ++i) {
        p.ip[i] = ip[i];
        p.gw[i] = gw[i];
        p.mask[i] = mask[i];
    }
    // Retried on the next pass when the queue is full.
    if (bus_ && !bus_->post(EventId::WifiNetReady, &p, sizeof(p))) return false;
    LOGI("address %u.%u.%u.%u, rssi %d", ip[0], ip[1], ip[2], ip[3], (int)WiFi.RSSI());
    return true;
}

void WifiModule::startMdns_()
{
    if (cfg_.mdns[0] == '\0') return;
    if (!MDNS.begin(cfg_.mdns)) {
        LOGW("mDNS name '%s' refused", cfg_.mdns);
        return;
    }
    mdnsUp_ = true;
    LOGI("advertised as %s.local", cfg_.mdns);
}

void WifiModule::loop()
{
    if (rejoin_) {
        rejoin_ = false;
        WiFi.disconnect(false, false);
        enter_(WifiState::Idle);
    }
    if (!cfg_.enabled) {
        if (state_ != WifiState::Disabled) {
            WiFi.disconnect(false, false);
            enter_(WifiState::Disabled);
        }
        vTaskDelay(pdMS_TO_TICKS(Limits::Wifi::RetryDelayMs));
        return;
    }

    switch (state_) {
    case WifiState::Disabled:
    case WifiState::Idle:
        join_();
        break;
    case WifiState::Connecting:
        if (WiFi.isConnected()) {
            enter_(WifiState::Connected);
        } else if (millis() - sinceMs_ > Limits::Wifi::ConnectTimeoutMs) {
            LOGW("'%s' did not answer", cfg_.ssid);
            WiFi.disconnect(false, false);
            enter_(WifiState::ErrorWait);
        }
        break;
    case WifiState::Connected:
        if (!WiFi.isConnected()) {
            LOGW("link lost");
            enter_(WifiState::ErrorWait);
            break;
        }
        if (!announced_ && announce_()) {
            announced_ = true;
            startMdns_();
        }
        break;
    case WifiState::ErrorWait:
        if (millis() - sinceMs_ > Limits::Wifi::RetryDelayMs) enter_(WifiState::Idle);
        break;
    }
    vTaskDelay(pdMS_TO_TICKS(Limits::Wifi::LoopDelayMs));
}

void WifiModule::onEventStatic(const Event& e, void* user)
{
    WifiModule* self = static_cast<WifiModule*>(user);
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (e.id != EventId::ConfigChanged || !p) return;
    if (strcmp(p->nvsKey, NvsKeys::Wifi::Ssid) == 0 || strcmp(p->nvsKey, NvsKeys::Wifi::Pass) == 0 ||
        strcmp(p->nvsKey, NvsKeys::Wifi::Mdns) == 0) {
        LOGI("%s changed, rejoining", p->nvsKey);
        self->rejoin_ = true;
    }
}
