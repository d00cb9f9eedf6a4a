/**
 * @file TimeModule.cpp
 * @brief SNTP sync loop and clock service.
 */
#include "TimeModule.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include <Arduino.h>
#include <time.h>
#include <string.h>
#define LOG_TAG "TimeModu"
#include "Core/ModuleLog.h"

bool TimeModule::svcIsSynced(void* ctx)
{
    return static_cast<TimeModule*>(ctx)->synced_;
}

uint64_t TimeModule::svcEpoch(void* ctx)
{
    if (!svcIsSynced(ctx)) return 0;
    const time_t now = time(nullptr);
    return ((uint64_t)now < Limits::Time::MinValidEpoch) ? 0 : (uint64_t)now;
}

bool TimeModule::svcFormatIso(void*, uint64_t epoch, char* out, size_t len)
{
    if (!out || len == 0 || epoch == 0) return false;
    const time_t ts = (time_t)epoch;
    struct tm local;
    if (!localtime_r(&ts, &local)) return false;
    return strftime(out, len, "%Y-%m-%dT%H:%M:%S", &local) > 0;
}

void TimeModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(server1Var_);
    cfg.registerVar(server2Var_);
    cfg.registerVar(tzVar_);
    cfg.registerVar(enabledVar_);

    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    if (ebSvc && ebSvc->bus) {
        ebSvc->bus->subscribe(EventId::WifiNetReady, &TimeModule::onEventStatic, this);
        ebSvc->bus->subscribe(EventId::WifiNetLost, &TimeModule::onEventStatic, this);
        ebSvc->bus->subscribe(EventId::ConfigChanged, &TimeModule::onEventStatic, this);
    }

    svc_.isSynced = svcIsSynced;
    svc_.epoch = svcEpoch;
    svc_.formatIso = svcFormatIso;
    svc_.ctx = this;
    if (!services.add("time", &svc_)) LOGE("time service not registered");
}

void TimeModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    setenv("TZ", cfg_.tz, 1);
    tzset();
}

bool TimeModule::syncOnce_()
{
    configTzTime(cfg_.tz, cfg_.server1, cfg_.server2);
    struct tm local;
    if (!getLocalTime(&local, Limits::Time::SyncWaitMs)) return false;
    if ((uint64_t)time(nullptr) < Limits::Time::MinValidEpoch) return false;

    char iso[24];
    if (svcFormatIso(this, (uint64_t)time(nullptr), iso, sizeof(iso))) LOGI("clock set to %s", iso);
    return true;
}

void TimeModule::loop()
{
    const uint32_t now = millis();
    if (resync_) {
        resync_ = false;
        nextTryMs_ = now;
        retryMs_ = Limits::Time::RetryMinMs;
    }

    const bool due = cfg_.enabled && netUp_ &&
                     now - netUpSinceMs_ >= Limits::Time::NetWarmupMs &&
                     (int32_t)(now - nextTryMs_) >= 0;
    if (due) {
        if (syncOnce_()) {
            synced_ = true;
            retryMs_ = Limits::Time::RetryMinMs;
            nextTryMs_ = now + Limits::Time::ResyncPeriodMs;
        } else {
            // A clock set earlier stays valid; only the next attempt moves.
            LOGW("no answer from %s / %s, retry in %lu ms",
                 cfg_.server1, cfg_.server2, (unsigned long)retryMs_);
            nextTryMs_ = now + retryMs_;
            retryMs_ = (retryMs_ >= Limits::Time::RetryMaxMs / 2U) ? Limits::Time::RetryMaxMs : retryMs_ * 2U;
        }
    }
    vTaskDelay(pdMS_TO_TICKS(Limits::Time::LoopDelayMs));
}

void TimeModule::onEventStatic(const Event& e, void* user)
{
    TimeModule* self = static_cast<TimeModule*>(user);
    switch (e.id) {
    case EventId::WifiNetReady:
        if (!self->netUp_) self->netUpSinceMs_ = millis();
        self->netUp_ = true;
        break;
    case EventId::WifiNetLost:
        self->netUp_ = false;
        break;
    case EventId::ConfigChanged: {
        const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
        if (!p) break;
        if (strcmp(p->nvsKey, NvsKeys::Time::Server1) != 0 && strcmp(p->nvsKey, NvsKeys::Time::Server2) != 0 &&
            strcmp(p->nvsKey, NvsKeys::Time::Tz) != 0) break;
        LOGI("%s changed, syncing again", p->nvsKey);
        self->resync_ = true;
        break;
    }
    default:
        break;
    }
}
