/**
 * @file LogHubModule.cpp
 * @brief Log hub bring-up and level filter.
 */
#include "LogHubModule.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/SystemLimits.h"
#include <string.h>
#define LOG_TAG "LogHubMd"
#include "Core/ModuleLog.h"

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    if (!hub_.begin(Limits::LogQueueLen)) {
        Serial.println("[loghub] queue not created, logging off");
        return;
    }
    svc_.enqueue = [](void* ctx, const LogEntry& e) { return static_cast<LogHub*>(ctx)->enqueue(e); };
    svc_.addSink = [](void* ctx, const LogSinkService& s) { return static_cast<LogHub*>(ctx)->addSink(s); };
    svc_.dropped = [](void* ctx) { return static_cast<const LogHub*>(ctx)->dropped(); };
    svc_.ctx = &hub_;
    if (!services.add("loghub", &svc_)) {
        Serial.println("[loghub] service not registered, logging off");
        return;
    }
    Log::setHub(&svc_);
    cfg.registerVar(minLevelVar_);
}

void LogHubModule::onConfigLoaded(ConfigStore&, ServiceRegistry& services)
{
    applyMinLevel_();
    // The bus registers after this module, so changes are followed from here on.
    const EventBusService* eb = services.get<EventBusService>("eventbus");
    if (!eb || !eb->bus || !eb->bus->subscribe(EventId::ConfigChanged, &LogHubModule::onEventStatic, this)) {
        LOGW("log.min_level changes apply after reboot");
    }
}

void LogHubModule::applyMinLevel_()
{
    Log::setMinLevel(logLevelFromIndex(minLevel_));
    LOGI("level %s and above", logLevelStr(Log::minLevel()));
}

void LogHubModule::onEventStatic(const Event& e, void* user)
{
    const ConfigChangedPayload* p = static_cast<const ConfigChangedPayload*>(e.payload);
    if (e.id != EventId::ConfigChanged || !p || strcmp(p->nvsKey, NvsKeys::Log::MinLevel) != 0) return;
    static_cast<LogHubModule*>(user)->applyMinLevel_();
}
