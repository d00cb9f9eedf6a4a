/**
 * @file LogDispatcherModule.cpp
 * @brief Log queue consumer.
 */
#include "LogDispatcherModule.h"
#include <stdio.h>

void LogDispatcherModule::init(ConfigStore&, ServiceRegistry& services)
{
    const LogHubService* svc = services.get<LogHubService>("loghub");
    hub_ = svc ? static_cast<LogHub*>(svc->ctx) : nullptr;
    if (!hub_) Serial.println("[logdisp] no log hub, entries stay queued");
}

void LogDispatcherModule::loop()
{
    if (!hub_) {
        vTaskDelay(pdMS_TO_TICKS(IdleWaitMs));
        return;
    }
    if (!hub_->pump(pdMS_TO_TICKS(IdleWaitMs))) reportDrops_();
}

void LogDispatcherModule::reportDrops_()
{
    const uint32_t dropped = hub_->dropped();
    if (dropped == droppedSeen_) return;

    LogEntry e{};
    e.ts_ms = millis();
    e.lvl = LogLevel::Warn;
    snprintf(e.tag, sizeof(e.tag), "LogDisp");
    snprintf(e.msg, sizeof(e.msg), "%lu log line(s) lost, queue full", (unsigned long)(dropped - droppedSeen_));
    droppedSeen_ = dropped;
    hub_->deliver(e);
}
