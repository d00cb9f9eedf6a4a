/**
 * @file EventBusModule.cpp
 * @brief EventBus delivery task.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"

void EventBusModule::init(ConfigStore&, ServiceRegistry& services)
{
    if (!services.add("eventbus", &svc_)) LOGE("eventbus service not registered");
}

void EventBusModule::loop()
{
    bus_.dispatch(BatchSize, pdMS_TO_TICKS(WaitMs));

    // Posters never block, so losses are only visible here.
    const uint32_t dropped = bus_.dropped();
    if (dropped == droppedSeen_) return;
    LOGW("%lu event(s) lost, queue full", (unsigned long)(dropped - droppedSeen_));
    droppedSeen_ = dropped;
}
