/**
 * @file ModuleManager.cpp
 * @brief Depth-first dependency ordering and module bring-up.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include "Core/Services/IEventBus.h"
#include <Arduino.h>
#include <string.h>

static constexpr const char* kTag = "ModManag";

bool ModuleManager::add(Module* m)
{
    if (!m) return false;
    if (count_ >= MAX_MODULES) {
        Serial.printf("[%s] no slot for module %s\n", kTag, m->moduleId());
        return false;
    }
    modules_[count_++] = m;
    return true;
}

int ModuleManager::indexOf_(const char* id) const
{
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(modules_[i]->moduleId(), id) == 0) return i;
    }
    return -1;
}

// Places every dependency of modules_[idx] before the module itself.
// Runs before the log hub exists, so failures go straight to Serial.
bool ModuleManager::place_(uint8_t idx)
{
    if (marks_[idx] == Mark::Placed) return true;
    Module* m = modules_[idx];
    if (marks_[idx] == Mark::Visiting) {
        Serial.printf("[%s] dependency cycle through %s\n", kTag, m->moduleId());
        return false;
    }

    marks_[idx] = Mark::Visiting;
    for (uint8_t d = 0; d < m->dependencyCount(); ++d) {
        const char* depId = m->dependency(d);
        if (!depId) continue;
        const int dep = indexOf_(depId);
        if (dep < 0) {
            Serial.printf("[%s] %s needs %s, which is not registered\n", kTag, m->moduleId(), depId);
            return false;
        }
        if (!place_((uint8_t)dep)) return false;
    }
    marks_[idx] = Mark::Placed;
    order_[placed_++] = m;
    return true;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services)
{
    placed_ = 0;
    for (uint8_t i = 0; i < count_; ++i) marks_[i] = Mark::None;
    for (uint8_t i = 0; i < count_; ++i) {
        if (!place_(i)) return false;
    }

    for (uint8_t i = 0; i < placed_; ++i) order_[i]->init(cfg, services);

    // Every variable is registered now.
    cfg.loadPersistent();
    for (uint8_t i = 0; i < placed_; ++i) order_[i]->onConfigLoaded(cfg, services);

    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    if (ebSvc && ebSvc->bus) cfg.setEventBus(ebSvc->bus);
    else Log::warn(kTag, "no event bus, config changes are not announced");

    bool started = true;
    for (uint8_t i = 0; i < placed_; ++i) {
        if (order_[i]->start()) continue;
        Log::error(kTag, "task of %s not created", order_[i]->moduleId());
        started = false;
    }
    Log::info(kTag, "%u module(s) up", (unsigned)placed_);
    return started;
}
