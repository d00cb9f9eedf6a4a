#pragma once
/**
 * @file EventBusModule.h
 * @brief Owner of the EventBus and of the task delivering its events.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"

/**
 * @brief Publishes the bus as the `eventbus` service and drains it.
 *
 * Subscribers are called from this task only.
 */
class EventBusModule : public ActiveModule {
public:
    const char* moduleId() const override { return "eventbus"; }
    TaskSpec taskSpec() const override { return TaskSpec{"evbus", 4096, 2, 1, 1}; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return i == 0 ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    static constexpr uint8_t BatchSize = 8;
    static constexpr uint32_t WaitMs = 100;

    EventBus bus_;
    EventBusService svc_{&bus_};
    uint32_t droppedSeen_ = 0;
};
