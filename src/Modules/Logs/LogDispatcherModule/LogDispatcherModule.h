#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Task moving log entries from the hub to the sinks.
 */
#include "Core/Module.h"
#include "Core/LogHub.h"
#include "Core/Services/Services.h"

/**
 * @brief Drains the `loghub` queue.
 *
 * Entries lost to a full queue are reported to the sinks as one warning
 * the next time the queue is idle.
 */
class LogDispatcherModule : public ActiveModule {
public:
    const char* moduleId() const override { return "log.dispatcher"; }
    TaskSpec taskSpec() const override { return TaskSpec{"logdisp", 4096, 1, 1, 1}; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return i == 0 ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    static constexpr uint32_t IdleWaitMs = 1000;

    LogHub* hub_ = nullptr;
    uint32_t droppedSeen_ = 0;

    void reportDrops_();
};
