#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Console output for the log hub.
 */
#include "Core/Module.h"
#include "Core/Services/ILogger.h"
#include "Core/Services/ITime.h"

/**
 * @brief Attaches the `serial` sink.
 *
 * Lines are stamped with local time once the `time` service is synced and
 * with uptime before that.
 */
class LogSerialSinkModule : public Module {
public:
    const char* moduleId() const override { return "log.sink.serial"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return i == 0 ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
};
