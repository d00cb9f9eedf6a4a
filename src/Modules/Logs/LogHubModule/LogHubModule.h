#pragma once
/**
 * @file LogHubModule.h
 * @brief Owner of the LogHub (`loghub` service) and of `log.min_level`.
 */
#include "Core/Module.h"
#include "Core/LogHub.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"

/**
 * @brief First module up: every other module logs through its hub.
 *
 * `log.min_level` (0 debug .. 3 error) is applied at boot and again on each
 * change announced over the event bus.
 */
class LogHubModule : public Module {
public:
    const char* moduleId() const override { return "loghub"; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    LogHub hub_;
    LogHubService svc_{};

    uint8_t minLevel_ = (uint8_t)LogLevel::Debug;
    ConfigVariable<uint8_t> minLevelVar_{
        NVS_KEY(NvsKeys::Log::MinLevel), "min_level", "log", ConfigType::UInt8,
        &minLevel_, ConfigPersistence::Persistent, 0
    };

    void applyMinLevel_();
    static void onEventStatic(const Event& e, void* user);
};
