#pragma once
/**
 * @file TimeModule.h
 * @brief SNTP wall clock for device timestamps.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"

/** @brief Clock settings (`time` config module). */
struct ClockConfig {
    char server1[Limits::Time::Server] = "pool.ntp.org";
    char server2[Limits::Time::Server] = "time.nist.gov";
    char tz[Limits::Time::Tz]          = "CET-1CEST,M3.5.0/2,M10.5.0/3";
    bool enabled = true;
};

/**
 * @brief Active module keeping the system clock set over SNTP.
 *
 * `last_seen` stamps and the staleness report read the clock through the
 * `time` service. A failed sync is retried with a doubling delay, a good one
 * is refreshed every `ResyncPeriodMs`.
 */
class TimeModule : public ActiveModule {
public:
    const char* moduleId() const override { return "time"; }
    TaskSpec taskSpec() const override { return TaskSpec{"time", 3072, 1, 0}; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply `time.tz` so formatIso() is local even before the first sync. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    ClockConfig cfg_;
    TimeService svc_{};

    volatile bool synced_ = false;
    volatile bool netUp_ = false;
    volatile uint32_t netUpSinceMs_ = 0;
    volatile bool resync_ = false;
    uint32_t nextTryMs_ = 0;
    uint32_t retryMs_ = Limits::Time::RetryMinMs;

    ConfigVariable<char> server1Var_ {
        NVS_KEY(NvsKeys::Time::Server1),"server1","time",ConfigType::CharArray,
        cfg_.server1,ConfigPersistence::Persistent,sizeof(cfg_.server1)
    };
    ConfigVariable<char> server2Var_ {
        NVS_KEY(NvsKeys::Time::Server2),"server2","time",ConfigType::CharArray,
        cfg_.server2,ConfigPersistence::Persistent,sizeof(cfg_.server2)
    };
    ConfigVariable<char> tzVar_ {
        NVS_KEY(NvsKeys::Time::Tz),"tz","time",ConfigType::CharArray,
        cfg_.tz,ConfigPersistence::Persistent,sizeof(cfg_.tz)
    };
    ConfigVariable<bool> enabledVar_ {
        NVS_KEY(NvsKeys::Time::Enabled),"enabled","time",ConfigType::Bool,
        &cfg_.enabled,ConfigPersistence::Persistent,0
    };

    bool syncOnce_();

    static bool svcIsSynced(void* ctx);
    static uint64_t svcEpoch(void* ctx);
    static bool svcFormatIso(void* ctx, uint64_t epoch, char* out, size_t len);

    static void onEventStatic(const Event& e, void* user);
};
