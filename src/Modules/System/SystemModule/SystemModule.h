#pragma once
/**
 * @file SystemModule.h
 * @brief `system.*` commands: ping, info, reboot and factory reset.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include <freertos/timers.h>

/**
 * @brief Device-level commands.
 *
 * Reboot and factory reset reply first and restart from a one-shot timer
 * Limits::System::RestartDelayMs later, so the ack can still be published.
 */
class SystemModule : public Module {
public:
    const char* moduleId() const override { return "system"; }

    uint8_t dependencyCount() const override { return 6; }
    const char* dependency(uint8_t i) const override {
        static const char* const kDeps[] = {"loghub", "eventbus", "cmd", "config", "wifi", "time"};
        return i < 6 ? kDeps[i] : nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    const CommandService* cmd_ = nullptr;
    const ConfigStoreService* config_ = nullptr;
    const LogHubService* log_ = nullptr;
    const WifiService* wifi_ = nullptr;
    const TimeService* time_ = nullptr;
    EventBus* bus_ = nullptr;
    TimerHandle_t restartTimer_ = nullptr;

    bool scheduleRestart_(const char* why);

    static bool cmdPing(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdInfo(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdReboot(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFactoryReset(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
