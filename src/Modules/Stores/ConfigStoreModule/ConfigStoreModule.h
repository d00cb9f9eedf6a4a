#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief `config` service and the `config.*` commands.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"

/**
 * @brief Exposes the ConfigStore over the command channel.
 *
 * - `config.list`: names of the config modules.
 * - `config.get {"module":m}`: current values of one module.
 * - `config.set {"m":{"key":value}}`: patch, persist and announce.
 */
class ConfigStoreModule : public Module {
public:
    const char* moduleId() const override { return "config"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        return i == 0 ? "loghub" : (i == 1 ? "cmd" : nullptr);
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStore* store_ = nullptr;
    ConfigStoreService svc_{};

    static bool cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
