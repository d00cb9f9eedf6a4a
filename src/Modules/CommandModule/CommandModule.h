#pragma once
/**
 * @file CommandModule.h
 * @brief Owner of the command registry (`cmd` service) and of `cmd.list`.
 */
#include "Core/Module.h"
#include "Core/CommandRegistry.h"
#include "Core/Services/Services.h"

class CommandModule : public Module {
public:
    const char* moduleId() const override { return "cmd"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return i == 0 ? "loghub" : nullptr; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    CommandRegistry registry_;
    CommandService svc_{};

    static bool cmdList(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
