/**
 * @file CommandModule.cpp
 * @brief `cmd` service wiring.
 */
#include "CommandModule.h"
#include "Core/ErrorCodes.h"
#include <ArduinoJson.h>
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"

void CommandModule::init(ConfigStore&, ServiceRegistry& services)
{
    svc_.add = [](void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
        return static_cast<CommandRegistry*>(ctx)->add(cmd, fn, userCtx);
    };
    svc_.run = [](void* ctx, const char* cmd, const char* args, char* reply, size_t replyLen) {
        return static_cast<const CommandRegistry*>(ctx)->run(cmd, args, reply, replyLen);
    };
    svc_.count = [](void* ctx) { return static_cast<const CommandRegistry*>(ctx)->count(); };
    svc_.ctx = &registry_;
    if (!services.add("cmd", &svc_)) LOGE("cmd service not registered");

    registry_.add("cmd.list", cmdList, this);
}

// {"ok":true,"commands":["cmd.list",...]} in registration order.
bool CommandModule::cmdList(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    const CommandRegistry& reg = static_cast<CommandModule*>(userCtx)->registry_;

    StaticJsonDocument<JSON_OBJECT_SIZE(2) + JSON_ARRAY_SIZE(CommandRegistry::MAX_COMMANDS)> doc;
    doc["ok"] = true;
    JsonArray names = doc.createNestedArray("commands");
    for (uint8_t i = 0; i < reg.count(); ++i) names.add(reg.name(i));

    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::BufferTooSmall, "cmd.list");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}
