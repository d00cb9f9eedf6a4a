/**
 * @file ConfigStoreModule.cpp
 * @brief `config.*` command handlers.
 */
#include "ConfigStoreModule.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

namespace {

bool finish(JsonDocument& doc, char* reply, size_t replyLen, const char* where)
{
    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::ReplyOverflow, where);
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

}  // namespace

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    store_ = &cfg;
    svc_.erase = [](void* ctx) { return static_cast<ConfigStore*>(ctx)->erasePersistent(); };
    svc_.ctx = store_;
    if (!services.add("config", &svc_)) LOGE("config service not registered");

    const CommandService* cmd = services.get<CommandService>("cmd");
    if (!cmd) {
        LOGE("no cmd service, config.* unavailable");
        return;
    }
    cmd->add(cmd->ctx, "config.get", cmdGet, this);
    cmd->add(cmd->ctx, "config.list", cmdList, this);
    cmd->add(cmd->ctx, "config.set", cmdSet, this);
}

// {"ok":true,"module":m,"config":{...}}
bool ConfigStoreModule::cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    const ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    StaticJsonDocument<Limits::JsonCmdArgsBuf> args;
    if (!req.args || deserializeJson(args, req.args) || !args.is<JsonObject>()) {
        writeErrorJson(reply, replyLen, req.args ? ErrorCode::BadCmdJson : ErrorCode::MissingArgs, "config.get");
        return false;
    }
    const char* module = args["module"] | "";
    if (module[0] == '\0') {
        writeErrorJson(reply, replyLen, ErrorCode::MissingValue, "config.get");
        return false;
    }

    // Only used from the command task.
    static char values[Limits::JsonConfigExportBuf];
    bool truncated = false;
    if (!self->store_->toJsonModule(module, values, sizeof(values), &truncated)) {
        writeErrorJson(reply, replyLen, ErrorCode::UnknownModule, "config.get");
        return false;
    }
    if (truncated) {
        writeErrorJson(reply, replyLen, ErrorCode::BufferTooSmall, "config.get");
        return false;
    }

    StaticJsonDocument<JSON_OBJECT_SIZE(3)> doc;
    doc["ok"] = true;
    doc["module"] = module;
    doc["config"] = serialized((const char*)values);
    return finish(doc, reply, replyLen, "config.get");
}

bool ConfigStoreModule::cmdList(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    const ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    const char* names[Limits::MaxConfigModules] = {};
    const uint8_t n = self->store_->listModules(names, Limits::MaxConfigModules);

    StaticJsonDocument<JSON_OBJECT_SIZE(2) + JSON_ARRAY_SIZE(Limits::MaxConfigModules)> doc;
    doc["ok"] = true;
    JsonArray arr = doc.createNestedArray("modules");
    for (uint8_t i = 0; i < n; ++i) arr.add(names[i]);
    return finish(doc, reply, replyLen, "config.list");
}

// args is the patch itself. Wrong-typed values are reported, the rest applied.
bool ConfigStoreModule::cmdSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!req.args) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, "config.set");
        return false;
    }

    ConfigApplyResult res;
    const bool ok = self->store_->applyJson(req.args, &res);
    if (!ok && res.matched == 0) {
        writeErrorJson(reply, replyLen, ErrorCode::BadCfgJson, "config.set");
        return false;
    }
    if (!ok) LOGW("config.set: %u value(s) of the wrong type", (unsigned)res.rejected);

    StaticJsonDocument<JSON_OBJECT_SIZE(4)> doc;
    doc["ok"] = ok;
    doc["matched"] = res.matched;
    doc["changed"] = res.changed;
    doc["rejected"] = res.rejected;
    return finish(doc, reply, replyLen, "config.set") && ok;
}
