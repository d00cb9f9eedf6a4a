/**
 * @file CommandRegistry.cpp
 * @brief Command lookup and reply checks.
 */
#include "CommandRegistry.h"
#include "Core/ErrorCodes.h"
#define LOG_TAG "CmdRegst"
#include "Core/ModuleLog.h"
#include <string.h>

namespace {

// Empty, or a JSON object once leading whitespace is skipped.
bool replyUsable(const char* s, size_t len)
{
    if (len == 0 || s[0] == '\0') return true;
    for (size_t i = 0; i < len && s[i] != '\0'; ++i) {
        if (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n') continue;
        return s[i] == '{';
    }
    return false;
}

void fail(char* reply, size_t len, ErrorCode code, const char* where)
{
    if (!reply || len == 0) return;
    if (!writeErrorJson(reply, len, code, where)) reply[0] = '\0';
}

}  // namespace

const CommandRegistry::Entry* CommandRegistry::find_(const char* cmd) const
{
    if (!cmd) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].cmd, cmd) == 0) return &entries_[i];
    }
    return nullptr;
}

bool CommandRegistry::add(const char* cmd, CommandHandler fn, void* userCtx)
{
    if (!cmd || cmd[0] == '\0' || !fn) return false;
    if (find_(cmd)) {
        LOGE("%s registered twice", cmd);
        return false;
    }
    if (count_ >= MAX_COMMANDS) {
        LOGE("no slot for %s", cmd);
        return false;
    }
    entries_[count_++] = Entry{cmd, fn, userCtx};
    return true;
}

bool CommandRegistry::run(const char* cmd, const char* args, char* reply, size_t replyLen) const
{
    if (reply && replyLen) reply[0] = '\0';
    const Entry* e = find_(cmd);
    if (!e) {
        fail(reply, replyLen, ErrorCode::UnknownCmd, "command");
        return false;
    }

    const bool ok = e->fn(e->userCtx, CommandRequest{e->cmd, args}, reply, replyLen);
    if (reply && replyLen && !replyUsable(reply, replyLen)) {
        LOGW("%s left a reply that is not an object", e->cmd);
        fail(reply, replyLen, ErrorCode::CmdHandlerFailed, e->cmd);
        return false;
    }
    return ok;
}
