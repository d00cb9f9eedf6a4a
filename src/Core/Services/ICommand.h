#pragma once
/**
 * @file ICommand.h
 * @brief `cmd` service: named commands with JSON replies.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief What a handler receives. @p args is compact JSON, or nullptr when absent. */
struct CommandRequest {
    const char* cmd;
    const char* args;
};

/**
 * @brief Command handler.
 *
 * Writes a JSON object into @p reply (or leaves it empty) and returns false
 * on failure, usually after writeErrorJson().
 */
using CommandHandler = bool (*)(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

struct CommandService {
    bool (*add)(void* ctx, const char* cmd, CommandHandler fn, void* userCtx);
    bool (*run)(void* ctx, const char* cmd, const char* args, char* reply, size_t replyLen);
    uint8_t (*count)(void* ctx);
    void* ctx;
};
