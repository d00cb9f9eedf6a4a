#pragma once
/**
 * @file CommandRegistry.h
 * @brief Table of command handlers keyed by name.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/Services/ICommand.h"

class CommandRegistry {
public:
    static constexpr uint8_t MAX_COMMANDS = 24;

    /** @brief Add @p fn under @p cmd. Names must be unique and outlive the registry. */
    bool add(const char* cmd, CommandHandler fn, void* userCtx);

    /**
     * @brief Run @p cmd with @p args.
     *
     * On return @p reply is empty or holds a JSON object. Unknown commands and
     * handlers leaving anything else behind get an error object.
     */
    bool run(const char* cmd, const char* args, char* reply, size_t replyLen) const;

    uint8_t count() const { return count_; }
    const char* name(uint8_t idx) const { return idx < count_ ? entries_[idx].cmd : nullptr; }

private:
    struct Entry {
        const char* cmd;
        CommandHandler fn;
        void* userCtx;
    };

    const Entry* find_(const char* cmd) const;

    Entry entries_[MAX_COMMANDS]{};
    uint8_t count_ = 0;
};
