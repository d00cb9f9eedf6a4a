#pragma once
/**
 * @file ITime.h
 * @brief Wall clock service interface.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief Wall clock backed by SNTP. */
struct TimeService {
    bool (*isSynced)(void* ctx);
    /** Epoch seconds, 0 while not synced. */
    uint64_t (*epoch)(void* ctx);
    /** Local ISO-8601 (`%Y-%m-%dT%H:%M:%S`) of an epoch value; false for 0. */
    bool (*formatIso)(void* ctx, uint64_t epoch, char* out, size_t len);
    void* ctx;
};
