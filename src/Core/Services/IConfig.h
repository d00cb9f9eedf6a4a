#pragma once
/**
 * @file IConfig.h
 * @brief `config` service.
 */

struct ConfigStoreService {
    /** Wipe every persisted value. Defaults take over at the next boot. */
    bool (*erase)(void* ctx);
    void* ctx;
};
