/**
 * @file ServiceRegistry.cpp
 * @brief Service table lookups.
 */
#include "ServiceRegistry.h"
#include "Core/Log.h"
#include <string.h>

static constexpr const char* kTag = "Services";

const ServiceRegistry::Entry* ServiceRegistry::entry_(const char* id) const
{
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].id, id) == 0) return &entries_[i];
    }
    return nullptr;
}

bool ServiceRegistry::put_(const char* id, const void* service, TypeKey type)
{
    if (!id || !service) return false;
    if (entry_(id)) {
        Log::error(kTag, "'%s' registered twice", id);
        return false;
    }
    if (count_ >= MAX_SERVICES) {
        Log::error(kTag, "table full, '%s' not registered", id);
        return false;
    }
    entries_[count_++] = Entry{id, service, type};
    return true;
}

const void* ServiceRegistry::find_(const char* id, TypeKey type) const
{
    const Entry* e = entry_(id);
    if (!e) return nullptr;
    if (e->type != type) {
        Log::error(kTag, "'%s' requested with the wrong type", id);
        return nullptr;
    }
    return e->service;
}
