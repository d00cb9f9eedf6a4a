#pragma once
/**
 * @file ServiceRegistry.h
 * @brief Named service tables shared between modules.
 */
#include <stdint.h>

/**
 * @brief Maps a service name to the C-style service struct a module exposes.
 *
 * Each entry remembers the struct type it was added with, so get<T>() with
 * the wrong T returns nullptr instead of a reinterpreted pointer. Filled
 * during init, read-only afterwards.
 */
class ServiceRegistry {
public:
    static constexpr uint8_t MAX_SERVICES = 12;

    /** @brief Add @p service under @p id. False on a duplicate id or a full table. */
    template<typename T>
    bool add(const char* id, const T* service) { return put_(id, service, typeKey_<T>()); }

    /** @brief Service added under @p id as a T, or nullptr. */
    template<typename T>
    const T* get(const char* id) const { return static_cast<const T*>(find_(id, typeKey_<T>())); }

private:
    using TypeKey = const void*;

    struct Entry {
        const char* id;
        const void* service;
        TypeKey type;
    };

    // One distinct address per service struct type.
    template<typename T>
    static TypeKey typeKey_() {
        static const char key = 0;
        return &key;
    }

    bool put_(const char* id, const void* service, TypeKey type);
    const void* find_(const char* id, TypeKey type) const;
    const Entry* entry_(const char* id) const;

    Entry entries_[MAX_SERVICES]{};
    uint8_t count_ = 0;
};
