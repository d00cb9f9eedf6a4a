#pragma once
/**
 * @file ConfigTypes.h
 * @brief Declarations modules use to expose a value to the config store.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

/**
 * @brief Compile-time checked NVS key.
 *
 * Preferences keys are limited to Limits::MaxNvsKeyLen characters; wrap every
 * key literal so an overlong one fails the build instead of the write.
 */
template <size_t N>
constexpr const char* NVS_KEY(const char (&s)[N])
{
    static_assert(N > 1, "empty NVS key");
    static_assert(N - 1 <= Limits::MaxNvsKeyLen, "NVS key too long");
    return s;
}

/** @brief Runtime values are exported and patched but never written to NVS. */
enum class ConfigPersistence : uint8_t { Runtime, Persistent };

enum class ConfigType : uint8_t { Int32, UInt8, UInt32, Bool, CharArray };

/**
 * @brief A module-owned value published as `<moduleName>.<jsonName>`.
 *
 * @p value points into the owning module, which must outlive the store.
 * @p size is the buffer size of a CharArray, 0 otherwise.
 */
template<typename T>
struct ConfigVariable {
    const char* nvsKey;
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    ConfigPersistence persistence;
    uint16_t size;
};

/** @brief Type-erased copy of a ConfigVariable kept by the store. */
struct ConfigMeta {
    const char* module;
    const char* name;
    const char* nvsKey;
    ConfigType type;
    ConfigPersistence persistence;
    void* valuePtr;
    uint16_t size;
};
