/**
 * @file ConfigStore.cpp
 * @brief NVS load/store, JSON export and patching of registered variables.
 */
#include "Core/ConfigStore.h"
#include "Core/EventBus/EventPayloads.h"
#include <ArduinoJson.h>
#include <stdio.h>

static constexpr const char* kTag = "CfgStore";

namespace {

void exportValue(JsonObject obj, const ConfigMeta& m)
{
    if (strcmp(m.name, "pass") == 0) {
        obj[m.name] = "***";
        return;
    }
    switch (m.type) {
    case ConfigType::Int32:     obj[m.name] = *(const int32_t*)m.valuePtr; break;
    case ConfigType::UInt8:     obj[m.name] = *(const uint8_t*)m.valuePtr; break;
    case ConfigType::UInt32:    obj[m.name] = *(const uint32_t*)m.valuePtr; break;
    case ConfigType::Bool:      obj[m.name] = *(const bool*)m.valuePtr; break;
    case ConfigType::CharArray: obj[m.name] = (const char*)m.valuePtr; break;
    }
}

template<typename T>
bool assign(JsonVariantConst v, void* dst, bool& changed)
{
    if (!v.is<T>()) return false;
    const T x = v.as<T>();
    changed = (*(T*)dst != x);
    *(T*)dst = x;
    return true;
}

// false when the JSON type does not match the variable.
bool importValue(JsonVariantConst v, const ConfigMeta& m, bool& changed)
{
    changed = false;
    switch (m.type) {
    case ConfigType::Int32:  return assign<int32_t>(v, m.valuePtr, changed);
    case ConfigType::UInt8:  return assign<uint8_t>(v, m.valuePtr, changed);
    case ConfigType::UInt32: return assign<uint32_t>(v, m.valuePtr, changed);
    case ConfigType::Bool:   return assign<bool>(v, m.valuePtr, changed);
    case ConfigType::CharArray: {
        if (!v.is<const char*>() || m.size == 0) return false;
        const char* s = v.as<const char*>();
        char* dst = (char*)m.valuePtr;
        size_t len = strlen(s);
        if (len >= m.size) {
            Log::warn(kTag, "%s.%s cut to %u bytes", m.module, m.name, (unsigned)(m.size - 1));
            len = m.size - 1;
        }
        if (strncmp(dst, s, len) == 0 && dst[len] == '\0') return true;
        memcpy(dst, s, len);
        dst[len] = '\0';
        changed = true;
        return true;
    }
    }
    return false;
}

}  // namespace

void ConfigStore::store_(const ConfigMeta& m)
{
    if (!prefs_ || !m.nvsKey || m.persistence != ConfigPersistence::Persistent) return;
    size_t written = 0;
    switch (m.type) {
    case ConfigType::Int32:     written = prefs_->putInt(m.nvsKey, *(const int32_t*)m.valuePtr); break;
    case ConfigType::UInt8:     written = prefs_->putUChar(m.nvsKey, *(const uint8_t*)m.valuePtr); break;
    case ConfigType::UInt32:    written = prefs_->putUInt(m.nvsKey, *(const uint32_t*)m.valuePtr); break;
    case ConfigType::Bool:      written = prefs_->putBool(m.nvsKey, *(const bool*)m.valuePtr); break;
    case ConfigType::CharArray: written = prefs_->putString(m.nvsKey, (const char*)m.valuePtr); break;
    }
    if (written == 0) Log::error(kTag, "NVS write of %s failed", m.nvsKey);
}

void ConfigStore::announce_(const char* nvsKey)
{
    if (!bus_ || !nvsKey) return;
    ConfigChangedPayload p{};
    snprintf(p.nvsKey, sizeof(p.nvsKey), "%s", nvsKey);
    if (!bus_->post(EventId::ConfigChanged, &p, sizeof(p))) {
        Log::warn(kTag, "change of %s not announced", nvsKey);
    }
}

void ConfigStore::loadPersistent()
{
    if (!prefs_) return;
    uint16_t loaded = 0;
    for (uint16_t i = 0; i < metaCount_; ++i) {
        const ConfigMeta& m = meta_[i];
        if (m.persistence != ConfigPersistence::Persistent || !m.nvsKey || !prefs_->isKey(m.nvsKey)) continue;
        switch (m.type) {
        case ConfigType::Int32:  *(int32_t*)m.valuePtr = prefs_->getInt(m.nvsKey, *(int32_t*)m.valuePtr); break;
        case ConfigType::UInt8:  *(uint8_t*)m.valuePtr = prefs_->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr); break;
        case ConfigType::UInt32: *(uint32_t*)m.valuePtr = prefs_->getUInt(m.nvsKey, *(uint32_t*)m.valuePtr); break;
        case ConfigType::Bool:   *(bool*)m.valuePtr = prefs_->getBool(m.nvsKey, *(bool*)m.valuePtr); break;
        case ConfigType::CharArray: prefs_->getString(m.nvsKey, (char*)m.valuePtr, m.size); break;
        }
        ++loaded;
    }
    Log::info(kTag, "%u of %u value(s) from NVS", (unsigned)loaded, (unsigned)metaCount_);
}

bool ConfigStore::erasePersistent()
{
    if (!prefs_) return false;
    const bool ok = prefs_->clear();
    if (ok) Log::warn(kTag, "NVS namespace cleared");
    else Log::error(kTag, "NVS namespace not cleared");
    return ok;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen == 0 || !module) return false;
    out[0] = '\0';

    // Values are referenced, not copied.
    static StaticJsonDocument<Limits::JsonConfigExportBuf> doc;
    doc.clear();
    JsonObject obj = doc.to<JsonObject>();
    bool known = false;
    for (uint16_t i = 0; i < metaCount_; ++i) {
        if (strcmp(meta_[i].module, module) != 0) continue;
        exportValue(obj, meta_[i]);
        known = true;
    }
    if (!known) return false;

    if (doc.overflowed() || measureJson(doc) >= outLen) {
        if (truncated) *truncated = true;
        snprintf(out, outLen, "{}");
        return true;
    }
    serializeJson(doc, out, outLen);
    return true;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    uint8_t n = 0;
    for (uint16_t i = 0; i < metaCount_ && n < max; ++i) {
        const char* mod = meta_[i].module;
        bool seen = false;
        for (uint8_t j = 0; j < n && !seen; ++j) seen = (strcmp(out[j], mod) == 0);
        if (!seen) out[n++] = mod;
    }
    return n;
}

bool ConfigStore::applyJson(const char* json, ConfigApplyResult* result)
{
    ConfigApplyResult local;
    ConfigApplyResult& r = result ? *result : local;
    r = ConfigApplyResult{};
    if (!json) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) {
        Log::warn(kTag, "patch refused (%s)", err ? err.c_str() : "not an object");
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    for (uint16_t i = 0; i < metaCount_; ++i) {
        const ConfigMeta& m = meta_[i];
        JsonVariantConst v = root[m.module][m.name];
        if (v.isNull()) continue;

        ++r.matched;
        bool changed = false;
        if (!importValue(v, m, changed)) {
            ++r.rejected;
            Log::warn(kTag, "%s.%s: wrong type", m.module, m.name);
            continue;
        }
        if (!changed) continue;
        ++r.changed;
        store_(m);
        announce_(m.nvsKey);
    }
    Log::info(kTag, "patch: %u matched, %u changed, %u rejected",
              (unsigned)r.matched, (unsigned)r.changed, (unsigned)r.rejected);
    return r.rejected == 0;
}

void ConfigStore::resetNamespace_(const char* versionKey)
{
    prefs_->clear();
    prefs_->putUInt(versionKey, 0);
}

bool ConfigStore::runMigrations(uint32_t currentVersion, const MigrationStep* steps, size_t count,
                                const char* versionKey, bool clearOnFail)
{
    if (!prefs_ || !versionKey) return false;

    uint32_t version = prefs_->getUInt(versionKey, 0);
    if (version > currentVersion) {
        Log::warn(kTag, "stored schema %lu is newer than %lu",
                  (unsigned long)version, (unsigned long)currentVersion);
        return false;
    }

    while (version < currentVersion) {
        const MigrationStep* step = nullptr;
        for (size_t i = 0; i < count && !step; ++i) {
            if (steps[i].fromVersion == version && steps[i].apply) step = &steps[i];
        }
        if (!step || !step->apply(*prefs_, clearOnFail)) {
            Log::warn(kTag, "no usable migration from schema %lu", (unsigned long)version);
            if (clearOnFail) resetNamespace_(versionKey);
            return false;
        }
        version = step->toVersion;
        prefs_->putUInt(versionKey, version);
        Log::info(kTag, "config schema now %lu", (unsigned long)version);
    }
    return true;
}
