#pragma once
/**
 * @file ConfigMigrations.h
 * @brief NVS schema version and the steps that upgrade older namespaces.
 */
#include <Preferences.h>
#include "Core/ConfigStore.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"

namespace ConfigSchema {

constexpr uint32_t Version = 1;

// v1: the inventory buffer shrank. A stored document that no longer fits is
// dropped so the built-in inventory loads instead of a cut one.
inline bool dropOversizedInventory(Preferences& prefs, bool)
{
    if (!prefs.isKey(NvsKeys::Inventory::Json)) return true;
    if (prefs.getString(NvsKeys::Inventory::Json).length() < Limits::Inventory::JsonBuf) return true;
    return prefs.remove(NvsKeys::Inventory::Json);
}

constexpr MigrationStep kSteps[] = {
    {0, 1, dropOversizedInventory},
};
constexpr size_t kStepCount = sizeof(kSteps) / sizeof(kSteps[0]);

}  // namespace ConfigSchema
