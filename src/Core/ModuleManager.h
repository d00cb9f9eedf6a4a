#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordered bring-up of the registered modules.
 */
#include "Module.h"

/** @brief Maximum number of modules supported at runtime. */
constexpr size_t MAX_MODULES = 15;

/**
 * @brief Orders modules after their dependencies and brings them up.
 */
class ModuleManager {
public:
    /** @brief Register a module. false when the table is full. */
    bool add(Module* m);

    /**
     * @brief init() every module in dependency order, load the persisted config,
     * call onConfigLoaded() in the same order and start the active modules' tasks.
     *
     * @return false on a missing or cyclic dependency (nothing is initialized)
     * or when a task could not be created.
     */
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);

private:
    enum class Mark : uint8_t { None, Visiting, Placed };

    Module* modules_[MAX_MODULES] = {};
    Mark marks_[MAX_MODULES] = {};
    uint8_t count_ = 0;

    Module* order_[MAX_MODULES] = {};
    uint8_t placed_ = 0;

    int indexOf_(const char* id) const;
    bool place_(uint8_t idx);
};
