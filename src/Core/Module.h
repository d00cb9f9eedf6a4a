#pragma once
/**
 * @file Module.h
 * @brief Module contract, and the task that drives an active module.
 */
#include "ConfigStore.h"
#include "ServiceRegistry.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

/** @brief Where and how an active module's task runs. */
struct TaskSpec {
    const char* name;
    uint16_t stackBytes = 3072;
    UBaseType_t priority = 1;
    BaseType_t core = 1;      ///< ESP32 core, `0` or `1`.
    uint32_t idleMs = 10;     ///< Delay between two loop() calls.
};

/**
 * @brief A unit of firmware wired by ModuleManager.
 *
 * A plain Module only registers services, config variables and bus
 * subscriptions. Modules that need their own loop derive from ActiveModule.
 */
class Module {
public:
    virtual ~Module() = default;

    /** @brief Name other modules list as a dependency. */
    virtual const char* moduleId() const = 0;

    virtual uint8_t dependencyCount() const { return 0; }
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Register services and config. Dependencies are already initialized. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Runs once every persisted value has been loaded. */
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}

    /** @brief Start whatever runs the module after bring-up. Nothing for a plain module. */
    virtual bool start() { return true; }
};

/**
 * @brief Module owning one FreeRTOS task that calls loop() forever.
 */
class ActiveModule : public Module {
public:
    virtual TaskSpec taskSpec() const { return TaskSpec{moduleId()}; }
    virtual void loop() = 0;

    bool start() override {
        if (task_) return true;
        const TaskSpec spec = taskSpec();
        return xTaskCreatePinnedToCore(&ActiveModule::run_, spec.name, spec.stackBytes, this,
                                       spec.priority, &task_, spec.core) == pdPASS;
    }

private:
    TaskHandle_t task_ = nullptr;

    static void run_(void* arg) {
        ActiveModule* self = static_cast<ActiveModule*>(arg);
        const TickType_t idle = pdMS_TO_TICKS(self->taskSpec().idleMs);
        for (;;) {
            self->loop();
            vTaskDelay(idle);
        }
    }
};
