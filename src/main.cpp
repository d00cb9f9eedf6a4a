/**
 * @file main.cpp
 * @brief Therm.io firmware: storage, module table and bring-up.
 */
#include <Arduino.h>
#include <Preferences.h>

#include "Core/ConfigMigrations.h"
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/NvsKeys.h"
#include "Core/ServiceRegistry.h"
#include "Core/EventBus/EventBus.h"
#include "Core/Services/Services.h"

#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
#include "Modules/System/SystemModule/SystemModule.h"
#include "Modules/Network/WifiModule/WifiModule.h"
#include "Modules/Network/TimeModule/TimeModule.h"
#include "Modules/Network/MQTTModule/MQTTModule.h"
#include "Modules/InventoryModule/InventoryModule.h"
#include "Modules/MonitorModule/MonitorModule.h"
#include "Modules/ThermostatModule/ThermostatModule.h"

namespace {

// Preferences must outlive every ConfigStore access.
Preferences nvs;
ConfigStore config;
ServiceRegistry services;
ModuleManager modules;

// Plumbing
LogHubModule        logHub;
LogDispatcherModule logDispatcher;
LogSerialSinkModule logConsole;
EventBusModule      eventBus;
CommandModule       commands;
ConfigStoreModule   configCommands;
SystemModule        systemCommands;
// Links
WifiModule          wifi;
TimeModule          timeSync;
MQTTModule          mqtt;
// Thermostat supervisor
InventoryModule     inventory;
MonitorModule       monitor;
ThermostatModule    thermostat;

Module* const kModules[] = {
    &logHub, &logDispatcher, &logConsole, &eventBus, &commands, &configCommands, &systemCommands,
    &wifi, &timeSync, &mqtt,
    &inventory, &monitor, &thermostat,
};

}  // namespace

void setup()
{
    Serial.begin(115200);
    if (!nvs.begin(NvsKeys::StorageNamespace, false)) {
        Serial.println("NVS unavailable, running on defaults");
    }
    config.setPreferences(nvs);
    if (!config.runMigrations(ConfigSchema::Version, ConfigSchema::kSteps, ConfigSchema::kStepCount, NvsKeys::ConfigVersion)) {
        Serial.println("config schema not migrated");
    }

    bool ok = true;
    for (Module* m : kModules) ok = modules.add(m) && ok;
    if (!ok || !modules.initAll(config, services)) {
        Serial.println("bring-up failed, halted");
        for (;;) delay(1000);
    }

    const EventBusService* bus = services.get<EventBusService>("eventbus");
    if (!bus || !bus->bus || !bus->bus->post(EventId::SystemStarted)) Serial.println("SystemStarted not posted");
    Serial.println("Therm.io up");
}

void loop()
{
    // All work runs in module tasks.
    vTaskDelete(nullptr);
}
