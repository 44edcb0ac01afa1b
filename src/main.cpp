/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Network modules
#include "Modules/Network/WifiModule/WifiModule.h"
#include "Modules/Network/MQTTModule/MQTTModule.h"
#include "Modules/Network/RadioModule/RadioModule.h"
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
#include "Modules/Stores/DataStoreModule/DataStoreModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static WifiModule           wifiModule;
static CommandModule        commandModule;
static ConfigStoreModule    configStoreModule;
static DataStoreModule      dataStoreModule;
static MQTTModule           mqttModule;
static RadioModule          radioModule;
static LogSerialSinkModule  logSerialSinkModule;
static LogDispatcherModule  logDispatcherModule;
static LogHubModule         logHubModule;
static EventBusModule       eventBusModule;

static void requireSetup(bool ok, const char* step)
{
    if (ok) return;
    Serial.printf("Setup failure: %s\n", step ? step : "unknown");
    while (true) delay(1000);
}

void setup() {
    Serial.begin(115200);
    delay(50);
    preferences.begin(NvsKeys::StorageNamespace, false);
    registry.setPreferences(preferences);

    requireSetup(moduleManager.add(&logHubModule), "add loghub");
    requireSetup(moduleManager.add(&logDispatcherModule), "add logdispatch");
    requireSetup(moduleManager.add(&logSerialSinkModule), "add logserial");
    requireSetup(moduleManager.add(&eventBusModule), "add eventbus");

    requireSetup(moduleManager.add(&configStoreModule), "add config");
    requireSetup(moduleManager.add(&dataStoreModule), "add datastore");
    requireSetup(moduleManager.add(&commandModule), "add cmd");
    requireSetup(moduleManager.add(&wifiModule), "add wifi");
    requireSetup(moduleManager.add(&radioModule), "add radio");
    requireSetup(moduleManager.add(&mqttModule), "add mqtt");

    requireSetup(moduleManager.initAll(registry, services), "module init");

    Serial.print(
        "\x1b[34m"
        " _____ _                 ____           _ _       \n"
        "|  ___| | _____      __ |  _ \\ __ _  __| (_) ___  \n"
        "| |_  | |/ _ \\ \\ /\\ / / | |_) / _` |/ _` | |/ _ \\ \n"
        "|  _| | | (_) \\ V  V /  |  _ < (_| | (_| | | (_) |\n"
        "|_|   |_|\\___/ \\_/\\_/   |_| \\_\\__,_|\\__,_|_|\\___/ \n"
        "\x1b[0m"
        );
}

void loop() {
    delay(1000);
}
