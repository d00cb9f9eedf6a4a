#pragma once
/**
 * @file Services.h
 * @brief Every service struct a module may look up in the ServiceRegistry.
 */
#include "ILogger.h"     // loghub
#include "IEventBus.h"   // eventbus
#include "ICommand.h"    // cmd
#include "IConfig.h"     // config
#include "IWifi.h"       // wifi
#include "ITime.h"       // time
#include "IMqtt.h"       // mqtt
#include "IInventory.h"  // inventory
