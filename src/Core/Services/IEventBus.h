#pragma once
/**
 * @file IEventBus.h
 * @brief `eventbus` service: the shared EventBus instance.
 */

class EventBus;

struct EventBusService {
    EventBus* bus;
};
