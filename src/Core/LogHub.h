#pragma once
/**
 * @file LogHub.h
 * @brief Log queue shared by every task, and the sinks it feeds.
 */
#include "Core/Services/ILogger.h"
#include <atomic>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Producers enqueue without blocking; one consumer calls pump().
 *
 * Sinks are attached during init and only read afterwards.
 */
class LogHub {
public:
    static constexpr uint8_t MAX_SINKS = 4;

    bool begin(uint8_t queueLen);

    /** @brief Queue @p e, or count it as dropped when the queue is full. */
    bool enqueue(const LogEntry& e);
    /** @brief Attach a sink. Names must be unique. */
    bool addSink(const LogSinkService& sink);

    /** @brief Wait up to @p wait for one entry and hand it to every sink. */
    bool pump(TickType_t wait);
    /** @brief Hand a locally built entry to the sinks, bypassing the queue. */
    void deliver(const LogEntry& e) const;

    uint32_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    QueueHandle_t queue_ = nullptr;
    std::atomic<uint32_t> dropped_{0};
    LogSinkService sinks_[MAX_SINKS]{};
    uint8_t sinkCount_ = 0;
};
