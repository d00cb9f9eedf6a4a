/**
 * @file LogHub.cpp
 * @brief Log queue and sink fan-out.
 */
#include "Core/LogHub.h"
#include <string.h>

bool LogHub::begin(uint8_t queueLen)
{
    if (!queue_) queue_ = xQueueCreate(queueLen, sizeof(LogEntry));
    return queue_ != nullptr;
}

bool LogHub::enqueue(const LogEntry& e)
{
    if (queue_ && xQueueSend(queue_, &e, 0) == pdTRUE) return true;
    dropped_.fetch_add(1U, std::memory_order_relaxed);
    return false;
}

bool LogHub::addSink(const LogSinkService& sink)
{
    if (!sink.write || sinkCount_ >= MAX_SINKS) return false;
    for (uint8_t i = 0; i < sinkCount_ && sink.name; ++i) {
        if (sinks_[i].name && strcmp(sinks_[i].name, sink.name) == 0) return false;
    }
    sinks_[sinkCount_++] = sink;
    return true;
}

bool LogHub::pump(TickType_t wait)
{
    LogEntry e;
    if (!queue_ || xQueueReceive(queue_, &e, wait) != pdTRUE) return false;
    deliver(e);
    return true;
}

void LogHub::deliver(const LogEntry& e) const
{
    for (uint8_t i = 0; i < sinkCount_; ++i) {
        if ((uint8_t)e.lvl >= (uint8_t)sinks_[i].minLevel) sinks_[i].write(sinks_[i].ctx, e);
    }
}
