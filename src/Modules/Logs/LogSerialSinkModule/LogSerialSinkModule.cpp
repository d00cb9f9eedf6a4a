/**
 * @file LogSerialSinkModule.cpp
 * @brief Console sink: one `[stamp][L][tag] message` line per entry.
 */
#include "LogSerialSinkModule.h"
#include <Arduino.h>

namespace {

// Looked up on first write: the time module registers after the sinks.
struct ConsoleSink {
    ServiceRegistry* services = nullptr;
    const TimeService* clock = nullptr;
};

ConsoleSink gConsole;

const char* levelMark(LogLevel lvl)
{
    switch (lvl) {
    case LogLevel::Debug: return "D";
    case LogLevel::Info:  return "I";
    case LogLevel::Warn:  return "W";
    case LogLevel::Error: return "E";
    }
    return "?";
}

// Wall clock once synced, uptime (h:mm:ss) before that.
void stamp(ConsoleSink& sink, uint32_t tsMs, char* out, size_t len)
{
    if (!sink.clock && sink.services) sink.clock = sink.services->get<TimeService>("time");
    if (sink.clock) {
        char iso[24];
        const uint64_t epoch = sink.clock->epoch(sink.clock->ctx);
        if (epoch != 0 && sink.clock->formatIso(sink.clock->ctx, epoch, iso, sizeof(iso))) {
            snprintf(out, len, "%s.%03u", iso, (unsigned)(tsMs % 1000U));
            return;
        }
    }
    const uint32_t s = tsMs / 1000U;
    snprintf(out, len, "%lu:%02lu:%02lu.%03lu", (unsigned long)(s / 3600U), (unsigned long)(s / 60U % 60U),
             (unsigned long)(s % 60U), (unsigned long)(tsMs % 1000U));
}

void writeLine(void* ctx, const LogEntry& e)
{
    char ts[32];
    stamp(*static_cast<ConsoleSink*>(ctx), e.ts_ms, ts, sizeof(ts));
    Serial.printf("[%s][%s][%s] %s\n", ts, levelMark(e.lvl), e.tag, e.msg);
}

}  // namespace

void LogSerialSinkModule::init(ConfigStore&, ServiceRegistry& services)
{
    const LogHubService* hub = services.get<LogHubService>("loghub");
    if (!hub) {
        Serial.println("[console] no log hub, console logging off");
        return;
    }
    gConsole.services = &services;

    LogSinkService sink{};
    sink.write = writeLine;
    sink.ctx = &gConsole;
    sink.name = "serial";
    sink.minLevel = LogLevel::Debug;
    if (!hub->addSink(hub->ctx, sink)) Serial.println("[console] sink rejected, console logging off");
}
