#pragma once
/**
 * @file ScheduleGenerator.h
 * @brief Day/night set points to device schedule string conversion.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"

/** @brief Maximum number of breakpoints a generated schedule can hold. */
constexpr uint8_t SCHEDULE_MAX_POINTS = 10;

/** @brief One time/temperature breakpoint. */
struct SchedulePoint {
    uint16_t minute = 0;        ///< Minutes since midnight (0..1439).
    float temperature = 0.0f;
};

/** @brief Ordered breakpoints, unique by time of day. */
struct ScheduleString {
    SchedulePoint points[SCHEDULE_MAX_POINTS];
    uint8_t count = 0;
};

/**
 * @brief Parse a time of day ("H:MM" or "HH:MM").
 * @return false when the text is not a valid time of day.
 */
bool parseTimeOfDay(const char* text, uint16_t& minuteOut);

/** @brief Format minutes since midnight as "HH:MM" (needs 6 bytes). */
bool formatTimeOfDay(uint16_t minute, char* out, size_t outLen);

/**
 * @brief Canonical decimal text: fixed 2 decimals, trailing zeros and dot removed.
 *
 * 21 -> "21", 21.5 -> "21.5", 20.25 -> "20.25".
 */
bool formatTemperature(float value, char* out, size_t outLen);

/**
 * @brief Canonical form of a decimal literal ("24.0" -> "24", "-0.50" -> "-0.5").
 * @return false when @p text is not a plain decimal literal.
 */
bool canonicalizeDecimal(const char* text, size_t len, char* out, size_t outLen);

/**
 * @brief Build the daily schedule from day and night set points.
 *
 * Two night points span night->day and four day points span day->night, each
 * rounded to the nearest minute. When no point lands on 00:00, the first point
 * of the segment crossing midnight that wrapped past it is moved to 00:00 (its
 * last point when none wrapped). Segment start times are never moved.
 * Points are then sorted by time of day and later duplicates dropped.
 *
 * @param err Set to InvalidConfig when day and night times are equal.
 */
bool generateSchedule(uint16_t dayMinute,
                      float dayTemp,
                      uint16_t nightMinute,
                      float nightTemp,
                      ScheduleString& out,
                      ErrorCode& err);

/** @brief Same as generateSchedule() with "HH:MM" inputs; bad times give ParseError. */
bool generateScheduleFromText(const char* dayTime,
                              float dayTemp,
                              const char* nightTime,
                              float nightTemp,
                              ScheduleString& out,
                              ErrorCode& err);

/** @brief Serialize as space separated "HH:MM/temp" tokens. */
bool formatSchedule(const ScheduleString& schedule, char* out, size_t outLen);

/**
 * @brief Parse a serialized schedule string.
 * @param err Set to ParseError on malformed tokens or too many points.
 */
bool parseSchedule(const char* text, ScheduleString& out, ErrorCode& err);

/** @brief Point-wise equality (same minutes, same canonical temperatures). */
bool scheduleEquals(const ScheduleString& a, const ScheduleString& b);
