#include <unity.h>
#include <string.h>

#include "Modules/ThermostatModule/ScheduleGenerator.h"

static void assertWellFormed(const ScheduleString& s)
{
    TEST_ASSERT_TRUE(s.count >= 2);
    TEST_ASSERT_TRUE(s.count <= 6);
    TEST_ASSERT_EQUAL_UINT16(0, s.points[0].minute);
    for (uint8_t i = 1; i < s.count; ++i) {
        TEST_ASSERT_TRUE(s.points[i - 1].minute < s.points[i].minute);
    }
}

void test_night_crossing_midnight_forces_second_night_point()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(generateScheduleFromText("05:00", 21.0f, "23:00", 19.0f, s, err));

    char text[128];
    TEST_ASSERT_TRUE(formatSchedule(s, text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("00:00/19 05:00/21 09:30/21 14:00/21 18:30/21 23:00/19", text);
}

void test_evening_night_start()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(generateScheduleFromText("06:00", 21.0f, "22:00", 18.0f, s, err));

    char text[128];
    TEST_ASSERT_TRUE(formatSchedule(s, text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("00:00/18 06:00/21 10:00/21 14:00/21 18:00/21 22:00/18", text);
}

void test_day_segment_wrapping_onto_midnight_is_kept()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(generateScheduleFromText("22:00", 21.0f, "06:00", 17.0f, s, err));

    char text[128];
    TEST_ASSERT_TRUE(formatSchedule(s, text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("00:00/21 02:00/21 04:00/21 06:00/17 14:00/17 22:00/21", text);
}

void test_night_at_midnight_needs_no_forcing()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(generateScheduleFromText("07:00", 21.0f, "00:00", 18.0f, s, err));

    char text[128];
    TEST_ASSERT_TRUE(formatSchedule(s, text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("00:00/18 03:30/18 07:00/21 11:15/21 15:30/21 19:45/21", text);
}

void test_duplicate_times_are_dropped()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(generateScheduleFromText("05:01", 21.0f, "05:00", 19.0f, s, err));

    char text[128];
    TEST_ASSERT_TRUE(formatSchedule(s, text, sizeof(text)));
    TEST_ASSERT_EQUAL_UINT8(5, s.count);
    TEST_ASSERT_EQUAL_STRING("00:00/21 05:00/19 05:01/21 11:01/21 17:00/21", text);
}

void test_half_minute_ties_round_to_even()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(generateScheduleFromText("05:00", 21.0f, "23:02", 19.0f, s, err));

    char text[128];
    TEST_ASSERT_TRUE(formatSchedule(s, text, sizeof(text)));
    // Day step is 270.5 minutes: 570.5 -> 570 and 1111.5 -> 1112.
    TEST_ASSERT_EQUAL_STRING("00:00/19 05:00/21 09:30/21 14:01/21 18:32/21 23:02/19", text);
}

void test_all_half_hour_pairs_are_well_formed()
{
    for (uint16_t day = 0; day < 1440; day += 30) {
        for (uint16_t night = 0; night < 1440; night += 30) {
            if (day == night) continue;
            ScheduleString s;
            ErrorCode err = ErrorCode::Failed;
            TEST_ASSERT_TRUE(generateSchedule(day, 21.0f, night, 18.5f, s, err));
            assertWellFormed(s);
        }
    }
}

void test_format_parse_round_trip()
{
    for (uint16_t day = 0; day < 1440; day += 97) {
        for (uint16_t night = 13; night < 1440; night += 89) {
            if (day == night) continue;
            ScheduleString s;
            ErrorCode err = ErrorCode::Failed;
            TEST_ASSERT_TRUE(generateSchedule(day, 20.5f, night, 17.25f, s, err));

            char text[128];
            TEST_ASSERT_TRUE(formatSchedule(s, text, sizeof(text)));

            ScheduleString back;
            TEST_ASSERT_TRUE(parseSchedule(text, back, err));
            TEST_ASSERT_TRUE(scheduleEquals(s, back));
        }
    }
}

void test_equal_day_and_night_is_config_error()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(generateScheduleFromText("06:00", 21.0f, "06:00", 18.0f, s, err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidConfig, (int)err);
    TEST_ASSERT_EQUAL_UINT8(0, s.count);
}

void test_malformed_time_is_parse_error()
{
    const char* bad[] = {"24:00", "7:5", "07:60", "ab:cd", "07:00x", "", "0700", ":30"};
    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
        ScheduleString s;
        ErrorCode err = ErrorCode::Failed;
        TEST_ASSERT_FALSE(generateScheduleFromText(bad[i], 21.0f, "23:00", 19.0f, s, err));
        TEST_ASSERT_EQUAL_INT((int)ErrorCode::ParseError, (int)err);
    }

    uint16_t minute = 0;
    TEST_ASSERT_TRUE(parseTimeOfDay("7:05", minute));
    TEST_ASSERT_EQUAL_UINT16(425, minute);
}

void test_temperature_formatting_is_canonical()
{
    char out[16];
    TEST_ASSERT_TRUE(formatTemperature(21.0f, out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("21", out);
    TEST_ASSERT_TRUE(formatTemperature(21.5f, out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("21.5", out);
    TEST_ASSERT_TRUE(formatTemperature(20.25f, out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("20.25", out);

    TEST_ASSERT_TRUE(canonicalizeDecimal("24.0", 4, out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("24", out);
    TEST_ASSERT_TRUE(canonicalizeDecimal("-0.50", 5, out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("-0.5", out);
    TEST_ASSERT_FALSE(canonicalizeDecimal("2a", 2, out, sizeof(out)));
}

void test_parse_schedule_rejects_bad_tokens()
{
    ScheduleString s;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(parseSchedule("00:00/19  05:00/21.0", s, err));
    TEST_ASSERT_EQUAL_UINT8(2, s.count);
    TEST_ASSERT_EQUAL_UINT16(300, s.points[1].minute);

    err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(parseSchedule("00:00-19", s, err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::ParseError, (int)err);
    TEST_ASSERT_FALSE(parseSchedule("   ", s, err));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_night_crossing_midnight_forces_second_night_point);
    RUN_TEST(test_evening_night_start);
    RUN_TEST(test_day_segment_wrapping_onto_midnight_is_kept);
    RUN_TEST(test_night_at_midnight_needs_no_forcing);
    RUN_TEST(test_duplicate_times_are_dropped);
    RUN_TEST(test_half_minute_ties_round_to_even);
    RUN_TEST(test_all_half_hour_pairs_are_well_formed);
    RUN_TEST(test_format_parse_round_trip);
    RUN_TEST(test_equal_day_and_night_is_config_error);
    RUN_TEST(test_malformed_time_is_parse_error);
    RUN_TEST(test_temperature_formatting_is_canonical);
    RUN_TEST(test_parse_schedule_rejects_bad_tokens);
    return UNITY_END();
}
