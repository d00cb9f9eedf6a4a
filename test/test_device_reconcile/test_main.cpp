#include <unity.h>
#include <string.h>

#include "Modules/MonitorModule/LivenessTable.h"
#include "Modules/MonitorModule/MonitorReply.h"
#include "Modules/ThermostatModule/DeviceReconcile.h"

static const uint32_t kNow = 1700000000UL;
static const char* kSeen = "2026-10-19T06:00:00";
static const float kBatteryLow = 20.0f;

static LivenessTable monitorTable(DEVICE_STATE_MAX);
static LivenessTable replyTable;
static StateReconciler reconciler;
static StaticJsonDocument<512> expected;
static StaticJsonDocument<4096> replyBuildDoc;
static StaticJsonDocument<4096> replyDoc;
static StaticJsonDocument<2048> report;
static DeviceStateView view;
static DeviceOutcome outcome;
static char replyText[LIVENESS_PAYLOAD_MAX];

// Monitor side: record the state, answer with the per-device reply.
// Thermostat side: record the reply into its own table and compare.
static void roundTrip(const char* state)
{
    TEST_ASSERT_TRUE(monitorTable.record("Bad OG", kNow, state, strlen(state)));
    TEST_ASSERT_TRUE(monitorTable.snapshot("Bad OG", view));
    TEST_ASSERT_TRUE(writeDeviceReply(view, kSeen, replyBuildDoc, replyText, sizeof(replyText)));

    TEST_ASSERT_TRUE(replyTable.record("Bad OG", kNow, replyText, strlen(replyText)));
    TEST_ASSERT_TRUE(replyTable.snapshot("Bad OG", view));
    reconcileReply(reconciler, expected.as<JsonObjectConst>(), view, replyDoc, kBatteryLow, outcome);
}

void setUp()
{
    monitorTable.clear();
    replyTable.clear();
    TEST_ASSERT_TRUE(monitorTable.addDevice("Bad OG"));
    TEST_ASSERT_TRUE(replyTable.addDevice("Bad OG"));

    expected.clear();
    expected["system_mode"] = "heat";
    expected["schedule_monday"] = "00:00/19 05:00/21";
}

void tearDown() {}

void test_near_limit_state_survives_the_reply()
{
    static char state[DEVICE_STATE_MAX];
    const char* head = "{\"system_mode\":\"heat\",\"schedule_monday\":\"00:00/19 05:00/21\",\"battery\":80,\"pad\":\"";
    const size_t headLen = strlen(head);
    const size_t total = sizeof(state) - 1;
    memcpy(state, head, headLen);
    memset(state + headLen, 'p', total - headLen - 2);
    state[total - 2] = '"';
    state[total - 1] = '}';
    state[total] = '\0';

    roundTrip(state);

    TEST_ASSERT_TRUE(view.structured);
    TEST_ASSERT_FALSE(view.truncated);
    TEST_ASSERT_NOT_NULL(strstr(replyText, "\"pad\""));
    TEST_ASSERT_EQUAL_INT((int)ReconcileStatus::Ok, (int)outcome.status);
    TEST_ASSERT_EQUAL_UINT8(0, outcome.mismatches.count);
    TEST_ASSERT_TRUE(outcome.batteryKnown);
    TEST_ASSERT_EQUAL_INT((int)BatteryStatus::None, (int)outcome.battery.status);
}

void test_state_over_the_monitor_limit_is_raw()
{
    static char state[DEVICE_STATE_MAX + 16];
    memset(state, ' ', sizeof(state) - 1);
    state[0] = '{';
    state[sizeof(state) - 2] = '}';
    state[sizeof(state) - 1] = '\0';

    TEST_ASSERT_TRUE(monitorTable.record("Bad OG", kNow, state, strlen(state)));
    TEST_ASSERT_TRUE(monitorTable.snapshot("Bad OG", view));
    TEST_ASSERT_TRUE(view.truncated);
    TEST_ASSERT_FALSE(view.structured);
}

void test_missing_reply_is_timeout_with_every_key_absent()
{
    TEST_ASSERT_TRUE(replyTable.snapshot("Bad OG", view));
    reconcileReply(reconciler, expected.as<JsonObjectConst>(), view, replyDoc, kBatteryLow, outcome);

    TEST_ASSERT_EQUAL_INT((int)ReconcileStatus::Timeout, (int)outcome.status);
    TEST_ASSERT_EQUAL_UINT8(2, outcome.mismatches.count);
    TEST_ASSERT_FALSE(outcome.mismatches.entries[0].reportedPresent);
    TEST_ASSERT_FALSE(outcome.mismatches.entries[1].reportedPresent);
    TEST_ASSERT_FALSE(outcome.batteryKnown);

    TEST_ASSERT_TRUE(buildDeviceReport("Bad OG", outcome, report));
    TEST_ASSERT_EQUAL_STRING("timeout", report["status"].as<const char*>());
    TEST_ASSERT_TRUE(report["battery"].isNull());
    TEST_ASSERT_EQUAL_UINT32(2, report["mismatches"].size());
}

void test_raw_state_mismatches_every_key()
{
    roundTrip("offline");

    TEST_ASSERT_EQUAL_INT((int)ReconcileStatus::Mismatch, (int)outcome.status);
    TEST_ASSERT_EQUAL_UINT8(2, outcome.mismatches.count);
    TEST_ASSERT_EQUAL_STRING("schedule_monday", outcome.mismatches.entries[0].key);
    TEST_ASSERT_FALSE(outcome.mismatches.entries[0].reportedPresent);
    TEST_ASSERT_EQUAL_INT((int)BatteryStatus::Unknown, (int)outcome.battery.status);

    TEST_ASSERT_TRUE(buildDeviceReport("Bad OG", outcome, report));
    TEST_ASSERT_EQUAL_STRING("battery unknown", report["battery"].as<const char*>());
}

void test_drifted_value_is_reported()
{
    roundTrip("{\"system_mode\":\"off\",\"schedule_monday\":\"00:00/19.0 05:00/21\",\"battery\":9}");

    TEST_ASSERT_EQUAL_INT((int)ReconcileStatus::Mismatch, (int)outcome.status);
    TEST_ASSERT_EQUAL_UINT8(1, outcome.mismatches.count);

    TEST_ASSERT_TRUE(buildDeviceReport("Bad OG", outcome, report));
    JsonObjectConst m = report["mismatches"][0];
    TEST_ASSERT_EQUAL_STRING("system_mode", m["key"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("heat", m["expected"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("off", m["reported"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("battery 9", report["battery"].as<const char*>());
    TEST_ASSERT_FALSE(report.containsKey("error"));
}

void test_skipped_device_report_carries_its_error()
{
    roundTrip("{\"system_mode\":\"off\"}");
    markSkipped(outcome, ErrorCode::UnknownType);

    TEST_ASSERT_TRUE(buildDeviceReport("Bad OG", outcome, report));
    TEST_ASSERT_EQUAL_STRING("skipped", report["status"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("UnknownType", report["error"].as<const char*>());
    TEST_ASSERT_EQUAL_UINT32(0, report["mismatches"].size());
    TEST_ASSERT_TRUE(report["battery"].isNull());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_near_limit_state_survives_the_reply);
    RUN_TEST(test_state_over_the_monitor_limit_is_raw);
    RUN_TEST(test_missing_reply_is_timeout_with_every_key_absent);
    RUN_TEST(test_raw_state_mismatches_every_key);
    RUN_TEST(test_drifted_value_is_reported);
    RUN_TEST(test_skipped_device_report_carries_its_error);
    return UNITY_END();
}
