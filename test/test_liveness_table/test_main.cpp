#include <unity.h>
#include <stdio.h>
#include <string.h>

#include "Modules/MonitorModule/LivenessTable.h"

static LivenessTable table;
static DeviceStateView view;

static const uint32_t kThreshold = 3600;
static const uint32_t kNow = 1700000000UL;

void setUp()
{
    table.clear();
    TEST_ASSERT_TRUE(table.addDevice("Bad OG"));
    TEST_ASSERT_TRUE(table.addDevice("Dusche"));
}

void tearDown() {}

void test_never_seen_snapshot_is_empty()
{
    TEST_ASSERT_TRUE(table.snapshot("Bad OG", view));
    TEST_ASSERT_FALSE(view.seen);
    TEST_ASSERT_EQUAL_STRING("", view.payload);
    TEST_ASSERT_FALSE(table.snapshot("Unknown", view));
}

void test_structured_payload_is_recorded()
{
    const char* msg = "{\"local_temperature\":20.5,\"battery\":80}";
    TEST_ASSERT_TRUE(table.record("Bad OG", kNow, msg, strlen(msg)));
    TEST_ASSERT_TRUE(table.snapshot("Bad OG", view));
    TEST_ASSERT_TRUE(view.seen);
    TEST_ASSERT_TRUE(view.structured);
    TEST_ASSERT_EQUAL_UINT32(kNow, view.lastSeen);
    TEST_ASSERT_EQUAL_STRING(msg, view.payload);
}

void test_undecodable_payload_is_kept_raw()
{
    const char* msg = "not {json";
    TEST_ASSERT_TRUE(table.record("Dusche", kNow, msg, strlen(msg)));
    TEST_ASSERT_TRUE(table.snapshot("Dusche", view));
    TEST_ASSERT_TRUE(view.seen);
    TEST_ASSERT_FALSE(view.structured);
    TEST_ASSERT_EQUAL_STRING(msg, view.payload);

    const char* later = "{\"ok\":1}";
    TEST_ASSERT_TRUE(table.record("Dusche", kNow + 5, later, strlen(later)));
    TEST_ASSERT_TRUE(table.snapshot("Dusche", view));
    TEST_ASSERT_TRUE(view.structured);
    TEST_ASSERT_EQUAL_UINT32(kNow + 5, view.lastSeen);
}

void test_unknown_device_is_not_recorded()
{
    TEST_ASSERT_FALSE(table.record("Garage", kNow, "{}", 2));
    TEST_ASSERT_EQUAL_UINT8(2, table.count());
}

void test_staleness_boundary()
{
    StaleEntry stale[LIVENESS_MAX_DEVICES];

    TEST_ASSERT_TRUE(table.record("Bad OG", kNow - kThreshold - 1, "{}", 2));
    TEST_ASSERT_TRUE(table.record("Dusche", kNow - kThreshold + 1, "{}", 2));

    const uint8_t n = table.stalenessReport(kNow, kThreshold, stale, LIVENESS_MAX_DEVICES);
    TEST_ASSERT_EQUAL_UINT8(1, n);
    TEST_ASSERT_EQUAL_STRING("Bad OG", stale[0].name);
    TEST_ASSERT_TRUE(stale[0].seen);

    TEST_ASSERT_TRUE(table.record("Bad OG", kNow - kThreshold, "{}", 2));
    TEST_ASSERT_EQUAL_UINT8(0, table.stalenessReport(kNow, kThreshold, stale, LIVENESS_MAX_DEVICES));
}

void test_never_seen_is_always_stale()
{
    StaleEntry stale[LIVENESS_MAX_DEVICES];
    TEST_ASSERT_TRUE(table.record("Dusche", kNow, "{}", 2));

    const uint8_t n = table.stalenessReport(kNow, 0xFFFFFFFFUL, stale, LIVENESS_MAX_DEVICES);
    TEST_ASSERT_EQUAL_UINT8(1, n);
    TEST_ASSERT_EQUAL_STRING("Bad OG", stale[0].name);
    TEST_ASSERT_FALSE(stale[0].seen);
}

void test_oversized_payload_is_truncated_raw()
{
    static char big[LIVENESS_PAYLOAD_MAX + 64];
    memset(big, 'x', sizeof(big) - 1);
    big[0] = '{';
    big[sizeof(big) - 1] = '\0';

    TEST_ASSERT_TRUE(table.record("Bad OG", kNow, big, strlen(big)));
    TEST_ASSERT_TRUE(table.snapshot("Bad OG", view));
    TEST_ASSERT_TRUE(view.truncated);
    TEST_ASSERT_FALSE(view.structured);
    TEST_ASSERT_EQUAL_UINT32(LIVENESS_PAYLOAD_MAX - 1, strlen(view.payload));
}

void test_trailing_text_after_json_is_raw()
{
    const char* msg = "{\"a\":1},\"x\":2";
    TEST_ASSERT_TRUE(table.record("Bad OG", kNow, msg, strlen(msg)));
    TEST_ASSERT_TRUE(table.snapshot("Bad OG", view));
    TEST_ASSERT_FALSE(view.structured);
    TEST_ASSERT_EQUAL_STRING(msg, view.payload);

    const char* twice = "[1] [2]";
    TEST_ASSERT_TRUE(table.record("Bad OG", kNow, twice, strlen(twice)));
    TEST_ASSERT_TRUE(table.snapshot("Bad OG", view));
    TEST_ASSERT_FALSE(view.structured);

    const char* scalar = "21.5";
    TEST_ASSERT_TRUE(table.record("Bad OG", kNow, scalar, strlen(scalar)));
    TEST_ASSERT_TRUE(table.snapshot("Bad OG", view));
    TEST_ASSERT_FALSE(view.structured);
    TEST_ASSERT_EQUAL_STRING(scalar, view.payload);
}

void test_structured_payload_is_stored_compact()
{
    const char* msg = "  { \"mode\" : \"heat\",\n \"note\": \"a } b\" }\r\n";
    TEST_ASSERT_TRUE(table.record("Dusche", kNow, msg, strlen(msg)));
    TEST_ASSERT_TRUE(table.snapshot("Dusche", view));
    TEST_ASSERT_TRUE(view.structured);
    TEST_ASSERT_EQUAL_STRING("{\"mode\":\"heat\",\"note\":\"a } b\"}", view.payload);
}

void test_valid_object_larger_than_static_pool_is_structured()
{
    // 150 members need more slots than LIVENESS_DOC_CAPACITY holds.
    static char msg[LIVENESS_PAYLOAD_MAX];
    size_t pos = 0;
    msg[pos++] = '{';
    for (int i = 0; i < 150; ++i) {
        pos += (size_t)snprintf(msg + pos, sizeof(msg) - pos, "%s\"k%d\":0", i ? "," : "", i);
    }
    msg[pos++] = '}';
    msg[pos] = '\0';
    TEST_ASSERT_TRUE(pos < LIVENESS_PAYLOAD_MAX);

    TEST_ASSERT_TRUE(table.record("Bad OG", kNow, msg, pos));
    TEST_ASSERT_TRUE(table.snapshot("Bad OG", view));
    TEST_ASSERT_FALSE(view.truncated);
    TEST_ASSERT_TRUE(view.structured);
    TEST_ASSERT_EQUAL_STRING(msg, view.payload);
}

void test_payload_limit_is_per_table()
{
    LivenessTable small(16);
    TEST_ASSERT_EQUAL_UINT32(16, (uint32_t)small.payloadLimit());
    TEST_ASSERT_TRUE(small.addDevice("Bad OG"));

    const char* fits = "{\"a\":\"123456\"}";
    TEST_ASSERT_TRUE(small.record("Bad OG", kNow, fits, strlen(fits)));
    TEST_ASSERT_TRUE(small.snapshot("Bad OG", view));
    TEST_ASSERT_TRUE(view.structured);

    const char* over = "{\"a\":\"12345678\"}";
    TEST_ASSERT_TRUE(small.record("Bad OG", kNow, over, strlen(over)));
    TEST_ASSERT_TRUE(small.snapshot("Bad OG", view));
    TEST_ASSERT_TRUE(view.truncated);
    TEST_ASSERT_FALSE(view.structured);
    TEST_ASSERT_EQUAL_UINT32(15, (uint32_t)strlen(view.payload));

    LivenessTable clamped(LIVENESS_PAYLOAD_MAX * 2);
    TEST_ASSERT_EQUAL_UINT32(LIVENESS_PAYLOAD_MAX, (uint32_t)clamped.payloadLimit());
}

void test_reset_seen_keeps_devices()
{
    TEST_ASSERT_TRUE(table.record("Bad OG", kNow, "{}", 2));
    TEST_ASSERT_EQUAL_UINT8(1, table.seenCount());
    table.resetSeen();
    TEST_ASSERT_EQUAL_UINT8(0, table.seenCount());
    TEST_ASSERT_EQUAL_UINT8(2, table.count());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_never_seen_snapshot_is_empty);
    RUN_TEST(test_structured_payload_is_recorded);
    RUN_TEST(test_undecodable_payload_is_kept_raw);
    RUN_TEST(test_unknown_device_is_not_recorded);
    RUN_TEST(test_staleness_boundary);
    RUN_TEST(test_never_seen_is_always_stale);
    RUN_TEST(test_oversized_payload_is_truncated_raw);
    RUN_TEST(test_trailing_text_after_json_is_raw);
    RUN_TEST(test_structured_payload_is_stored_compact);
    RUN_TEST(test_valid_object_larger_than_static_pool_is_structured);
    RUN_TEST(test_payload_limit_is_per_table);
    RUN_TEST(test_reset_seen_keeps_devices);
    return UNITY_END();
}
