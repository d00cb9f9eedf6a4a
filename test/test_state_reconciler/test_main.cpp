#include <unity.h>
#include <string.h>

#include "Domain/ThermostatDefaults.h"
#include "Modules/ThermostatModule/ExpectedPayload.h"
#include "Modules/ThermostatModule/StateReconciler.h"
#include "Modules/ThermostatModule/ThermostatInventory.h"

static StaticJsonDocument<2048> expectedDoc;
static StaticJsonDocument<2048> reportedDoc;
static StateReconciler reconciler;

static void load(const char* expected, const char* reported)
{
    expectedDoc.clear();
    reportedDoc.clear();
    TEST_ASSERT_FALSE(deserializeJson(expectedDoc, expected));
    TEST_ASSERT_FALSE(deserializeJson(reportedDoc, reported));
}

void test_numeric_tolerance()
{
    MismatchReport report;
    load("{\"t\":21.0}", "{\"t\":\"21.0000005\"}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_TRUE(report.empty());

    load("{\"t\":21.0}", "{\"t\":22.0}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_EQUAL_UINT8(1, report.count);
    TEST_ASSERT_EQUAL_STRING("t", report.entries[0].key);
    TEST_ASSERT_TRUE(report.entries[0].reportedPresent);
    TEST_ASSERT_EQUAL_FLOAT(22.0f, report.entries[0].reported.as<float>());
}

void test_schedule_tokens_compare_canonically()
{
    MismatchReport report;
    load("{\"s\":\"06:00/21.0\"}", "{\"s\":\"06:00/21\"}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_TRUE(report.empty());

    load("{\"s\":\"06:00/21\"}", "{\"s\":\"06:30/21\"}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_EQUAL_UINT8(1, report.count);

    load("{\"s\":\"00:00/19 06:00/21\"}", "{\"s\":\"00:00/19\"}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_EQUAL_UINT8(1, report.count);
}

void test_text_whitespace_is_collapsed()
{
    MismatchReport report;
    load("{\"m\":\"heat  mode\"}", "{\"m\":\" heat mode \"}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_TRUE(report.empty());

    load("{\"m\":\"heat\"}", "{\"m\":\"auto\"}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_EQUAL_UINT8(1, report.count);
}

void test_strict_fallback_for_booleans_and_null()
{
    MismatchReport report;
    load("{\"b\":true,\"n\":null}", "{\"b\":true,\"n\":null}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_TRUE(report.empty());

    load("{\"b\":true}", "{\"b\":false}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_EQUAL_UINT8(1, report.count);
}

void test_missing_keys_sorted_and_extra_keys_ignored()
{
    MismatchReport report;
    load("{\"zeta\":1,\"alpha\":2,\"mid\":3}", "{\"mid\":3,\"extra\":9}");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_EQUAL_UINT8(2, report.count);
    TEST_ASSERT_EQUAL_STRING("alpha", report.entries[0].key);
    TEST_ASSERT_EQUAL_STRING("zeta", report.entries[1].key);
    TEST_ASSERT_FALSE(report.entries[0].reportedPresent);
}

void test_unstructured_report_marks_everything_absent()
{
    MismatchReport report;
    load("{\"a\":1,\"b\":\"x\"}", "\"offline\"");
    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
    TEST_ASSERT_EQUAL_UINT8(2, report.count);
    TEST_ASSERT_FALSE(report.entries[0].reportedPresent);
    TEST_ASSERT_FALSE(report.entries[1].reportedPresent);

    reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), JsonVariantConst(), report);
    TEST_ASSERT_EQUAL_UINT8(2, report.count);
}

void test_expected_payload_matches_itself()
{
    ThermostatInventory inventory;
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(inventory.load(ThermoDefaults::InventoryJson, err));

    TopicLayout layout;
    layout.baseTopic = ThermoDefaults::DeviceBaseTopic;
    layout.displaySuffix = ThermoDefaults::DisplaySuffix;

    char topic[96];
    for (uint8_t i = 0; i < inventory.deviceCount(); ++i) {
        TEST_ASSERT_TRUE(buildExpectedPayload(*inventory.device(i), inventory.types(), layout, expectedDoc,
                                              topic, sizeof(topic), nullptr, 0, err));
        reportedDoc.set(expectedDoc);

        MismatchReport report;
        reconciler.reconcile(expectedDoc.as<JsonObjectConst>(), reportedDoc.as<JsonVariantConst>(), report);
        TEST_ASSERT_TRUE(report.empty());
    }
}

void test_battery_annotation()
{
    char text[32];

    load("{}", "{\"battery_low\":true,\"battery\":80}");
    BatteryAnnotation b = StateReconciler::annotateBattery(reportedDoc.as<JsonVariantConst>(), 20.0f);
    TEST_ASSERT_EQUAL_INT((int)BatteryStatus::Low, (int)b.status);
    TEST_ASSERT_TRUE(StateReconciler::formatBattery(b, text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("battery low", text);

    load("{}", "{\"battery\":12}");
    b = StateReconciler::annotateBattery(reportedDoc.as<JsonVariantConst>(), 20.0f);
    TEST_ASSERT_EQUAL_INT((int)BatteryStatus::Level, (int)b.status);
    TEST_ASSERT_TRUE(StateReconciler::formatBattery(b, text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("battery 12", text);

    load("{}", "{\"battery\":55,\"battery_low\":false}");
    b = StateReconciler::annotateBattery(reportedDoc.as<JsonVariantConst>(), 20.0f);
    TEST_ASSERT_EQUAL_INT((int)BatteryStatus::None, (int)b.status);

    load("{}", "{\"local_temperature\":20}");
    b = StateReconciler::annotateBattery(reportedDoc.as<JsonVariantConst>(), 20.0f);
    TEST_ASSERT_EQUAL_INT((int)BatteryStatus::Unknown, (int)b.status);
    TEST_ASSERT_TRUE(StateReconciler::formatBattery(b, text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("battery unknown", text);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_numeric_tolerance);
    RUN_TEST(test_schedule_tokens_compare_canonically);
    RUN_TEST(test_text_whitespace_is_collapsed);
    RUN_TEST(test_strict_fallback_for_booleans_and_null);
    RUN_TEST(test_missing_keys_sorted_and_extra_keys_ignored);
    RUN_TEST(test_unstructured_report_marks_everything_absent);
    RUN_TEST(test_expected_payload_matches_itself);
    RUN_TEST(test_battery_annotation);
    return UNITY_END();
}
