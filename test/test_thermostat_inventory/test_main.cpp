#include <unity.h>
#include <string.h>

#include "Domain/ThermostatDefaults.h"
#include "Modules/ThermostatModule/ThermostatInventory.h"

static ThermostatInventory inventory;

void test_builtin_inventory_loads_all_devices()
{
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(inventory.load(ThermoDefaults::InventoryJson, err));
    TEST_ASSERT_EQUAL_UINT8(4, inventory.types().count());
    TEST_ASSERT_EQUAL_UINT8(10, inventory.deviceCount());
    TEST_ASSERT_EQUAL_UINT8(10, inventory.validCount());
    TEST_ASSERT_EQUAL_UINT8(0, inventory.rejectedTypes());

    const DeviceConfig* bad = inventory.findDevice("Bad OG");
    TEST_ASSERT_NOT_NULL(bad);
    TEST_ASSERT_EQUAL_STRING("VNTH-T2_v2", bad->type);
    TEST_ASSERT_EQUAL_UINT16(300, bad->dayMinute);
    TEST_ASSERT_EQUAL_UINT16(1380, bad->nightMinute);
    TEST_ASSERT_EQUAL_FLOAT(21.0f, bad->dayTemperature);
    TEST_ASSERT_EQUAL_FLOAT(19.0f, bad->nightTemperature);

    TEST_ASSERT_NOT_NULL(inventory.findDevice("Waschk\xc3\xbc" "che"));
}

void test_bad_device_does_not_block_others()
{
    const char* json =
        "{\"types\":{\"A\":{\"mode_fields\":{\"system_mode\":\"auto\"}}},"
        "\"devices\":{"
        "\"ok\":{\"day_time\":\"06:00\",\"day_temperature\":21,\"night_time\":\"22:00\",\"night_temperature\":18,\"type\":\"A\"},"
        "\"same\":{\"day_time\":\"06:00\",\"day_temperature\":21,\"night_time\":\"06:00\",\"night_temperature\":18,\"type\":\"A\"},"
        "\"badtime\":{\"day_time\":\"6h\",\"day_temperature\":21,\"night_time\":\"22:00\",\"night_temperature\":18,\"type\":\"A\"},"
        "\"ghost\":{\"day_time\":\"06:00\",\"day_temperature\":21,\"night_time\":\"22:00\",\"night_temperature\":18,\"type\":\"Z\"}"
        "}}";

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(inventory.load(json, err));
    TEST_ASSERT_EQUAL_UINT8(4, inventory.deviceCount());
    TEST_ASSERT_EQUAL_UINT8(1, inventory.validCount());

    TEST_ASSERT_TRUE(inventory.findDevice("ok")->valid);
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidConfig, (int)inventory.findDevice("same")->error);
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::ParseError, (int)inventory.findDevice("badtime")->error);
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::UnknownType, (int)inventory.findDevice("ghost")->error);
}

void test_empty_mode_fields_rejects_type()
{
    const char* json =
        "{\"types\":{\"E\":{\"mode_fields\":{}},\"N\":{\"mode_fields\":{\"x\":{\"nested\":1}}}},"
        "\"devices\":{\"d\":{\"day_time\":\"06:00\",\"day_temperature\":21,\"night_time\":\"22:00\",\"night_temperature\":18,\"type\":\"E\"}}}";

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(inventory.load(json, err));
    TEST_ASSERT_EQUAL_UINT8(0, inventory.types().count());
    TEST_ASSERT_EQUAL_UINT8(2, inventory.rejectedTypes());
    TEST_ASSERT_FALSE(inventory.findDevice("d")->valid);
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::UnknownType, (int)inventory.findDevice("d")->error);
}

void test_unusable_document_fails()
{
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(inventory.load("{not json", err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::ParseError, (int)err);

    err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(inventory.load("{\"devices\":{}}", err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidConfig, (int)err);
    TEST_ASSERT_EQUAL_UINT8(0, inventory.deviceCount());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_builtin_inventory_loads_all_devices);
    RUN_TEST(test_bad_device_does_not_block_others);
    RUN_TEST(test_empty_mode_fields_rejects_type);
    RUN_TEST(test_unusable_document_fails);
    return UNITY_END();
}
