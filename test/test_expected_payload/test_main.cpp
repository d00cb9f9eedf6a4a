#include <unity.h>
#include <string.h>

#include "Domain/ThermostatDefaults.h"
#include "Modules/ThermostatModule/ExpectedPayload.h"
#include "Modules/ThermostatModule/ThermostatInventory.h"

static ThermostatInventory inventory;
static StaticJsonDocument<EXPECTED_PAYLOAD_CAPACITY> payload;

static TopicLayout defaultLayout()
{
    TopicLayout layout;
    layout.baseTopic = ThermoDefaults::DeviceBaseTopic;
    layout.displaySuffix = ThermoDefaults::DisplaySuffix;
    return layout;
}

void setUp()
{
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(inventory.load(ThermoDefaults::InventoryJson, err));
}

void tearDown() {}

void test_resolve_known_and_unknown_types()
{
    ErrorCode err = ErrorCode::Failed;
    const TypeProfile* p = inventory.types().resolve("TR-M3Z", err);
    TEST_ASSERT_NOT_NULL(p);
    TEST_ASSERT_EQUAL_STRING("schedule", p->scheduleKeyPrefix);

    TEST_ASSERT_NULL(inventory.types().resolve("NOPE", err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::UnknownType, (int)err);
}

void test_bad_og_payload_has_weekdays_and_mode_fields()
{
    const DeviceConfig* dev = inventory.findDevice("Bad OG");
    TEST_ASSERT_NOT_NULL(dev);

    char topic[96];
    char schedule[128];
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(buildExpectedPayload(*dev, inventory.types(), defaultLayout(), payload,
                                          topic, sizeof(topic), schedule, sizeof(schedule), err));

    TEST_ASSERT_EQUAL_STRING("zigbee2mqtt/Bad OG Thermostat/set", topic);
    TEST_ASSERT_EQUAL_STRING("00:00/19 05:00/21 09:30/21 14:00/21 18:30/21 23:00/19", schedule);

    JsonObjectConst obj = payload.as<JsonObjectConst>();
    TEST_ASSERT_EQUAL_UINT32(10, obj.size());
    for (uint8_t d = 0; d < 7; ++d) {
        char key[32];
        snprintf(key, sizeof(key), "schedule_%s", kWeekdayNames[d]);
        TEST_ASSERT_TRUE(obj.containsKey(key));
        TEST_ASSERT_EQUAL_STRING(schedule, obj[key].as<const char*>());
    }
    TEST_ASSERT_EQUAL_FLOAT(0.5f, obj["temperature_sensitivity"].as<float>());
    TEST_ASSERT_EQUAL_STRING("heat", obj["system_mode"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("schedule", obj["preset"].as<const char*>());
}

void test_custom_prefix_is_used()
{
    ThermostatInventory custom;
    const char* json =
        "{\"types\":{\"X\":{\"mode_fields\":{\"mode\":\"prog\"},\"schedule_key_prefix\":\"program\"}},"
        "\"devices\":{\"Hall\":{\"day_time\":\"06:00\",\"day_temperature\":20.5,\"night_time\":\"22:00\",\"night_temperature\":17,\"type\":\"X\"}}}";
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(custom.load(json, err));

    char topic[96];
    TEST_ASSERT_TRUE(buildExpectedPayload(*custom.findDevice("Hall"), custom.types(), defaultLayout(), payload,
                                          topic, sizeof(topic), nullptr, 0, err));
    TEST_ASSERT_TRUE(payload.containsKey("program_sunday"));
    TEST_ASSERT_FALSE(payload.containsKey("schedule_sunday"));
    TEST_ASSERT_EQUAL_STRING("00:00/17 06:00/20.5 10:00/20.5 14:00/20.5 18:00/20.5 22:00/17",
                             payload["program_monday"].as<const char*>());
}

void test_unknown_type_propagates()
{
    DeviceConfig dev;
    strcpy(dev.name, "Orphan");
    strcpy(dev.type, "Missing");
    dev.dayMinute = 360;
    dev.nightMinute = 1320;

    char topic[96];
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(buildExpectedPayload(dev, inventory.types(), defaultLayout(), payload,
                                           topic, sizeof(topic), nullptr, 0, err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::UnknownType, (int)err);
}

void test_state_topic_has_no_tail()
{
    char topic[96];
    TEST_ASSERT_TRUE(formatDeviceTopic(defaultLayout(), "WC OG", nullptr, topic, sizeof(topic)));
    TEST_ASSERT_EQUAL_STRING("zigbee2mqtt/WC OG Thermostat", topic);

    char tiny[8];
    TEST_ASSERT_FALSE(formatDeviceTopic(defaultLayout(), "WC OG", "set", tiny, sizeof(tiny)));
}

void test_mode_fields_filling_the_buffer_are_kept()
{
    // {"m":"<n x>"} serializes to n + 8 characters.
    const size_t fill = TYPE_MODE_FIELDS_MAX - 1 - 8;
    static char value[TYPE_MODE_FIELDS_MAX + 1];

    StaticJsonDocument<512> fields;
    TypeProfileRegistry reg;
    ErrorCode err = ErrorCode::Failed;

    memset(value, 'x', fill);
    value[fill] = '\0';
    fields["m"] = (const char*)value;
    TEST_ASSERT_EQUAL_UINT32(TYPE_MODE_FIELDS_MAX - 1, (uint32_t)measureJson(fields));
    TEST_ASSERT_TRUE(reg.add("FULL", fields.as<JsonObjectConst>(), nullptr, err));
    const TypeProfile* p = reg.resolve("FULL", err);
    TEST_ASSERT_NOT_NULL(p);
    TEST_ASSERT_EQUAL_UINT32(TYPE_MODE_FIELDS_MAX - 1, (uint32_t)strlen(p->modeFields));
    TEST_ASSERT_EQUAL_INT('}', p->modeFields[TYPE_MODE_FIELDS_MAX - 2]);

    memset(value, 'x', fill + 1);
    value[fill + 1] = '\0';
    err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(reg.add("OVER", fields.as<JsonObjectConst>(), nullptr, err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BufferTooSmall, (int)err);
    TEST_ASSERT_EQUAL_UINT8(1, reg.count());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_resolve_known_and_unknown_types);
    RUN_TEST(test_bad_og_payload_has_weekdays_and_mode_fields);
    RUN_TEST(test_custom_prefix_is_used);
    RUN_TEST(test_unknown_type_propagates);
    RUN_TEST(test_state_topic_has_no_tail);
    RUN_TEST(test_mode_fields_filling_the_buffer_are_kept);
    return UNITY_END();
}
