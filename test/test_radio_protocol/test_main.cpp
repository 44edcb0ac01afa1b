#include <unity.h>
#include <string.h>

#include "Modules/Network/RadioModule/RadioAddress.h"
#include "Modules/Network/RadioModule/RadioProtocol.h"

void test_verbs_decode_closed_set()
{
    TEST_ASSERT_TRUE(radioVerbFromString("GET") == RadioVerb::Get);
    TEST_ASSERT_TRUE(radioVerbFromString("NOTIFICATION") == RadioVerb::Notification);
    TEST_ASSERT_TRUE(radioVerbFromString("DISCOVER") == RadioVerb::Discover);
    TEST_ASSERT_TRUE(radioVerbFromString("get") == RadioVerb::Unrecognized);
    TEST_ASSERT_TRUE(radioVerbFromString("REBOOT") == RadioVerb::Unrecognized);
    TEST_ASSERT_TRUE(radioVerbFromString(nullptr) == RadioVerb::Unrecognized);
}

void test_events_decode_closed_set()
{
    TEST_ASSERT_TRUE(radioEventFromString("VOLUME_CHANGED") == RadioEvent::VolumeChanged);
    TEST_ASSERT_TRUE(radioEventFromString("URL_IS_PLAYING") == RadioEvent::UrlIsPlaying);
    TEST_ASSERT_TRUE(radioEventFromString("ALARM_RINGING") == RadioEvent::Unrecognized);
    TEST_ASSERT_EQUAL_STRING("POWER_OFF", radioEventName(RadioEvent::PowerOff));
}

void test_set_actions_decode()
{
    TEST_ASSERT_TRUE(radioSetActionFromString("VOLUME_MUTE") == RadioSetAction::VolumeMute);
    TEST_ASSERT_TRUE(radioSetActionFromString("RADIO_ON") == RadioSetAction::RadioOn);
    TEST_ASSERT_TRUE(radioSetActionFromString("VOLUME_ABSOLUTE") == RadioSetAction::Unrecognized);
}

void test_reading_names_round_trip_by_name()
{
    RadioReading r;
    TEST_ASSERT_TRUE(radioReadingFromName("play_url_x", r));
    TEST_ASSERT_TRUE(r == RadioReading::PlayUrlX);
    TEST_ASSERT_EQUAL_STRING("station_8_url", radioReadingName(RadioReading::Station8Url));
    TEST_ASSERT_FALSE(radioReadingFromName("bogus", r));
}

void test_station_readings_pairs()
{
    RadioReading name;
    RadioReading url;
    TEST_ASSERT_TRUE(radioStationReadings(3, name, url));
    TEST_ASSERT_TRUE(name == RadioReading::Station3Name);
    TEST_ASSERT_TRUE(url == RadioReading::Station3Url);
    TEST_ASSERT_FALSE(radioStationReadings(0, name, url));
    TEST_ASSERT_FALSE(radioStationReadings(9, name, url));
}

void test_field_dictionary_is_block_scoped()
{
    RadioReading r;
    TEST_ASSERT_TRUE(radioLookupField("INFO_BLOCK", "NAME", r));
    TEST_ASSERT_TRUE(r == RadioReading::DeviceName);
    TEST_ASSERT_TRUE(radioLookupField("PLAYING_MODE", "NAME", r));
    TEST_ASSERT_TRUE(r == RadioReading::PlayStationName);
    TEST_ASSERT_TRUE(radioLookupField("ALL_STATION_INFO", "URL_7", r));
    TEST_ASSERT_TRUE(r == RadioReading::Station8Url);
    TEST_ASSERT_FALSE(radioLookupField("POWER_STATUS", "NAME", r));
    TEST_ASSERT_FALSE(radioLookupField("ALARM_STATUS", "ALARM", r));
}

void test_value_tables_translate_or_clear()
{
    TEST_ASSERT_EQUAL_STRING("on", radioTranslateValue(RadioReading::Power, "ON"));
    TEST_ASSERT_EQUAL_STRING("aux", radioTranslateValue(RadioReading::PlayMode, "AUX_IDCOCK"));
    TEST_ASSERT_NULL(radioTranslateValue(RadioReading::PlayMode, "BLUETOOTH"));
    TEST_ASSERT_EQUAL_STRING("Kitchen", radioTranslateValue(RadioReading::DeviceName, "Kitchen"));
}

void test_refresh_block_lists()
{
    TEST_ASSERT_EQUAL_UINT8(3, RADIO_STATUS_BLOCK_COUNT);
    TEST_ASSERT_TRUE(RADIO_FULL_BLOCK_COUNT > RADIO_STATUS_BLOCK_COUNT);
    for (uint8_t i = 0; i < RADIO_STATUS_BLOCK_COUNT; ++i) {
        TEST_ASSERT_EQUAL_STRING(RADIO_STATUS_BLOCKS[i], RADIO_FULL_BLOCKS[i]);
    }
}

void test_broadcast_replaces_last_octet()
{
    char out[16];
    TEST_ASSERT_TRUE(radioBroadcastFor("10.0.0.5", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("10.0.0.255", out);
    TEST_ASSERT_TRUE(radioBroadcastFor("192.168.178.42", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("192.168.178.255", out);
    TEST_ASSERT_FALSE(radioBroadcastFor("", out, sizeof(out)));
    TEST_ASSERT_FALSE(radioBroadcastFor("10.0.0.", out, sizeof(out)));
    TEST_ASSERT_FALSE(radioBroadcastFor("10.0.0.5", out, 8));
}

void test_discovery_ownership()
{
    TEST_ASSERT_TRUE(radioDiscoveryIsOurs(nullptr, nullptr, "10.0.0.9", "Any"));
    TEST_ASSERT_TRUE(radioDiscoveryIsOurs("", "", "10.0.0.9", "Any"));
    TEST_ASSERT_TRUE(radioDiscoveryIsOurs("10.0.0.5", nullptr, "10.0.0.5", nullptr));
    TEST_ASSERT_FALSE(radioDiscoveryIsOurs("10.0.0.5", nullptr, "10.0.0.6", "Radio1"));
    // DHCP moved the device: same name, new address.
    TEST_ASSERT_TRUE(radioDiscoveryIsOurs("10.0.0.5", "Radio1", "10.0.0.6", "Radio1"));
    TEST_ASSERT_FALSE(radioDiscoveryIsOurs("10.0.0.5", "Radio1", "10.0.0.6", "Radio2"));
}

void test_parse_ipv4()
{
    uint8_t ip[4];
    TEST_ASSERT_TRUE(radioParseIpv4("10.0.0.5", ip));
    TEST_ASSERT_EQUAL_UINT8(10, ip[0]);
    TEST_ASSERT_EQUAL_UINT8(5, ip[3]);
    TEST_ASSERT_FALSE(radioParseIpv4("256.0.0.1", ip));
    TEST_ASSERT_FALSE(radioParseIpv4("10.0.0", ip));
    TEST_ASSERT_FALSE(radioParseIpv4("radio.local", ip));
}

void test_split_play_url()
{
    char name[64];
    char url[128];
    TEST_ASSERT_TRUE(radioSplitPlayUrl("Jazz|http://jazz.example:8000/live", name, sizeof(name), url, sizeof(url)));
    TEST_ASSERT_EQUAL_STRING("Jazz", name);
    TEST_ASSERT_EQUAL_STRING("http://jazz.example:8000/live", url);

    TEST_ASSERT_TRUE(radioSplitPlayUrl("http://stream.example/mp3", name, sizeof(name), url, sizeof(url)));
    TEST_ASSERT_EQUAL_STRING("stream.example", name);

    TEST_ASSERT_FALSE(radioSplitPlayUrl("Jazz|", name, sizeof(name), url, sizeof(url)));
    TEST_ASSERT_FALSE(radioSplitPlayUrl("a|b|c", name, sizeof(name), url, sizeof(url)));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_verbs_decode_closed_set);
    RUN_TEST(test_events_decode_closed_set);
    RUN_TEST(test_set_actions_decode);
    RUN_TEST(test_reading_names_round_trip_by_name);
    RUN_TEST(test_station_readings_pairs);
    RUN_TEST(test_field_dictionary_is_block_scoped);
    RUN_TEST(test_value_tables_translate_or_clear);
    RUN_TEST(test_refresh_block_lists);
    RUN_TEST(test_broadcast_replaces_last_octet);
    RUN_TEST(test_discovery_ownership);
    RUN_TEST(test_parse_ipv4);
    RUN_TEST(test_split_play_url);
    return UNITY_END();
}
