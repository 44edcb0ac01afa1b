#include <unity.h>
#include <string.h>

#include "Modules/Network/RadioModule/RadioFrame.h"

static bool parseText(RadioFrame& f, const char* text)
{
    return f.parse(text, strlen(text));
}

void test_parse_splits_key_value_lines()
{
    RadioFrame f;
    TEST_ASSERT_TRUE(parseText(f, "RESPONSE:ACK\r\nCOMMAND:GET\r\nID:flowradio\r\n"));
    TEST_ASSERT_EQUAL_UINT8(3, f.count());
    TEST_ASSERT_EQUAL_STRING("ACK", f.get("RESPONSE"));
    TEST_ASSERT_EQUAL_STRING("GET", f.get("COMMAND"));
    TEST_ASSERT_TRUE(f.is("ID", "flowradio"));
    TEST_ASSERT_NULL(f.get("EVENT"));
}

void test_bare_line_is_stored_under_underscore()
{
    RadioFrame f;
    TEST_ASSERT_TRUE(parseText(f, "RESPONSE:ACK\nCOMMAND:GET\nPOWER_STATUS\nPOWER:ON\n"));
    TEST_ASSERT_EQUAL_STRING("POWER_STATUS", f.get(RADIO_BARE_KEY));
    TEST_ASSERT_EQUAL_STRING("ON", f.get("POWER"));
}

void test_repeated_keys_get_numbered_suffixes()
{
    RadioFrame f;
    TEST_ASSERT_TRUE(parseText(f, "NAME:Jazz\rURL:http://a\rNAME:Rock\rURL:http://b\rNAME:Pop\r"));
    TEST_ASSERT_EQUAL_STRING("Jazz", f.get("NAME"));
    TEST_ASSERT_EQUAL_STRING("Rock", f.get("NAME_1"));
    TEST_ASSERT_EQUAL_STRING("Pop", f.get("NAME_2"));
    TEST_ASSERT_EQUAL_STRING("http://b", f.get("URL_1"));
}

void test_value_keeps_everything_after_first_colon()
{
    RadioFrame f;
    TEST_ASSERT_TRUE(parseText(f, "URL:http://host:8000/stream\r\n"));
    TEST_ASSERT_EQUAL_STRING("http://host:8000/stream", f.get("URL"));
}

void test_line_without_value_is_a_bare_line()
{
    RadioFrame f;
    TEST_ASSERT_TRUE(parseText(f, "VOLUME:\r\n:orphan\r\n"));
    TEST_ASSERT_EQUAL_STRING("VOLUME:", f.get("_"));
    TEST_ASSERT_EQUAL_STRING(":orphan", f.get("__1"));
}

void test_empty_datagram_is_rejected()
{
    RadioFrame f;
    TEST_ASSERT_FALSE(f.parse("", 0));
    TEST_ASSERT_FALSE(parseText(f, "\r\n\r\n"));
    TEST_ASSERT_EQUAL_UINT8(0, f.count());
}

void test_build_command_layout()
{
    char out[128];
    const char* params[] = {"POWER_STATUS"};
    const size_t n = buildRadioCommand(out, sizeof(out), "GET", params, 1, "flowradio");
    TEST_ASSERT_EQUAL_STRING("COMMAND:GET\r\nPOWER_STATUS\r\nID:flowradio\r\n\r\n", out);
    TEST_ASSERT_EQUAL_UINT32(strlen(out), n);
}

void test_build_command_with_empty_param_line()
{
    char out[128];
    const char* params[] = {""};
    TEST_ASSERT_TRUE(buildRadioCommand(out, sizeof(out), "DISCOVER", params, 1, "id") > 0);
    TEST_ASSERT_EQUAL_STRING("COMMAND:DISCOVER\r\n\r\nID:id\r\n\r\n", out);
}

void test_build_command_too_small_returns_zero()
{
    char out[16];
    const char* params[] = {"PLAYING_MODE"};
    TEST_ASSERT_EQUAL_UINT32(0, buildRadioCommand(out, sizeof(out), "GET", params, 1, "flowradio"));
    TEST_ASSERT_EQUAL_STRING("", out);
}

void test_built_command_parses_back()
{
    char out[256];
    const char* params[] = {"TUNEIN_PLAY", "URL:http://x/y", "TEXT:Jazz"};
    const size_t n = buildRadioCommand(out, sizeof(out), "PLAY", params, 3, "flowradio");
    RadioFrame f;
    TEST_ASSERT_TRUE(f.parse(out, n));
    TEST_ASSERT_EQUAL_STRING("PLAY", f.get("COMMAND"));
    TEST_ASSERT_EQUAL_STRING("TUNEIN_PLAY", f.get("_"));
    TEST_ASSERT_EQUAL_STRING("http://x/y", f.get("URL"));
    TEST_ASSERT_EQUAL_STRING("Jazz", f.get("TEXT"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_parse_splits_key_value_lines);
    RUN_TEST(test_bare_line_is_stored_under_underscore);
    RUN_TEST(test_repeated_keys_get_numbered_suffixes);
    RUN_TEST(test_value_keeps_everything_after_first_colon);
    RUN_TEST(test_line_without_value_is_a_bare_line);
    RUN_TEST(test_empty_datagram_is_rejected);
    RUN_TEST(test_build_command_layout);
    RUN_TEST(test_build_command_with_empty_param_line);
    RUN_TEST(test_build_command_too_small_returns_zero);
    RUN_TEST(test_built_command_parses_back);
    return UNITY_END();
}
