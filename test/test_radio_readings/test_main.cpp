#include <unity.h>
#include <string.h>

#include "Modules/Network/RadioModule/RadioReadings.h"

struct SinkLog {
    uint32_t calls;
    uint64_t lastMask;
};

static void recordSink(void* ctx, uint64_t mask)
{
    SinkLog* log = static_cast<SinkLog*>(ctx);
    ++log->calls;
    log->lastMask = mask;
}

static SinkLog gLog{};
static RadioReadings gReadings;

void setUp()
{
    gLog = SinkLog{};
    gReadings.reset();
    gReadings.setSink(RadioReadingsSink{recordSink, &gLog});
}

void tearDown() {}

void test_unset_and_empty_are_distinct()
{
    TEST_ASSERT_FALSE(gReadings.isSet(RadioReading::DeviceName));
    TEST_ASSERT_TRUE(gReadings.updateIfChanged(RadioReading::DeviceName, ""));
    TEST_ASSERT_TRUE(gReadings.isSet(RadioReading::DeviceName));
    TEST_ASSERT_EQUAL_STRING("", gReadings.get(RadioReading::DeviceName));
    TEST_ASSERT_TRUE(gReadings.updateIfChanged(RadioReading::DeviceName, (const char*)nullptr));
    TEST_ASSERT_NULL(gReadings.get(RadioReading::DeviceName));
    TEST_ASSERT_FALSE(gReadings.updateIfChanged(RadioReading::DeviceName, (const char*)nullptr));
}

void test_equal_write_is_noop()
{
    TEST_ASSERT_TRUE(gReadings.updateIfChanged(RadioReading::Power, "on", true));
    TEST_ASSERT_EQUAL_UINT32(1, gLog.calls);
    TEST_ASSERT_FALSE(gReadings.updateIfChanged(RadioReading::Power, "on", true));
    TEST_ASSERT_EQUAL_UINT32(1, gLog.calls);
}

void test_immediate_update_notifies_its_bit()
{
    gReadings.updateIfChanged(RadioReading::Volume, (int32_t)12, true);
    TEST_ASSERT_EQUAL_UINT32(1, gLog.calls);
    TEST_ASSERT_EQUAL_UINT64(radioReadingBit(RadioReading::Volume), gLog.lastMask);
    int32_t v = 0;
    TEST_ASSERT_TRUE(gReadings.getInt(RadioReading::Volume, v));
    TEST_ASSERT_EQUAL_INT32(12, v);
}

void test_batch_notifies_once()
{
    gReadings.beginBatch();
    gReadings.updateIfChanged(RadioReading::Power, "on", true);
    gReadings.updateIfChanged(RadioReading::Volume, "7", true);
    gReadings.updateIfChanged(RadioReading::Mute, "off");
    TEST_ASSERT_EQUAL_UINT32(0, gLog.calls);
    gReadings.endBatch(true);

    TEST_ASSERT_EQUAL_UINT32(1, gLog.calls);
    const uint64_t expected = radioReadingBit(RadioReading::Power) |
                              radioReadingBit(RadioReading::Volume) |
                              radioReadingBit(RadioReading::Mute);
    TEST_ASSERT_EQUAL_UINT64(expected, gLog.lastMask);
}

void test_unchanged_batch_is_silent()
{
    gReadings.beginBatch();
    gReadings.endBatch(false);
    TEST_ASSERT_EQUAL_UINT32(0, gLog.calls);
}

void test_silent_changes_ride_with_next_notification()
{
    gReadings.beginBatch();
    gReadings.updateIfChanged(RadioReading::Volume, "12");
    gReadings.endBatch(false);
    TEST_ASSERT_EQUAL_UINT32(0, gLog.calls);
    TEST_ASSERT_EQUAL_UINT64(radioReadingBit(RadioReading::Volume), gReadings.pendingMask());

    gReadings.updateIfChanged(RadioReading::Power, "off", true);
    TEST_ASSERT_EQUAL_UINT32(1, gLog.calls);
    TEST_ASSERT_EQUAL_UINT64(radioReadingBit(RadioReading::Volume) | radioReadingBit(RadioReading::Power),
                             gLog.lastMask);
    TEST_ASSERT_EQUAL_UINT64(0, gReadings.pendingMask());
}

void test_nested_batch_notifies_at_outer_end()
{
    gReadings.beginBatch();
    gReadings.beginBatch();
    gReadings.updateIfChanged(RadioReading::PlayMode, "radio");
    gReadings.endBatch(true);
    TEST_ASSERT_EQUAL_UINT32(0, gLog.calls);
    gReadings.endBatch(false);
    TEST_ASSERT_EQUAL_UINT32(1, gLog.calls);
}

void test_oversized_value_is_truncated_and_stable()
{
    char big[Limits::Radio::ReadingValueLen + 20];
    memset(big, 'x', sizeof(big) - 1);
    big[sizeof(big) - 1] = '\0';
    TEST_ASSERT_TRUE(gReadings.updateIfChanged(RadioReading::PlayUrl, big));
    TEST_ASSERT_EQUAL_UINT32(Limits::Radio::ReadingValueLen - 1, strlen(gReadings.get(RadioReading::PlayUrl)));
    TEST_ASSERT_FALSE(gReadings.updateIfChanged(RadioReading::PlayUrl, big));
}

void test_get_int_rejects_non_numeric()
{
    int32_t v = 99;
    gReadings.updateIfChanged(RadioReading::PlayStation, "3a");
    TEST_ASSERT_FALSE(gReadings.getInt(RadioReading::PlayStation, v));
    TEST_ASSERT_FALSE(gReadings.getInt(RadioReading::Volume, v));
    TEST_ASSERT_EQUAL_INT32(99, v);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_unset_and_empty_are_distinct);
    RUN_TEST(test_equal_write_is_noop);
    RUN_TEST(test_immediate_update_notifies_its_bit);
    RUN_TEST(test_batch_notifies_once);
    RUN_TEST(test_unchanged_batch_is_silent);
    RUN_TEST(test_silent_changes_ride_with_next_notification);
    RUN_TEST(test_nested_batch_notifies_at_outer_end);
    RUN_TEST(test_oversized_value_is_truncated_and_stable);
    RUN_TEST(test_get_int_rejects_non_numeric);
    return UNITY_END();
}
