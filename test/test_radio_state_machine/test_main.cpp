#include <unity.h>

#include "Modules/Network/RadioModule/RadioStateMachine.h"

void test_starts_offline_without_ack()
{
    RadioStateMachine sm;
    TEST_ASSERT_TRUE(sm.status() == RadioStatus::Offline);
    TEST_ASSERT_FALSE(sm.hasAck());
}

void test_online_from_offline_stamps_ack()
{
    RadioStateMachine sm;
    TEST_ASSERT_TRUE(sm.transition(RadioStatus::Online, 1000));
    TEST_ASSERT_TRUE(sm.status() == RadioStatus::Online);
    TEST_ASSERT_TRUE(sm.hasAck());
    TEST_ASSERT_EQUAL_UINT32(1000, sm.lastAckMs());
}

void test_online_never_hides_power_state()
{
    RadioStateMachine sm;
    sm.transition(RadioStatus::On, 0);
    TEST_ASSERT_FALSE(sm.transition(RadioStatus::Online, 5000));
    TEST_ASSERT_TRUE(sm.status() == RadioStatus::On);
    // Rejected, but the device did answer.
    TEST_ASSERT_EQUAL_UINT32(5000, sm.lastAckMs());

    sm.transition(RadioStatus::Off, 6000);
    TEST_ASSERT_FALSE(sm.transition(RadioStatus::Online, 7000));
    TEST_ASSERT_TRUE(sm.status() == RadioStatus::Off);
}

void test_host_error_only_leaves_to_offline()
{
    RadioStateMachine sm;
    TEST_ASSERT_TRUE(sm.transition(RadioStatus::HostError, 0));
    TEST_ASSERT_FALSE(sm.transition(RadioStatus::Online, 1));
    TEST_ASSERT_FALSE(sm.transition(RadioStatus::On, 2));
    TEST_ASSERT_TRUE(sm.status() == RadioStatus::HostError);
    TEST_ASSERT_TRUE(sm.transition(RadioStatus::Offline, 3));
    TEST_ASSERT_TRUE(sm.status() == RadioStatus::Offline);
}

void test_same_status_is_not_a_change()
{
    RadioStateMachine sm;
    sm.transition(RadioStatus::On, 0);
    TEST_ASSERT_FALSE(sm.transition(RadioStatus::On, 1));
}

void test_power_states_switch_freely()
{
    RadioStateMachine sm;
    TEST_ASSERT_TRUE(sm.transition(RadioStatus::Off, 0));
    TEST_ASSERT_TRUE(sm.transition(RadioStatus::On, 1));
    TEST_ASSERT_TRUE(sm.transition(RadioStatus::Offline, 2));
}

void test_reset_forgets_ack()
{
    RadioStateMachine sm;
    sm.transition(RadioStatus::Online, 10);
    sm.reset();
    TEST_ASSERT_TRUE(sm.status() == RadioStatus::Offline);
    TEST_ASSERT_FALSE(sm.hasAck());
}

void test_status_names()
{
    RadioStatus st;
    TEST_ASSERT_EQUAL_STRING("host_error", radioStatusName(RadioStatus::HostError));
    TEST_ASSERT_TRUE(radioStatusFromName("on", st));
    TEST_ASSERT_TRUE(st == RadioStatus::On);
    TEST_ASSERT_FALSE(radioStatusFromName("ON", st));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_starts_offline_without_ack);
    RUN_TEST(test_online_from_offline_stamps_ack);
    RUN_TEST(test_online_never_hides_power_state);
    RUN_TEST(test_host_error_only_leaves_to_offline);
    RUN_TEST(test_same_status_is_not_a_change);
    RUN_TEST(test_power_states_switch_freely);
    RUN_TEST(test_reset_forgets_ack);
    RUN_TEST(test_status_names);
    return UNITY_END();
}
