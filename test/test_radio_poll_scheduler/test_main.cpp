#include <unity.h>

#include "Modules/Network/RadioModule/RadioPollScheduler.h"

void test_decide_by_status()
{
    RadioPollScheduler s;
    s.setTimerSec(60);
    s.setFullUpdateSec(0);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::Offline, 0) == RadioPollAction::Discover);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::Online, 0) == RadioPollAction::StatusRefresh);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::On, 0) == RadioPollAction::StatusRefresh);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::Off, 0) == RadioPollAction::None);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::HostError, 0) == RadioPollAction::None);
}

void test_full_refresh_first_then_on_interval()
{
    RadioPollScheduler s;
    s.setFullUpdateSec(300);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::On, 1000) == RadioPollAction::FullRefresh);
    TEST_ASSERT_EQUAL_UINT32(1000, s.lastFullRefreshMs());
    TEST_ASSERT_TRUE(s.decide(RadioStatus::On, 61000) == RadioPollAction::StatusRefresh);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::On, 301000) == RadioPollAction::FullRefresh);
}

void test_mark_full_refresh_defers_next_one()
{
    RadioPollScheduler s;
    s.setFullUpdateSec(300);
    s.markFullRefresh(0);
    TEST_ASSERT_TRUE(s.decide(RadioStatus::Online, 60000) == RadioPollAction::StatusRefresh);
    s.resetFullRefresh();
    TEST_ASSERT_TRUE(s.decide(RadioStatus::Online, 60000) == RadioPollAction::FullRefresh);
}

void test_schedule_keeps_earlier_wakeup()
{
    RadioPollScheduler s;
    TEST_ASSERT_TRUE(s.schedule(5000, false));
    TEST_ASSERT_FALSE(s.schedule(9000, false));
    TEST_ASSERT_EQUAL_UINT32(5000, s.nextWakeMs());
    TEST_ASSERT_TRUE(s.schedule(2000, false));
    TEST_ASSERT_TRUE(s.schedule(9000, true));
    TEST_ASSERT_EQUAL_UINT32(9000, s.nextWakeMs());
}

void test_due_is_wrap_safe()
{
    RadioPollScheduler s;
    s.schedule(0xFFFFFF00UL + 0x200UL, true);  // wraps to 0x100
    TEST_ASSERT_FALSE(s.due(0xFFFFFF00UL));
    TEST_ASSERT_TRUE(s.due(0x100UL));
    TEST_ASSERT_TRUE(s.due(0x180UL));
}

void test_rearm_after_tick()
{
    RadioPollScheduler s;
    s.setTimerSec(60);
    s.schedule(0, true);
    s.rearmAfterTick(1000);
    TEST_ASSERT_TRUE(s.armed());
    TEST_ASSERT_EQUAL_UINT32(61000, s.nextWakeMs());

    s.setTimerSec(0);
    s.rearmAfterTick(2000);
    TEST_ASSERT_FALSE(s.armed());
}

void test_retime_only_tightens()
{
    RadioPollScheduler s;
    s.setTimerSec(60);
    s.schedule(60000, true);
    s.retime(10, 1000);
    TEST_ASSERT_EQUAL_UINT32(11000, s.nextWakeMs());
    s.retime(120, 2000);
    TEST_ASSERT_EQUAL_UINT32(11000, s.nextWakeMs());
    TEST_ASSERT_EQUAL_UINT32(120, s.timerSec());
    s.retime(0, 3000);
    TEST_ASSERT_FALSE(s.armed());
}

void test_intervals_are_clamped()
{
    RadioPollScheduler s;
    s.setTimerSec(0xFFFFFFFFUL);
    TEST_ASSERT_EQUAL_UINT32(RadioDefaults::MaxIntervalSec, s.timerSec());
}

void test_peer_dead_after_silence()
{
    RadioStateMachine sm;
    TEST_ASSERT_FALSE(RadioPollScheduler::peerDead(sm, 1000000));
    sm.transition(RadioStatus::Online, 1000);
    TEST_ASSERT_FALSE(RadioPollScheduler::peerDead(sm, 1000 + RadioDefaults::DeadPeerMs));
    TEST_ASSERT_TRUE(RadioPollScheduler::peerDead(sm, 1001 + RadioDefaults::DeadPeerMs));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_decide_by_status);
    RUN_TEST(test_full_refresh_first_then_on_interval);
    RUN_TEST(test_mark_full_refresh_defers_next_one);
    RUN_TEST(test_schedule_keeps_earlier_wakeup);
    RUN_TEST(test_due_is_wrap_safe);
    RUN_TEST(test_rearm_after_tick);
    RUN_TEST(test_retime_only_tightens);
    RUN_TEST(test_intervals_are_clamped);
    RUN_TEST(test_peer_dead_after_silence);
    return UNITY_END();
}
