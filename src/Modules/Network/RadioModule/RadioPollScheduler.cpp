/**
 * @file RadioPollScheduler.cpp
 * @brief Implementation file.
 */

#include "Modules/Network/RadioModule/RadioPollScheduler.h"
#include "Domain/RadioDefaults.h"

namespace {

uint32_t clampInterval(uint32_t sec)
{
    return (sec > RadioDefaults::MaxIntervalSec) ? RadioDefaults::MaxIntervalSec : sec;
}

}  // namespace

const char* radioPollActionName(RadioPollAction a)
{
    switch (a) {
        case RadioPollAction::None: return "none";
        case RadioPollAction::Discover: return "discover";
        case RadioPollAction::StatusRefresh: return "status";
        case RadioPollAction::FullRefresh: return "full";
        default: return "?";
    }
}

void RadioPollScheduler::setTimerSec(uint32_t sec)
{
    timerSec_ = clampInterval(sec);
}

void RadioPollScheduler::setFullUpdateSec(uint32_t sec)
{
    fullUpdateSec_ = clampInterval(sec);
}

bool RadioPollScheduler::schedule(uint32_t atMs, bool force)
{
    if (armed_ && !force && (int32_t)(nextWakeMs_ - atMs) <= 0) return false;
    nextWakeMs_ = atMs;
    armed_ = true;
    return true;
}

bool RadioPollScheduler::due(uint32_t nowMs) const
{
    return armed_ && (int32_t)(nowMs - nextWakeMs_) >= 0;
}

void RadioPollScheduler::retime(uint32_t timerSec, uint32_t nowMs)
{
    setTimerSec(timerSec);
    if (timerSec_ == 0) {
        cancel();
        return;
    }
    schedule(nowMs + timerSec_ * 1000UL, false);
}

void RadioPollScheduler::rearmAfterTick(uint32_t nowMs)
{
    armed_ = false;
    if (timerSec_ > 0) schedule(nowMs + timerSec_ * 1000UL, true);
}

RadioPollAction RadioPollScheduler::decide(RadioStatus status, uint32_t nowMs)
{
    switch (status) {
        case RadioStatus::Offline:
            return RadioPollAction::Discover;
        case RadioStatus::On:
        case RadioStatus::Online:
            if (fullUpdateSec_ > 0 &&
                (!hasFull_ || (uint32_t)(nowMs - lastFullMs_) >= fullUpdateSec_ * 1000UL)) {
                markFullRefresh(nowMs);
                return RadioPollAction::FullRefresh;
            }
            return RadioPollAction::StatusRefresh;
        case RadioStatus::Off:
        case RadioStatus::HostError:
        default:
            return RadioPollAction::None;
    }
}

void RadioPollScheduler::markFullRefresh(uint32_t nowMs)
{
    lastFullMs_ = nowMs;
    hasFull_ = true;
}

bool RadioPollScheduler::peerDead(const RadioStateMachine& sm, uint32_t nowMs)
{
    return sm.hasAck() && (uint32_t)(nowMs - sm.lastAckMs()) > RadioDefaults::DeadPeerMs;
}
