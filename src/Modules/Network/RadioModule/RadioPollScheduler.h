#pragma once
/**
 * @file RadioPollScheduler.h
 * @brief Single repeating wake-up driving discovery, polling and dead-peer detection.
 *
 * Times are millis() values; all comparisons are wrap-safe.
 */

#include <stdint.h>

#include "Domain/RadioDefaults.h"
#include "Modules/Network/RadioModule/RadioStateMachine.h"

enum class RadioPollAction : uint8_t {
    None,
    Discover,
    StatusRefresh,
    FullRefresh
};

const char* radioPollActionName(RadioPollAction a);

class RadioPollScheduler {
public:
    /** @brief Intervals in seconds; 0 disables. Values are clamped to RadioDefaults::MaxIntervalSec. */
    void setTimerSec(uint32_t sec);
    void setFullUpdateSec(uint32_t sec);
    uint32_t timerSec() const { return timerSec_; }
    uint32_t fullUpdateSec() const { return fullUpdateSec_; }

    /**
     * @brief Arm the wake-up at `atMs`.
     *
     * Without `force`, an already armed wake-up that is earlier or equal wins
     * and the call is skipped.
     * @return true when the wake-up was (re)armed.
     */
    bool schedule(uint32_t atMs, bool force);
    void cancel() { armed_ = false; }
    bool armed() const { return armed_; }
    uint32_t nextWakeMs() const { return nextWakeMs_; }
    bool due(uint32_t nowMs) const;

    /**
     * @brief Apply a new poll interval: tightening takes effect now, loosening
     * waits for the natural rearm. 0 cancels the wake-up.
     */
    void retime(uint32_t timerSec, uint32_t nowMs);

    /** @brief Consume a due wake-up and rearm at `now + timer` when polling is enabled. */
    void rearmAfterTick(uint32_t nowMs);

    /**
     * @brief Poll action for `status` at `nowMs`. Stamps the full-refresh time
     * when it returns FullRefresh.
     */
    RadioPollAction decide(RadioStatus status, uint32_t nowMs);

    /** @brief Record a full refresh triggered outside the timer. */
    void markFullRefresh(uint32_t nowMs);
    bool hasFullRefresh() const { return hasFull_; }
    uint32_t lastFullRefreshMs() const { return lastFullMs_; }
    /** @brief Forget the last full refresh so the next poll does one. */
    void resetFullRefresh() { hasFull_ = false; }

    /** @brief Last acknowledgment older than RadioDefaults::DeadPeerMs. */
    static bool peerDead(const RadioStateMachine& sm, uint32_t nowMs);

private:
    uint32_t timerSec_ = RadioDefaults::TimerSec;
    uint32_t fullUpdateSec_ = RadioDefaults::FullUpdateSec;
    uint32_t nextWakeMs_ = 0;
    uint32_t lastFullMs_ = 0;
    bool armed_ = false;
    bool hasFull_ = false;
};
