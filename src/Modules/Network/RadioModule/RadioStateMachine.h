#pragma once
/**
 * @file RadioStateMachine.h
 * @brief Reachability/power status of the radio with non-regressing transitions.
 *
 * Transition rule:
 * - `HostError` only accepts `Offline`;
 * - from any other status, `Online` is only accepted from `Offline` (or as a
 *   no-op from `Online`), so a liveness signal never hides a known power state;
 * - every other target is accepted.
 * A request for `Online` refreshes the last-acknowledgment stamp even when rejected.
 */

#include <stdint.h>

enum class RadioStatus : uint8_t {
    Offline,
    HostError,
    Online,
    On,
    Off
};

const char* radioStatusName(RadioStatus s);
/** @brief Parse `on`/`off`/`online`/`offline`/`host_error`. */
bool radioStatusFromName(const char* name, RadioStatus& out);

class RadioStateMachine {
public:
    RadioStatus status() const { return status_; }

    /**
     * @brief Request a transition.
     * @return true only when the request was accepted and the status changed.
     */
    bool transition(RadioStatus next, uint32_t nowMs);

    /** @brief Status would accept `next` (without applying it). */
    bool accepts(RadioStatus next) const;

    bool hasAck() const { return hasAck_; }
    uint32_t lastAckMs() const { return lastAckMs_; }

    /** @brief Back to `Offline` with no acknowledgment history. */
    void reset();

private:
    RadioStatus status_ = RadioStatus::Offline;
    uint32_t lastAckMs_ = 0;
    bool hasAck_ = false;
};
