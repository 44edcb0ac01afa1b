/**
 * @file RadioStateMachine.cpp
 * @brief Implementation file.
 */

#include "Modules/Network/RadioModule/RadioStateMachine.h"

#include <string.h>

const char* radioStatusName(RadioStatus s)
{
    switch (s) {
        case RadioStatus::Offline: return "offline";
        case RadioStatus::HostError: return "host_error";
        case RadioStatus::Online: return "online";
        case RadioStatus::On: return "on";
        case RadioStatus::Off: return "off";
        default: return "?";
    }
}

bool radioStatusFromName(const char* name, RadioStatus& out)
{
    if (!name) return false;
    static const RadioStatus kAll[] = {
        RadioStatus::Offline, RadioStatus::HostError, RadioStatus::Online, RadioStatus::On, RadioStatus::Off
    };
    for (RadioStatus s : kAll) {
        if (strcmp(radioStatusName(s), name) == 0) {
            out = s;
            return true;
        }
    }
    return false;
}

bool RadioStateMachine::accepts(RadioStatus next) const
{
    if (status_ == RadioStatus::HostError) return next == RadioStatus::Offline;
    return status_ == RadioStatus::Offline || next != RadioStatus::Online;
}

bool RadioStateMachine::transition(RadioStatus next, uint32_t nowMs)
{
    if (next == RadioStatus::Online) {
        lastAckMs_ = nowMs;
        hasAck_ = true;
    }
    if (!accepts(next)) return false;
    if (status_ == next) return false;
    status_ = next;
    return true;
}

void RadioStateMachine::reset()
{
    status_ = RadioStatus::Offline;
    lastAckMs_ = 0;
    hasAck_ = false;
}
