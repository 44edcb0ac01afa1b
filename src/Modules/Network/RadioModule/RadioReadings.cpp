/**
 * @file RadioReadings.cpp
 * @brief Implementation file.
 */

#include "Modules/Network/RadioModule/RadioReadings.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

void RadioReadings::reset()
{
    for (uint8_t i = 0; i < RADIO_READING_COUNT; ++i) {
        slots_[i].set = false;
        slots_[i].value[0] = '\0';
    }
    batchMask_ = 0;
    pendingMask_ = 0;
    batchDepth_ = 0;
    batchChanged_ = false;
}

void RadioReadings::emit_(uint64_t mask)
{
    pendingMask_ = 0;
    ++notifications_;
    if (sink_.notify) sink_.notify(sink_.ctx, mask);
}

bool RadioReadings::updateIfChanged(RadioReading r, const char* value, bool notifyImmediately)
{
    const uint8_t idx = (uint8_t)r;
    if (idx >= RADIO_READING_COUNT) return false;
    Slot& s = slots_[idx];

    // Compare against the stored (possibly truncated) form so an oversized
    // value does not count as a change on every update.
    char next[sizeof(s.value)];
    if (value) {
        size_t n = strlen(value);
        if (n >= sizeof(next)) n = sizeof(next) - 1;
        memcpy(next, value, n);
        next[n] = '\0';
    }

    if (!value) {
        if (!s.set) return false;
        s.set = false;
        s.value[0] = '\0';
    } else {
        if (s.set && strcmp(s.value, next) == 0) return false;
        s.set = true;
        memcpy(s.value, next, sizeof(s.value));
    }

    const uint64_t bit = radioReadingBit(r);
    if (batchDepth_ > 0) {
        batchMask_ |= bit;
    } else if (notifyImmediately) {
        emit_(pendingMask_ | bit);
    } else {
        pendingMask_ |= bit;
    }
    return true;
}

bool RadioReadings::updateIfChanged(RadioReading r, int32_t value, bool notifyImmediately)
{
    char buf[12];
    snprintf(buf, sizeof(buf), "%ld", (long)value);
    return updateIfChanged(r, buf, notifyImmediately);
}

void RadioReadings::beginBatch()
{
    if (batchDepth_ == 0) {
        batchMask_ = 0;
        batchChanged_ = false;
    }
    ++batchDepth_;
}

void RadioReadings::endBatch(bool changed)
{
    if (batchDepth_ == 0) return;
    batchChanged_ = batchChanged_ || changed;
    if (--batchDepth_ > 0) return;

    const uint64_t mask = batchMask_;
    batchMask_ = 0;
    if (batchChanged_) {
        emit_(pendingMask_ | mask);
    } else {
        pendingMask_ |= mask;
    }
    batchChanged_ = false;
}

const char* RadioReadings::get(RadioReading r) const
{
    const uint8_t idx = (uint8_t)r;
    if (idx >= RADIO_READING_COUNT || !slots_[idx].set) return nullptr;
    return slots_[idx].value;
}

const char* RadioReadings::getOr(RadioReading r, const char* fallback) const
{
    const char* v = get(r);
    return v ? v : fallback;
}

bool RadioReadings::isSet(RadioReading r) const
{
    return get(r) != nullptr;
}

bool RadioReadings::getInt(RadioReading r, int32_t& out) const
{
    const char* v = get(r);
    if (!v || *v == '\0') return false;
    char* end = nullptr;
    long parsed = strtol(v, &end, 10);
    if (!end || *end != '\0') return false;
    out = (int32_t)parsed;
    return true;
}

bool RadioReadings::equals(RadioReading r, const char* value) const
{
    const char* v = get(r);
    return v && value && strcmp(v, value) == 0;
}
