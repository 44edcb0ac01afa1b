#pragma once
/**
 * @file RadioReadings.h
 * @brief Change-detecting cache of the radio readings.
 *
 * Every write goes through `updateIfChanged`; a write equal to the stored
 * value is a no-op. "Unset" (nullptr) and "" are different values.
 *
 * Notifications reach the sink as a bit mask of changed readings:
 * - an immediate single update notifies at once;
 * - updates inside `beginBatch()`/`endBatch(changed)` produce at most one
 *   notification, and none when `changed` is false;
 * - changes that were committed silently stay pending and are carried by the
 *   next notification.
 */

#include <stdint.h>
#include <stddef.h>

#include "Core/SystemLimits.h"
#include "Modules/Network/RadioModule/RadioProtocol.h"

struct RadioReadingsSink {
    void (*notify)(void* ctx, uint64_t changedMask);
    void* ctx;
};

class RadioReadings {
public:
    void setSink(const RadioReadingsSink& sink) { sink_ = sink; }

    /** @brief Unset every reading and drop pending changes, without notifying. */
    void reset();

    /**
     * @brief Store `value` (nullptr = unset) if it differs from the cached one.
     * @param notifyImmediately notify now when not inside a batch.
     * @return true when the stored value changed.
     */
    bool updateIfChanged(RadioReading r, const char* value, bool notifyImmediately = false);
    bool updateIfChanged(RadioReading r, int32_t value, bool notifyImmediately = false);

    void beginBatch();
    /** @brief Close the current batch; `changed` decides whether it notifies. */
    void endBatch(bool changed);
    bool inBatch() const { return batchDepth_ > 0; }

    /** @brief Cached value, or nullptr when unset. */
    const char* get(RadioReading r) const;
    /** @brief Cached value, or `fallback` when unset. */
    const char* getOr(RadioReading r, const char* fallback) const;
    bool isSet(RadioReading r) const;
    /** @brief Cached value parsed as a decimal integer; false when unset or not numeric. */
    bool getInt(RadioReading r, int32_t& out) const;
    /** @brief True when set and equal to `value`. */
    bool equals(RadioReading r, const char* value) const;

    uint64_t pendingMask() const { return pendingMask_; }
    uint32_t notificationCount() const { return notifications_; }

private:
    struct Slot {
        bool set;
        char value[Limits::Radio::ReadingValueLen];
    };

    void emit_(uint64_t mask);

    Slot slots_[RADIO_READING_COUNT]{};
    RadioReadingsSink sink_{};
    uint64_t batchMask_ = 0;
    uint64_t pendingMask_ = 0;
    uint8_t batchDepth_ = 0;
    bool batchChanged_ = false;
    uint32_t notifications_ = 0;
};
