#pragma once
/**
 * @file EventBus.h
 * @brief Queued event bus with fixed-size payloads.
 */
#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include "EventId.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#ifndef EVENTBUS_HANDLER_WARN_US
#define EVENTBUS_HANDLER_WARN_US 5000
#endif

#ifndef EVENTBUS_WARN_MIN_INTERVAL_MS
#define EVENTBUS_WARN_MIN_INTERVAL_MS 2000
#endif

/** @brief Event delivered to subscribers during dispatch(). */
struct Event {
    EventId id;
    const void* payload;
    size_t len;
};

/** @brief Callback signature for event subscribers. */
using EventCallback = void(*)(const Event& e, void* user);

/**
 * @brief Thread-safe event queue with subscriber dispatch.
 *
 * post() may be called from any task; dispatch() runs the subscribers in the
 * EventBus task only.
 */
class EventBus {
public:
    /** @brief Largest payload copied into the queue. */
    static constexpr uint8_t MAX_PAYLOAD_SIZE = 48;

    EventBus();

    /** @brief Subscribe to an event id (not thread-safe; call during init). */
    bool subscribe(EventId id, EventCallback cb, void* user);

    /** @brief Post an event; the payload is copied. Never blocks. */
    bool post(EventId id, const void* payload = nullptr, size_t len = 0);

    /** @brief Dispatch up to `maxEvents` queued events. */
    void dispatch(uint16_t maxEvents = 8);

    /** @brief Events refused because the queue was full. */
    uint32_t droppedCount() const { return _dropped; }

private:
    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    struct QueuedEvent {
        EventId id;
        uint8_t len;
        uint8_t data[MAX_PAYLOAD_SIZE];
    };

    Subscriber _subs[Limits::MaxEventSubscribers];
    uint8_t _count = 0;
    uint32_t _dropped = 0;
    uint32_t _lastWarnMs = 0;

    QueueHandle_t _queue = nullptr;

    void dispatchOne(const QueuedEvent& qe);
};
