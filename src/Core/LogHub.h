#pragma once
/**
 * @file LogHub.h
 * @brief FreeRTOS queue between log producers and the dispatcher task.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

class LogHub {
public:
    void init(int queueLen);

    /** @brief Stamp and enqueue an entry; never blocks, fails when the queue is full. */
    bool enqueue(const LogEntry& e);
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    uint32_t dropped() const { return dropped_; }

private:
    QueueHandle_t q_ = nullptr;
    uint32_t dropped_ = 0;
};
