/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"
#include <Arduino.h>

void LogHub::init(int queueLen) {
    if (q_) return;
    q_ = xQueueCreate(queueLen, sizeof(LogEntry));
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q_) return false;
    LogEntry stamped = e;
    if (stamped.ts_ms == 0) stamped.ts_ms = millis();
    if (xQueueSend(q_, &stamped, 0) == pdTRUE) return true;
    ++dropped_;
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q_) return false;
    return xQueueReceive(q_, &out, waitTicks) == pdTRUE;
}
