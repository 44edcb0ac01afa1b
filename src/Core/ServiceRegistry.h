#pragma once
/**
 * @file ServiceRegistry.h
 * @brief Typed service registry for cross-module access.
 */
#include <stdint.h>
#include <cstring>

#include "Core/SystemLimits.h"

/** @brief Raw registry entry. */
struct ServiceEntry {
    const char* id;
    const void* ptr;
};

/**
 * @brief Registry of named services (opaque pointers).
 *
 * Filled during ModuleManager::initAll, read-only once the tasks run.
 */
class ServiceRegistry {
public:
    /** @brief Register a service pointer under a string id; duplicates and overflow are refused. */
    bool add(const char* id, const void* service);
    /** @brief Fetch a raw service pointer by id. */
    const void* getRaw(const char* id) const;

    /** @brief Fetch a typed service pointer by id. */
    template<typename T>
    const T* get(const char* id) const {
        return reinterpret_cast<const T*>(getRaw(id));
    }

    uint8_t count() const { return count_; }

private:
    ServiceEntry entries_[Limits::MaxServices]{};
    uint8_t count_ = 0;
};
