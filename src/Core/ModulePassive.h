#pragma once
/**
 * @file ModulePassive.h
 * @brief Base class for passive (no-task) modules.
 */
#include "Core/Module.h"

/** @brief Module that only registers services or wiring during init. */
class ModulePassive : public Module {
public:
    bool hasTask() const override { return false; }
    const char* taskName() const override { return ""; }
    void loop() override {}
};
