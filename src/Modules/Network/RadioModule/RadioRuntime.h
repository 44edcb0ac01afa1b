#pragma once
/**
 * @file RadioRuntime.h
 * @brief Radio runtime accessors and setters.
 */
#include <string.h>

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"

static inline const char* radioStatusText(const DataStore& ds)
{
    return ds.data().radio.status;
}

static inline bool radioPower(const DataStore& ds)
{
    return ds.data().radio.power;
}

static inline int32_t radioVolume(const DataStore& ds)
{
    return ds.data().radio.volume;
}

static inline bool radioMuted(const DataStore& ds)
{
    return ds.data().radio.muted;
}

static inline bool setRadioText_(char* dst, size_t dstLen, const char* v)
{
    if (!v) v = "";
    if (strncmp(dst, v, dstLen) == 0) return false;
    strncpy(dst, v, dstLen - 1);
    dst[dstLen - 1] = '\0';
    return true;
}

static inline void setRadioStatus(DataStore& ds, const char* status)
{
    RuntimeData& rt = ds.dataMutable();
    if (!setRadioText_(rt.radio.status, sizeof(rt.radio.status), status)) return;
    ds.notifyChanged(DataKeys::RadioStatus);
}

static inline void setRadioPower(DataStore& ds, bool on)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.radio.power == on) return;
    rt.radio.power = on;
    ds.notifyChanged(DataKeys::RadioPower);
}

static inline void setRadioVolume(DataStore& ds, int32_t volume)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.radio.volume == volume) return;
    rt.radio.volume = volume;
    ds.notifyChanged(DataKeys::RadioVolume);
}

static inline void setRadioMuted(DataStore& ds, bool muted)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.radio.muted == muted) return;
    rt.radio.muted = muted;
    ds.notifyChanged(DataKeys::RadioMuted);
}

static inline void setRadioIp(DataStore& ds, const char* ip)
{
    RuntimeData& rt = ds.dataMutable();
    if (!setRadioText_(rt.radio.ip, sizeof(rt.radio.ip), ip)) return;
    ds.notifyChanged(DataKeys::RadioIp);
}

static inline void setRadioPlayMode(DataStore& ds, const char* mode)
{
    RuntimeData& rt = ds.dataMutable();
    if (!setRadioText_(rt.radio.playMode, sizeof(rt.radio.playMode), mode)) return;
    ds.notifyChanged(DataKeys::RadioPlayMode);
}
