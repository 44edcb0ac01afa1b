#pragma once
/**
 * @file WifiRuntime.h
 * @brief Wifi runtime accessors and setters.
 */
#include <string.h>

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/Types/IpV4.h"

static inline bool ipEqual(const IpV4& a, const IpV4& b)
{
    return memcmp(a.b, b.b, 4) == 0;
}

static inline bool wifiReady(const DataStore& ds)
{
    return ds.data().wifi.ready;
}

static inline void setWifiReady(DataStore& ds, bool ready)
{
    RuntimeData& rt = ds.dataMutable();
    if (rt.wifi.ready == ready) return;
    rt.wifi.ready = ready;
    ds.notifyChanged(DataKeys::WifiReady);
}

static inline void setWifiIp(DataStore& ds, const IpV4& ip)
{
    RuntimeData& rt = ds.dataMutable();
    if (ipEqual(rt.wifi.ip, ip)) return;
    rt.wifi.ip = ip;
    ds.notifyChanged(DataKeys::WifiIp);
}
