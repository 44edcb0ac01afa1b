/**
 * @file RadioAddress.cpp
 * @brief Implementation file.
 */

#include "Modules/Network/RadioModule/RadioAddress.h"

#include <ctype.h>
#include <string.h>

namespace {

bool isEmpty(const char* s)
{
    return !s || *s == '\0';
}

bool copyRange(const char* begin, size_t len, char* out, size_t outLen)
{
    if (!out || outLen == 0 || len >= outLen) return false;
    memcpy(out, begin, len);
    out[len] = '\0';
    return true;
}

}  // namespace

bool radioBroadcastFor(const char* ip, char* out, size_t outLen)
{
    if (isEmpty(ip) || !out) return false;
    size_t len = strlen(ip);
    size_t digits = len;
    while (digits > 0 && isdigit((unsigned char)ip[digits - 1])) --digits;
    if (digits == len) return false;

    if (digits + 4 > outLen) return false;
    memcpy(out, ip, digits);
    memcpy(out + digits, "255", 4);
    return true;
}

bool radioDiscoveryIsOurs(const char* knownIp,
                          const char* knownName,
                          const char* replyIp,
                          const char* replyName)
{
    if (isEmpty(knownIp)) return true;
    if (replyIp && strcmp(replyIp, knownIp) == 0) return true;
    if (!isEmpty(knownName) && replyName && strcmp(replyName, knownName) == 0) return true;
    return false;
}

bool radioParseIpv4(const char* s, uint8_t out[4])
{
    if (isEmpty(s)) return false;
    const char* p = s;
    for (int part = 0; part < 4; ++part) {
        if (!isdigit((unsigned char)*p)) return false;
        unsigned value = 0;
        int ndigits = 0;
        while (isdigit((unsigned char)*p)) {
            value = value * 10U + (unsigned)(*p - '0');
            if (++ndigits > 3 || value > 255U) return false;
            ++p;
        }
        out[part] = (uint8_t)value;
        if (part < 3) {
            if (*p != '.') return false;
            ++p;
        }
    }
    return *p == '\0';
}

bool radioSplitPlayUrl(const char* descriptor,
                       char* nameOut,
                       size_t nameLen,
                       char* urlOut,
                       size_t urlLen)
{
    if (isEmpty(descriptor)) return false;

    const char* bar = strchr(descriptor, '|');
    const char* url = descriptor;
    const char* name = nullptr;
    size_t nameSize = 0;
    if (bar) {
        if (strchr(bar + 1, '|')) return false;
        name = descriptor;
        nameSize = (size_t)(bar - descriptor);
        url = bar + 1;
    }
    if (*url == '\0') return false;
    if (!copyRange(url, strlen(url), urlOut, urlLen)) return false;

    if (name && nameSize > 0) {
        return copyRange(name, nameSize, nameOut, nameLen);
    }

    // Host part: after an optional `scheme://`, up to `:port` or `/path`.
    const char* host = strstr(url, "://");
    host = host ? host + 3 : url;
    size_t hostLen = strcspn(host, ":/");
    if (hostLen == 0) return copyRange(url, strlen(url), nameOut, nameLen);
    return copyRange(host, hostLen, nameOut, nameLen);
}
