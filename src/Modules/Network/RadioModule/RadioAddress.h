#pragma once
/**
 * @file RadioAddress.h
 * @brief Host resolution seam and address helpers for discovery.
 */

#include <stddef.h>
#include <stdint.h>

/**
 * @brief Name-to-address resolver.
 *
 * `resolve` writes the dotted IPv4 form of `host` into `out` and returns true,
 * or returns false when the name cannot be resolved.
 */
struct RadioResolver {
    bool (*resolve)(void* ctx, const char* host, char* out, size_t outLen);
    void* ctx;
};

/**
 * @brief Broadcast address derived from `ip` by replacing its trailing number with 255.
 *
 * Only exact for /24 networks; callers may override it with a configured address.
 * @return false when `ip` does not end with a digit or `out` is too small.
 */
bool radioBroadcastFor(const char* ip, char* out, size_t outLen);

/**
 * @brief Whether a discovery reply belongs to the managed device.
 *
 * A reply is ours when no IP is known yet, when its IP equals the known one,
 * or when its advertised name equals the known device name (DHCP address change).
 * Empty or null known values count as unknown.
 */
bool radioDiscoveryIsOurs(const char* knownIp,
                          const char* knownName,
                          const char* replyIp,
                          const char* replyName);

/** @brief Parse a dotted IPv4 literal (`a.b.c.d`, each 0..255). */
bool radioParseIpv4(const char* s, uint8_t out[4]);

/**
 * @brief Split a `[name|]url` play descriptor.
 *
 * Without a name, the URL host (scheme, port and path stripped) is used.
 * @return false when the descriptor has no URL or more than one `|`.
 */
bool radioSplitPlayUrl(const char* descriptor,
                       char* nameOut,
                       size_t nameLen,
                       char* urlOut,
                       size_t urlLen);
