#pragma once
/**
 * @file SnprintfCheck.h
 * @brief snprintf wrapper that reports truncation through the log facade.
 */

#include "Core/Log.h"
#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>
#include <string.h>

static inline int flowRadioSnprintfChecked_(const char* tag,
                                            const char* file,
                                            int line,
                                            char* out,
                                            size_t outLen,
                                            const char* fmt,
                                            ...)
{
    va_list ap;
    va_start(ap, fmt);
    const int wrote = vsnprintf(out, outLen, fmt, ap);
    va_end(ap);

    if (wrote < 0 || outLen == 0 || (size_t)wrote >= outLen) {
        const char* base = file ? strrchr(file, '/') : nullptr;
        Log::warn(tag ? tag : "FmtChk",
                  "truncated format at %s:%d (cap=%u need=%d)",
                  base ? base + 1 : (file ? file : "?"),
                  line,
                  (unsigned)outLen,
                  wrote);
    }
    return wrote;
}

#define FLOWRADIO_SNPRINTF_CHECKED(TAG, OUT, LEN, FMT, ...) \
    flowRadioSnprintfChecked_((TAG), __FILE__, __LINE__, (OUT), (LEN), (FMT), ##__VA_ARGS__)
