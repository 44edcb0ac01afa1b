/**
 * @file RadioFrame.cpp
 * @brief Implementation file.
 */

#include "Modules/Network/RadioModule/RadioFrame.h"

#include <stdio.h>
#include <string.h>

void RadioFrame::clear()
{
    count_ = 0;
    truncated_ = false;
    buf_[0] = '\0';
}

bool RadioFrame::addField_(const char* key, size_t keyLen, const char* value)
{
    if (count_ >= Limits::Radio::MaxFrameFields) {
        truncated_ = true;
        return false;
    }

    // Room is kept for a `_NNN` duplicate suffix.
    char base[Limits::Radio::FieldKeyLen - 4];
    if (keyLen >= sizeof(base)) keyLen = sizeof(base) - 1;
    memcpy(base, key, keyLen);
    base[keyLen] = '\0';

    RadioField& f = fields_[count_];
    snprintf(f.key, sizeof(f.key), "%s", base);
    for (unsigned suffix = 1; has(f.key) && suffix <= Limits::Radio::MaxFrameFields; ++suffix) {
        snprintf(f.key, sizeof(f.key), "%s_%u", base, suffix);
    }
    f.value = value;
    ++count_;
    return true;
}

bool RadioFrame::parse(const char* data, size_t len)
{
    clear();
    if (!data || len == 0) return false;
    if (len > RadioDefaults::MaxDatagram) len = RadioDefaults::MaxDatagram;

    memcpy(buf_, data, len);
    buf_[len] = '\0';

    char* line = buf_;
    char* const end = buf_ + len;
    while (line < end) {
        char* eol = line;
        while (eol < end && *eol != '\r' && *eol != '\n' && *eol != '\0') ++eol;
        char* next = (eol < end) ? eol + 1 : end;
        *eol = '\0';

        if (*line != '\0') {
            // `KEY:value` needs a non-empty key and a non-empty value; anything
            // else is kept whole under the bare key.
            char* colon = strchr(line, ':');
            if (colon && colon != line && colon[1] != '\0') {
                *colon = '\0';
                addField_(line, (size_t)(colon - line), colon + 1);
            } else {
                addField_(RADIO_BARE_KEY, sizeof(RADIO_BARE_KEY) - 1, line);
            }
        }
        line = next;
    }
    return count_ > 0;
}

const char* RadioFrame::get(const char* key) const
{
    if (!key) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(fields_[i].key, key) == 0) return fields_[i].value;
    }
    return nullptr;
}

bool RadioFrame::is(const char* key, const char* expected) const
{
    const char* v = get(key);
    return v && expected && strcmp(v, expected) == 0;
}

size_t buildRadioCommand(char* out,
                         size_t outLen,
                         const char* cmd,
                         const char* const* params,
                         size_t paramCount,
                         const char* identity)
{
    if (!out || outLen == 0 || !cmd) return 0;

    size_t pos = 0;
    auto append = [&](const char* prefix, const char* text) -> bool {
        int n = snprintf(out + pos, outLen - pos, "%s%s\r\n", prefix, text ? text : "");
        if (n < 0 || (size_t)n >= outLen - pos) return false;
        pos += (size_t)n;
        return true;
    };

    bool ok = append("COMMAND:", cmd);
    for (size_t i = 0; ok && i < paramCount; ++i) ok = append("", params[i]);
    ok = ok && append("ID:", identity) && append("", "");

    if (!ok) {
        out[0] = '\0';
        return 0;
    }
    return pos;
}
