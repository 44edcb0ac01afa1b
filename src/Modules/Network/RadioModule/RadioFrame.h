#pragma once
/**
 * @file RadioFrame.h
 * @brief Codec for the line-oriented `KEY:value` datagrams of the radio protocol.
 *
 * Inbound frames are parsed into an ordered field list. Values point into the
 * frame's own copy of the datagram, so a frame stays valid until the next parse.
 * Lines without a key are stored under `_` (the verb/block line); repeated keys
 * get `_1`, `_2`, ... suffixes in order of appearance.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/SystemLimits.h"
#include "Domain/RadioDefaults.h"

/** @brief Key used for lines that carry no `KEY:` prefix. */
constexpr char RADIO_BARE_KEY[] = "_";

struct RadioField {
    char key[Limits::Radio::FieldKeyLen];
    const char* value;
};

class RadioFrame {
public:
    /**
     * @brief Parse a datagram. CR, LF and CRLF all terminate a line; empty lines are skipped.
     * @return false when nothing usable was found (the frame is then empty).
     */
    bool parse(const char* data, size_t len);
    void clear();

    /** @brief Value of `key`, or nullptr when the field is absent. */
    const char* get(const char* key) const;
    bool has(const char* key) const { return get(key) != nullptr; }
    /** @brief `get(key)` compared to `expected`; false when absent. */
    bool is(const char* key, const char* expected) const;

    uint8_t count() const { return count_; }
    const RadioField& at(uint8_t idx) const { return fields_[idx]; }
    /** @brief True when the datagram had more lines than the field table holds. */
    bool truncated() const { return truncated_; }

private:
    bool addField_(const char* key, size_t keyLen, const char* value);

    char buf_[RadioDefaults::MaxDatagram + 1]{};
    RadioField fields_[Limits::Radio::MaxFrameFields]{};
    uint8_t count_ = 0;
    bool truncated_ = false;
};

/**
 * @brief Build an outbound command frame.
 *
 * Layout: `COMMAND:<cmd>`, each parameter line verbatim, `ID:<identity>`, then a
 * blank line, every line CRLF-terminated.
 * @return Bytes written (without terminator), or 0 when `out` is too small.
 */
size_t buildRadioCommand(char* out,
                         size_t outLen,
                         const char* cmd,
                         const char* const* params,
                         size_t paramCount,
                         const char* identity);
