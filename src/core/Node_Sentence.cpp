#include "Node_Sentence.h"
#include <string.h>

constexpr uint8_t Node_Sentence::MAX_FIELDS;
constexpr uint8_t Node_Sentence::MAX_FIELD_LEN;

static const char HEX_DIGITS[] = "0123456789ABCDEF";

const char* SentenceErrorName(SentenceError err) {
    switch (err) {
        case SentenceError::NONE:              return "none";
        case SentenceError::EXPECTED_PREFIX:   return "expected prefix";
        case SentenceError::EXPECTED_NAME:     return "expected name";
        case SentenceError::EXPECTED_CHECKSUM: return "expected checksum";
        case SentenceError::CHECKSUM_PARSE:    return "checksum parse";
        case SentenceError::EXPECTED_SUFFIX:   return "expected suffix";
        case SentenceError::EXPECTED_END:      return "expected end";
        case SentenceError::WRONG_CHECKSUM:    return "wrong checksum";
        case SentenceError::TOO_MANY_FIELDS:   return "too many fields";
        case SentenceError::FIELD_TOO_LONG:    return "field too long";
    }
    return "?";
}

Node_Sentence::Node_Sentence() {
    Clear();
}

void Node_Sentence::Clear() {
    memset(_name, 0, sizeof(_name));
    memset(_fields, 0, sizeof(_fields));
    _field_count = 0;
}

int Node_Sentence::HexDigit(uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

uint8_t Node_Sentence::Checksum(const uint8_t* line, uint16_t len) {
    uint8_t sum = 0;
    for (uint16_t i = 0; i < len; i++) sum ^= line[i];
    return sum;
}

SentenceError Node_Sentence::Parse(const uint8_t* data, uint16_t len, Node_Sentence& out) {
    out.Clear();

    if (!data || len == 0 || data[0] != Node_Protocol::PREFIX) return SentenceError::EXPECTED_PREFIX;

    uint16_t i = 1;

    // Name: up to the first ',' or '*'
    uint8_t name_len = 0;
    while (i < len && data[i] != Node_Protocol::FIELD_SEPARATOR && data[i] != Node_Protocol::CHECKSUM_MARK) {
        if (name_len >= MAX_FIELD_LEN - 1) {
            out.Clear();
            return SentenceError::FIELD_TOO_LONG;
        }
        out._name[name_len++] = (char)data[i++];
    }
    if (i >= len || name_len == 0) {
        out.Clear();
        return SentenceError::EXPECTED_NAME;
    }

    // Fields: each ',' opens a new (possibly empty) field
    uint8_t field_len = 0;
    while (i < len && data[i] != Node_Protocol::CHECKSUM_MARK) {
        uint8_t c = data[i++];
        if (c == Node_Protocol::FIELD_SEPARATOR) {
            if (out._field_count >= MAX_FIELDS) {
                out.Clear();
                return SentenceError::TOO_MANY_FIELDS;
            }
            out._field_count++;
            field_len = 0;
        } else {
            if (field_len >= MAX_FIELD_LEN - 1) {
                out.Clear();
                return SentenceError::FIELD_TOO_LONG;
            }
            out._fields[out._field_count - 1][field_len++] = (char)c;
        }
    }
    if (i >= len) {
        out.Clear();
        return SentenceError::EXPECTED_CHECKSUM;
    }
    uint16_t star = i++;

    // Checksum
    if (len - i < 2) {
        out.Clear();
        return SentenceError::EXPECTED_CHECKSUM;
    }
    int hi = HexDigit(data[i]);
    int lo = HexDigit(data[i + 1]);
    if (hi < 0 || lo < 0) {
        out.Clear();
        return SentenceError::CHECKSUM_PARSE;
    }
    uint8_t checksum = (uint8_t)((hi << 4) | lo);
    i += 2;

    // Suffix
    if (i >= len || data[i] != '\r' || i + 1 >= len || data[i + 1] != '\n') {
        out.Clear();
        return SentenceError::EXPECTED_SUFFIX;
    }
    i += 2;
    if (i != len) {
        out.Clear();
        return SentenceError::EXPECTED_END;
    }

    if (checksum != Checksum(data + 1, star - 1)) {
        out.Clear();
        return SentenceError::WRONG_CHECKSUM;
    }
    return SentenceError::NONE;
}

bool Node_Sentence::Serialize(const char* name, const char* const* fields, uint8_t count, Node_Frame& out) {
    out.len = 0;
    if (!name || name[0] == 0) return false;

    uint16_t pos = 0;
    // Worst case we still need "*HH\r\n"
    const uint16_t limit = Node_Protocol::MAX_FRAME_LEN - 5;

    out.data[pos++] = Node_Protocol::PREFIX;
    for (const char* p = name; *p; p++) {
        if (pos >= limit) return false;
        out.data[pos++] = (uint8_t)*p;
    }
    for (uint8_t f = 0; f < count; f++) {
        if (pos >= limit) return false;
        out.data[pos++] = Node_Protocol::FIELD_SEPARATOR;
        for (const char* p = fields[f]; p && *p; p++) {
            if (pos >= limit) return false;
            out.data[pos++] = (uint8_t)*p;
        }
    }

    uint8_t checksum = Checksum(out.data + 1, pos - 1);
    out.data[pos++] = Node_Protocol::CHECKSUM_MARK;
    out.data[pos++] = HEX_DIGITS[checksum >> 4];
    out.data[pos++] = HEX_DIGITS[checksum & 0x0F];
    out.data[pos++] = '\r';
    out.data[pos++] = '\n';
    out.len = pos;
    return true;
}

bool Node_Sentence::ParseUint(const char* field, uint32_t& out) {
    if (!field || field[0] == 0) return false;
    uint32_t value = 0;
    for (const char* p = field; *p; p++) {
        if (*p < '0' || *p > '9') return false;
        uint32_t digit = (uint32_t)(*p - '0');
        if (value > (0xFFFFFFFFu - digit) / 10) return false;  // overflow
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

bool Node_Sentence::ParseBool(const char* field, bool& out) {
    if (!field) return false;
    if (strcmp(field, "0") == 0) {
        out = false;
        return true;
    }
    if (strcmp(field, "1") == 0) {
        out = true;
        return true;
    }
    return false;
}

bool Node_Sentence::NameIs(const char* name) const {
    return name && strcmp(_name, name) == 0;
}

const char* Node_Sentence::Field(uint8_t index) const {
    if (index >= _field_count) return "";
    return _fields[index];
}

bool Node_Sentence::FieldIs(uint8_t index, const char* text) const {
    return index < _field_count && text && strcmp(_fields[index], text) == 0;
}
