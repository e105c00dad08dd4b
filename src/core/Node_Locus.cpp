#include "Node_Locus.h"
#include "Node_Protocol.h"
#include <string.h>

const char* LocusErrorName(LocusError err) {
    switch (err) {
        case LocusError::NONE:                 return "none";
        case LocusError::INVALID_FIELD_COUNT:  return "invalid field count";
        case LocusError::INVALID_FIELD_LENGTH: return "invalid field length";
        case LocusError::HEX_DECODE:           return "hex decode";
        case LocusError::WRONG_CHECKSUM:       return "wrong checksum";
    }
    return "?";
}

const char* LocusFixName(LocusFix fix) {
    switch (fix) {
        case LocusFix::NONE:           return "none";
        case LocusFix::GPS:            return "gps";
        case LocusFix::DGPS:           return "dgps";
        case LocusFix::DEAD_RECKONING: return "dead_reckoning";
        case LocusFix::UNKNOWN:        return "unknown";
    }
    return "?";
}

static uint32_t read_u32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static float read_f32(const uint8_t* p) {
    uint32_t raw = read_u32(p);
    float value;
    memcpy(&value, &raw, sizeof(value));
    return value;
}

static LocusFix fix_of(uint8_t flags) {
    if (flags & 0x04) return LocusFix::DGPS;
    if (flags & 0x02) return LocusFix::GPS;
    if (flags & 0x40) return LocusFix::DEAD_RECKONING;
    if (flags == 0x00) return LocusFix::NONE;
    return LocusFix::UNKNOWN;
}

namespace Node_Locus {

LocusError PointCount(const Node_Sentence& packet, uint8_t& count) {
    uint8_t fields = packet.FieldCount();
    if (fields < Node_Protocol::LOCUS_FIRST_WORD_FIELD) return LocusError::INVALID_FIELD_COUNT;

    uint8_t words = fields - Node_Protocol::LOCUS_FIRST_WORD_FIELD;
    if (words % WORDS_PER_POINT != 0) return LocusError::INVALID_FIELD_COUNT;
    count = words / WORDS_PER_POINT;
    return LocusError::NONE;
}

LocusError DecodePoint(const Node_Sentence& packet, uint8_t index, LoggedPoint& out) {
    uint8_t bytes[POINT_BYTES];
    uint8_t first = Node_Protocol::LOCUS_FIRST_WORD_FIELD + index * WORDS_PER_POINT;

    for (uint8_t w = 0; w < WORDS_PER_POINT; w++) {
        const char* word = packet.Field(first + w);
        if (strlen(word) != WORD_CHARS) return LocusError::INVALID_FIELD_LENGTH;

        for (uint8_t b = 0; b < 4; b++) {
            int hi = Node_Sentence::HexDigit((uint8_t)word[b * 2]);
            int lo = Node_Sentence::HexDigit((uint8_t)word[b * 2 + 1]);
            if (hi < 0 || lo < 0) return LocusError::HEX_DECODE;
            bytes[w * 4 + b] = (uint8_t)((hi << 4) | lo);
        }
    }
    return ParsePoint(bytes, out);
}

LocusError ParsePoint(const uint8_t (&bytes)[POINT_BYTES], LoggedPoint& out) {
    uint8_t checksum = 0;
    for (uint8_t i = 0; i < POINT_BYTES; i++) checksum ^= bytes[i];
    if (checksum != 0) return LocusError::WRONG_CHECKSUM;

    LoggedPoint point;
    point.utc = read_u32(&bytes[0]);
    point.fix = fix_of(bytes[4]);
    point.latitude = read_f32(&bytes[5]);
    point.longitude = read_f32(&bytes[9]);
    point.height = (int16_t)((uint16_t)bytes[13] | ((uint16_t)bytes[14] << 8));
    out = point;
    return LocusError::NONE;
}

} // namespace Node_Locus
