#pragma once

#include <stdint.h>
#include "Node_Sentence.h"

/**
 * @file Node_Locus.h
 * @brief Decoder for LOCUS flash dumps (PMTKLOX data packets).
 *
 * Only the basic record layout is handled: 16 bytes per point, sent as four
 * 8 hex digit words, little endian:
 *
 *   0..3   UTC seconds since 1970
 *   4      fix flags
 *   5..8   latitude  (float, degrees)
 *   9..12  longitude (float, degrees)
 *   13..14 height    (int16, metres)
 *   15     XOR of bytes 0..14
 */

enum class LocusError : uint8_t {
    NONE,
    INVALID_FIELD_COUNT,   ///< Word count is not a multiple of four
    INVALID_FIELD_LENGTH,  ///< A word is not 8 characters
    HEX_DECODE,
    WRONG_CHECKSUM,        ///< Record bytes do not XOR to zero
};

const char* LocusErrorName(LocusError err);

enum class LocusFix : uint8_t {
    NONE,            ///< No fix (GGA quality 0)
    GPS,             ///< GGA quality 1
    DGPS,            ///< GGA quality 2
    DEAD_RECKONING,  ///< GGA quality 6
    UNKNOWN,         ///< Flag byte matches none of the above
};

const char* LocusFixName(LocusFix fix);

struct LoggedPoint {
    uint32_t utc = 0;
    LocusFix fix = LocusFix::NONE;
    float latitude = 0.0f;
    float longitude = 0.0f;
    int16_t height = 0;
};

// Receives each decoded point of a dump, in flash order
typedef void (*PointSink)(const LoggedPoint& point);

namespace Node_Locus {

constexpr uint8_t POINT_BYTES = 16;
constexpr uint8_t WORDS_PER_POINT = 4;
constexpr uint8_t WORD_CHARS = 8;

/**
 * @brief Number of records in a PMTKLOX data packet.
 *
 * @param packet Parsed "PMTKLOX,1,<n>,<words...>" sentence.
 * @param count  Filled on success.
 * @return LocusError::INVALID_FIELD_COUNT if the words do not split into records.
 */
LocusError PointCount(const Node_Sentence& packet, uint8_t& count);

/**
 * @brief Decode record `index` of a PMTKLOX data packet.
 */
LocusError DecodePoint(const Node_Sentence& packet, uint8_t index, LoggedPoint& out);

/**
 * @brief Decode one raw 16 byte record.
 */
LocusError ParsePoint(const uint8_t (&bytes)[POINT_BYTES], LoggedPoint& out);

} // namespace Node_Locus
