#pragma once

#include <stdint.h>
#include "Node_Protocol.h"

/**
 * @file Node_Sentence.h
 * @brief PMTK/NMEA sentence codec.
 *
 * Terminology: given "$PMTK001,187,3*3E\r\n" the name is "PMTK001",
 * the fields are "187" and "3" and the checksum is 0x3E.
 *
 * Zero heap allocation: a parsed sentence lives in fixed arrays.
 */

enum class SentenceError : uint8_t {
    NONE,
    EXPECTED_PREFIX,    ///< First byte is not '$'
    EXPECTED_NAME,      ///< Empty or unterminated name
    EXPECTED_CHECKSUM,  ///< Missing '*' or fewer than two checksum digits
    CHECKSUM_PARSE,     ///< Checksum digits are not hex
    EXPECTED_SUFFIX,    ///< Missing "\r\n" after the checksum
    EXPECTED_END,       ///< Trailing bytes after "\r\n"
    WRONG_CHECKSUM,     ///< Checksum does not match the line
    TOO_MANY_FIELDS,
    FIELD_TOO_LONG,
};

const char* SentenceErrorName(SentenceError err);

class Node_Sentence {
public:
    static constexpr uint8_t MAX_FIELDS = 32;     ///< PMTKLOX: type, number, 24 data words
    static constexpr uint8_t MAX_FIELD_LEN = 24;  ///< Including terminator, fits PMTK705 release names

    Node_Sentence();

    /**
     * @brief Parse one complete frame.
     *
     * @param data Frame bytes, "$" through "\n".
     * @param len  Frame length.
     * @param out  Filled on success, cleared otherwise.
     * @return SentenceError::NONE on success.
     */
    static SentenceError Parse(const uint8_t* data, uint16_t len, Node_Sentence& out);

    /**
     * @brief Build "$name,fields...*HH\r\n".
     *
     * @return false if the result would not fit in a Node_Frame.
     */
    static bool Serialize(const char* name, const char* const* fields, uint8_t count, Node_Frame& out);

    /**
     * @brief XOR of every byte in the line (between '$' and '*').
     */
    static uint8_t Checksum(const uint8_t* line, uint16_t len);

    // Field helpers, all return false on malformed input
    static bool ParseUint(const char* field, uint32_t& out);
    static bool ParseBool(const char* field, bool& out);  ///< "0" / "1"

    /**
     * @return 0..15 for a hex digit (either case), -1 otherwise.
     */
    static int HexDigit(uint8_t c);

    const char* Name() const { return _name; }
    bool NameIs(const char* name) const;
    uint8_t FieldCount() const { return _field_count; }

    /**
     * @return The field text, or "" when index is out of range.
     */
    const char* Field(uint8_t index) const;
    bool FieldIs(uint8_t index, const char* text) const;

private:
    void Clear();

    char _name[MAX_FIELD_LEN];
    char _fields[MAX_FIELDS][MAX_FIELD_LEN];
    uint8_t _field_count;
};
