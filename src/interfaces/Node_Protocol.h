#pragma once
#include <stdint.h>

/**
 * @file Node_Protocol.h
 * @brief Shared vocabulary between the Logic layer and every transport.
 *
 * The module speaks MediaTek PMTK sentences:
 *   $PMTK<num>[,field...]*<checksum>\r\n
 * where checksum is the two digit hex XOR of the bytes between '$' and '*'.
 */

//=============================================================================
// TRANSPORT RESULT CODES
//=============================================================================

/**
 * Result of I_Node_Transport::Send
 */
enum class TransportError : uint8_t {
    NONE         = 0x00,  ///< Frame accepted
    BUSY         = 0x01,  ///< Transmitter still busy, try later
    DISCONNECTED = 0x02,  ///< Link is down
    TIMEOUT      = 0x03,  ///< Transmitter did not drain in time
    INVALID_ARG  = 0x04,  ///< Null/empty/oversized frame (contract violation)
};

//=============================================================================
// PROTOCOL CONSTANTS
//=============================================================================

namespace Node_Protocol {

constexpr uint16_t MAX_FRAME_LEN = 255;   ///< Longest sentence incl. "$", "*HH\r\n"
constexpr char PREFIX = '$';
constexpr char CHECKSUM_MARK = '*';
constexpr char FIELD_SEPARATOR = ',';

/**
 * Sentence names sent TO the module
 */
namespace CommandStr {
    constexpr const char* HOT_START          = "PMTK101";  ///< Reboot keeping all saved data
    constexpr const char* WARM_START         = "PMTK102";  ///< Reboot dropping ephemeris
    constexpr const char* COLD_START         = "PMTK103";  ///< Reboot dropping time, position, almanac, ephemeris
    constexpr const char* FULL_COLD_START    = "PMTK104";  ///< Cold start plus user configuration
    constexpr const char* LOCUS_QUERY_STATUS = "PMTK183";  ///< Reply: PMTKLOG
    constexpr const char* LOCUS_ERASE_FLASH  = "PMTK184";  ///< 1 = erase all
    constexpr const char* LOCUS_STOP_LOGGER  = "PMTK185";  ///< field 0 = start, 1 = stop
    constexpr const char* LOCUS_CONFIG       = "PMTK187";  ///< 1,<interval seconds>
    constexpr const char* SET_NMEA_OUTPUT    = "PMTK314";  ///< One rate field per NMEA sentence type
    constexpr const char* QUERY_RELEASE      = "PMTK605";  ///< Reply: PMTK705
    constexpr const char* LOCUS_DUMP         = "PMTK622";  ///< 0 = full dump, reply: PMTKLOX
}

/**
 * Sentence names sent FROM the module
 */
namespace ReplyStr {
    constexpr const char* ACK        = "PMTK001";  ///< <command num>,<flag>
    constexpr const char* SYS_MSG    = "PMTK010";  ///< 001 = booted
    constexpr const char* TXT_MSG    = "PMTK011";  ///< MTKGPS = booted
    constexpr const char* LOG_STATUS = "PMTKLOG";
    constexpr const char* RELEASE    = "PMTK705";  ///< <release>,<build>[,...]
    constexpr const char* LOCUS_DATA = "PMTKLOX";  ///< <type>[,...], see LOCUS_PACKET_* below
}

constexpr const char* MTK_PREFIX = "PMTK";      ///< Anything else is NMEA or vendor output

constexpr const char* BOOT_SYS_MSG_FIELD = "001";
constexpr const char* BOOT_TXT_MSG_FIELD = "MTKGPS";

/**
 * PMTK_ACK flag values
 */
enum class AckFlag : uint8_t {
    INVALID_COMMAND     = 0,
    UNSUPPORTED_COMMAND = 1,
    ACTION_FAILED       = 2,
    SUCCEEDED           = 3,
};

constexpr uint8_t LOG_STATUS_MIN_FIELDS = 10;  ///< PMTKLOG field count

// PMTKLOG field positions
constexpr uint8_t LOG_FIELD_INTERVAL = 4;
constexpr uint8_t LOG_FIELD_STATUS   = 7;  ///< 0 = logging, 1 = stopped
constexpr uint8_t LOG_FIELD_NUMBER   = 8;
constexpr uint8_t LOG_FIELD_PERCENT  = 9;

constexpr uint8_t NMEA_OUTPUT_FIELDS = 19;     ///< PMTK314 rate fields
constexpr uint8_t RELEASE_MIN_FIELDS = 2;      ///< PMTK705 release and build

// PMTKLOX packet types (field 0)
constexpr const char* LOCUS_PACKET_START = "0";  ///< 0,<data packet count>
constexpr const char* LOCUS_PACKET_DATA  = "1";  ///< 1,<packet number>,<8 hex digit words...>
constexpr const char* LOCUS_PACKET_END   = "2";
constexpr uint8_t LOCUS_FIRST_WORD_FIELD = 2;

} // namespace Node_Protocol

//=============================================================================
// FRAME BUFFER
//=============================================================================

/**
 * One complete sentence as moved across I_Node_Transport.
 */
struct Node_Frame {
    uint8_t data[Node_Protocol::MAX_FRAME_LEN];
    uint16_t len;

    Node_Frame() : len(0) {}
};
