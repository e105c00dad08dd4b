#pragma once

#include <stdint.h>
#include "I_Node_Pin.h"

// Maximum commands waiting behind the outstanding one
#define NODE_COMMAND_QUEUE_LEN 4

// Longest firmware release name kept from PMTK705, including terminator
#define NODE_RELEASE_LEN 24

// Device State (closed set, COUNT is only an iteration bound)
enum class DeviceState : uint8_t
{
    IDLE,
    ACTIVE,
    ERROR,
    COUNT
};

// Input events, one per Tick
enum class NodeEvent : uint8_t
{
    NONE,
    BUTTON_PRESSED,
    COMMAND_ACKED,
    COMMAND_RETRY,
    RETRIES_EXHAUSTED,
    LOG_STATUS,
    MODULE_BOOT,
    REPORT_DUE,
    UNKNOWN_FRAME,
    MODULE_CHATTER,  // NMEA output, boot chatter, stale replies
    LOG_DATA,        // one PMTKLOX packet of a running dump
    COUNT
};

// Commands the node sends to the GPS module
enum class NodeCommand : uint8_t
{
    NONE,
    CONFIGURE_INTERVAL, // PMTK187,1,<secs>
    START_LOGGING,      // PMTK185,0
    STOP_LOGGING,       // PMTK185,1
    QUERY_STATUS,       // PMTK183, answered by PMTKLOG then PMTK001
    DISABLE_NMEA,       // PMTK314 with every rate 0
    CHECK_READY,        // PMTK605, answered by PMTK705
    ERASE_LOGS,         // PMTK184,1
    DUMP_LOGS,          // PMTK622,0, answered by PMTKLOX start, data..., end
    HOT_RESTART,        // PMTK101, answered by the boot sentences
    WARM_RESTART,       // PMTK102
    COLD_RESTART,       // PMTK103
    FACTORY_RESET       // PMTK104
};

// Boot sentences seen since a restart command was sent
#define NODE_BOOT_SEEN_SYS_MSG 0x01
#define NODE_BOOT_SEEN_TXT_MSG 0x02
#define NODE_BOOT_SEEN_ALL     0x03

enum class CommandPhase : uint8_t
{
    NONE,        // nothing outstanding
    SEND_DUE,    // send once deadline is reached
    AWAIT_REPLY  // sent, reply due before deadline
};

// Progress of a LOCUS flash dump
struct LogDump
{
    bool started = false;       // PMTKLOX start packet seen
    uint16_t packets = 0;       // data packets announced by the start packet
    uint16_t received = 0;      // data packets received so far
    uint32_t points = 0;        // records decoded
    uint32_t bad_points = 0;    // records dropped on checksum
};

// LOCUS logger status as reported by PMTKLOG
struct LoggerStatus
{
    uint32_t interval = 0;     // seconds between points
    bool is_on = false;
    uint32_t record_count = 0;
    uint8_t percent_full = 0;
};

/**
 * @brief Complete Device State snapshot.
 *
 * Owned by whoever drives Node_Logic::Tick(). The adapters never see it.
 */
struct Node_State
{
    DeviceState mode = DeviceState::IDLE;
    NodeEvent last_event = NodeEvent::NONE;

    // Outstanding command
    NodeCommand command = NodeCommand::NONE;
    CommandPhase phase = CommandPhase::NONE;
    uint8_t attempts = 0;     // failed attempts so far
    uint64_t deadline = 0;    // send-at or reply-by, depending on phase

    // Commands waiting behind it
    NodeCommand queue[NODE_COMMAND_QUEUE_LEN];
    uint8_t queue_len = 0;

    uint64_t next_report = 0;
    PinLevel button_level = PinLevel::LOW;
    LoggerStatus log_status;
    LogDump dump;
    uint8_t boot_seen = 0;    // NODE_BOOT_SEEN_* while a restart is outstanding
    char firmware_release[NODE_RELEASE_LEN];
    uint32_t chatter_frames = 0;

    // Suspension point of the last idle tick
    uint64_t wake_at = 0;
    bool suspended = false;

    uint32_t transitions = 0;

    Node_State() {
        for (int i = 0; i < NODE_COMMAND_QUEUE_LEN; i++) queue[i] = NodeCommand::NONE;
        firmware_release[0] = 0;
    }
};
