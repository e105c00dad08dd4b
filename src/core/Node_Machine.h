#pragma once

#include <stdint.h>
#include "Node_Defs.h"
#include "Node_Config.h"
#include "Node_Protocol.h"
#include "Node_Sentence.h"

/**
 * @file Node_Machine.h
 * @brief Adapter-free half of the Application Core.
 *
 * Everything here is a pure function of its arguments. Node_Logic wires
 * these to the capability contracts.
 */

/**
 * @brief Transition function of the Device State machine.
 *
 * Total over every (state, event) pair. Values outside the enums map
 * to DeviceState::ERROR.
 */
DeviceState Node_NextState(DeviceState state, NodeEvent event);

const char* Node_StateName(DeviceState state);
const char* Node_EventName(NodeEvent event);
const char* Node_CommandName(NodeCommand command);
const char* Node_TransportErrorName(TransportError err);

//=============================================================================
// COMMANDS
//=============================================================================

/**
 * @brief Encode a command as a PMTK sentence.
 * @return false for NodeCommand::NONE or if the frame does not fit.
 */
bool Node_BuildCommand(NodeCommand command, const NodeConfig& config, Node_Frame& out);

/**
 * @brief Three digit PMTK number of the command ("187" for PMTK187), "" for NONE.
 */
const char* Node_CommandNumber(NodeCommand command);

/**
 * @brief true when the command completes on its PMTK001 ack.
 *
 * CHECK_READY, DUMP_LOGS and the restarts complete on a different reply.
 */
bool Node_ExpectsAck(NodeCommand command);

bool Node_IsRestart(NodeCommand command);
NodeCommand Node_RestartCommand(RestartKind kind);

/**
 * @brief Make `command` outstanding, or queue it behind the current one.
 * @return false if the queue is full (command dropped).
 */
bool Node_Enqueue(Node_State& state, NodeCommand command, uint64_t now);

/**
 * @brief Retire the outstanding command and promote the next queued one.
 */
void Node_CompleteCommand(Node_State& state, uint64_t now);

/**
 * @brief Drop the outstanding command and everything queued.
 */
void Node_ClearCommands(Node_State& state);

bool Node_HasCommand(const Node_State& state, NodeCommand command);

//=============================================================================
// INBOUND FRAMES
//=============================================================================

enum class FrameVerdict : uint8_t
{
    ACKED,         // the reply that completes the outstanding command
    REJECTED,      // negative, mismatched or out of order reply while one is awaited
    LOG_STATUS,    // PMTKLOG answering an outstanding status query
    BOOT,          // module boot indicator
    LOCUS_PACKET,  // start or data packet of the outstanding dump
    CHATTER,       // NMEA or vendor output, other boot messages, stale replies
    UNEXPECTED,    // unknown PMTK sentence with no reply awaited
    MALFORMED      // failed to parse
};

/**
 * @brief What Node_ClassifyFrame() extracted from a frame.
 */
struct Node_Reply
{
    Node_Sentence sentence;      // parsed frame, empty when MALFORMED
    LoggerStatus status;         // LOG_STATUS
    uint8_t boot_flag = 0;       // BOOT: NODE_BOOT_SEEN_SYS_MSG or _TXT_MSG
    uint16_t packet_count = 0;   // LOCUS_PACKET start: data packets to follow
};

/**
 * @brief Interpret one received frame against the current state.
 *
 * @param state Current Device State (read only).
 * @param frame Received frame.
 * @param reply Parsed sentence and the fields the verdict carries.
 */
FrameVerdict Node_ClassifyFrame(const Node_State& state, const Node_Frame& frame, Node_Reply& reply);
