#include "Node_Machine.h"
#include "Node_Sentence.h"
#include "Logger.h"
#include <stdio.h>
#include <string.h>

// --- Transition Table ---

// Rows: NodeEvent, columns: DeviceState (IDLE, ACTIVE, ERROR)
static const DeviceState TRANSITIONS[(int)NodeEvent::COUNT][(int)DeviceState::COUNT] = {
    /* NONE              */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::ERROR },
    /* BUTTON_PRESSED    */ { DeviceState::ACTIVE, DeviceState::IDLE,   DeviceState::IDLE  },
    /* COMMAND_ACKED     */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::ERROR },
    /* COMMAND_RETRY     */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::ERROR },
    /* RETRIES_EXHAUSTED */ { DeviceState::ERROR,  DeviceState::ERROR,  DeviceState::ERROR },
    /* LOG_STATUS        */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::ERROR },
    /* MODULE_BOOT       */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::IDLE  },
    /* REPORT_DUE        */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::ERROR },
    /* UNKNOWN_FRAME     */ { DeviceState::ERROR,  DeviceState::ERROR,  DeviceState::ERROR },
    /* MODULE_CHATTER    */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::ERROR },
    /* LOG_DATA          */ { DeviceState::IDLE,   DeviceState::ACTIVE, DeviceState::ERROR },
};

DeviceState Node_NextState(DeviceState state, NodeEvent event) {
    int s = (int)state;
    int e = (int)event;
    if (s < 0 || s >= (int)DeviceState::COUNT) return DeviceState::ERROR;
    if (e < 0 || e >= (int)NodeEvent::COUNT) return DeviceState::ERROR;
    return TRANSITIONS[e][s];
}

const char* Node_StateName(DeviceState state) {
    switch (state) {
        case DeviceState::IDLE:   return "idle";
        case DeviceState::ACTIVE: return "active";
        case DeviceState::ERROR:  return "error";
        default: break;
    }
    return "?";
}

const char* Node_EventName(NodeEvent event) {
    switch (event) {
        case NodeEvent::NONE:              return "none";
        case NodeEvent::BUTTON_PRESSED:    return "button_pressed";
        case NodeEvent::COMMAND_ACKED:     return "command_acked";
        case NodeEvent::COMMAND_RETRY:     return "command_retry";
        case NodeEvent::RETRIES_EXHAUSTED: return "retries_exhausted";
        case NodeEvent::LOG_STATUS:        return "log_status";
        case NodeEvent::MODULE_BOOT:       return "module_boot";
        case NodeEvent::REPORT_DUE:        return "report_due";
        case NodeEvent::UNKNOWN_FRAME:     return "unknown_frame";
        case NodeEvent::MODULE_CHATTER:    return "module_chatter";
        case NodeEvent::LOG_DATA:          return "log_data";
        default: break;
    }
    return "?";
}

const char* Node_CommandName(NodeCommand command) {
    switch (command) {
        case NodeCommand::NONE:               return "none";
        case NodeCommand::CONFIGURE_INTERVAL: return "configure_interval";
        case NodeCommand::START_LOGGING:      return "start_logging";
        case NodeCommand::STOP_LOGGING:       return "stop_logging";
        case NodeCommand::QUERY_STATUS:       return "query_status";
        case NodeCommand::DISABLE_NMEA:       return "disable_nmea";
        case NodeCommand::CHECK_READY:        return "check_ready";
        case NodeCommand::ERASE_LOGS:         return "erase_logs";
        case NodeCommand::DUMP_LOGS:          return "dump_logs";
        case NodeCommand::HOT_RESTART:        return "hot_restart";
        case NodeCommand::WARM_RESTART:       return "warm_restart";
        case NodeCommand::COLD_RESTART:       return "cold_restart";
        case NodeCommand::FACTORY_RESET:      return "factory_reset";
    }
    return "?";
}

const char* Node_TransportErrorName(TransportError err) {
    switch (err) {
        case TransportError::NONE:         return "none";
        case TransportError::BUSY:         return "busy";
        case TransportError::DISCONNECTED: return "disconnected";
        case TransportError::TIMEOUT:      return "timeout";
        case TransportError::INVALID_ARG:  return "invalid_arg";
    }
    return "?";
}

// --- Commands ---

static const char* command_sentence(NodeCommand command) {
    using namespace Node_Protocol;
    switch (command) {
        case NodeCommand::CONFIGURE_INTERVAL: return CommandStr::LOCUS_CONFIG;
        case NodeCommand::START_LOGGING:
        case NodeCommand::STOP_LOGGING:       return CommandStr::LOCUS_STOP_LOGGER;
        case NodeCommand::QUERY_STATUS:       return CommandStr::LOCUS_QUERY_STATUS;
        case NodeCommand::DISABLE_NMEA:       return CommandStr::SET_NMEA_OUTPUT;
        case NodeCommand::CHECK_READY:        return CommandStr::QUERY_RELEASE;
        case NodeCommand::ERASE_LOGS:         return CommandStr::LOCUS_ERASE_FLASH;
        case NodeCommand::DUMP_LOGS:          return CommandStr::LOCUS_DUMP;
        case NodeCommand::HOT_RESTART:        return CommandStr::HOT_START;
        case NodeCommand::WARM_RESTART:       return CommandStr::WARM_START;
        case NodeCommand::COLD_RESTART:       return CommandStr::COLD_START;
        case NodeCommand::FACTORY_RESET:      return CommandStr::FULL_COLD_START;
        case NodeCommand::NONE:               break;
    }
    return nullptr;
}

const char* Node_CommandNumber(NodeCommand command) {
    // "PMTK187" -> "187"
    const char* name = command_sentence(command);
    return name ? name + 4 : "";
}

bool Node_ExpectsAck(NodeCommand command) {
    switch (command) {
        case NodeCommand::CONFIGURE_INTERVAL:
        case NodeCommand::START_LOGGING:
        case NodeCommand::STOP_LOGGING:
        case NodeCommand::QUERY_STATUS:
        case NodeCommand::DISABLE_NMEA:
        case NodeCommand::ERASE_LOGS:
            return true;
        default:
            break;
    }
    return false;
}

bool Node_IsRestart(NodeCommand command) {
    return command == NodeCommand::HOT_RESTART || command == NodeCommand::WARM_RESTART ||
           command == NodeCommand::COLD_RESTART || command == NodeCommand::FACTORY_RESET;
}

NodeCommand Node_RestartCommand(RestartKind kind) {
    switch (kind) {
        case RestartKind::HOT:     return NodeCommand::HOT_RESTART;
        case RestartKind::WARM:    return NodeCommand::WARM_RESTART;
        case RestartKind::COLD:    return NodeCommand::COLD_RESTART;
        case RestartKind::FACTORY: return NodeCommand::FACTORY_RESET;
    }
    return NodeCommand::HOT_RESTART;
}

bool Node_BuildCommand(NodeCommand command, const NodeConfig& config, Node_Frame& out) {
    const char* name = command_sentence(command);
    if (!name) {
        out.len = 0;
        return false;
    }

    switch (command) {
        case NodeCommand::CONFIGURE_INTERVAL: {
            char secs[11];
            snprintf(secs, sizeof(secs), "%lu", (unsigned long)config.logger_interval_s);
            const char* fields[] = { "1", secs };
            return Node_Sentence::Serialize(name, fields, 2, out);
        }
        case NodeCommand::START_LOGGING:
        case NodeCommand::DUMP_LOGS: {
            const char* fields[] = { "0" };
            return Node_Sentence::Serialize(name, fields, 1, out);
        }
        case NodeCommand::STOP_LOGGING:
        case NodeCommand::ERASE_LOGS: {
            const char* fields[] = { "1" };
            return Node_Sentence::Serialize(name, fields, 1, out);
        }
        case NodeCommand::DISABLE_NMEA: {
            // Output rate 0 for every sentence type
            const char* fields[Node_Protocol::NMEA_OUTPUT_FIELDS];
            for (uint8_t i = 0; i < Node_Protocol::NMEA_OUTPUT_FIELDS; i++) fields[i] = "0";
            return Node_Sentence::Serialize(name, fields, Node_Protocol::NMEA_OUTPUT_FIELDS, out);
        }
        default:
            break;
    }
    return Node_Sentence::Serialize(name, nullptr, 0, out);
}

bool Node_Enqueue(Node_State& state, NodeCommand command, uint64_t now) {
    if (command == NodeCommand::NONE) return false;

    if (state.phase == CommandPhase::NONE) {
        state.command = command;
        state.phase = CommandPhase::SEND_DUE;
        state.attempts = 0;
        state.deadline = now;
        return true;
    }
    if (state.queue_len >= NODE_COMMAND_QUEUE_LEN) {
        Logger::Warn("Command queue full, dropping %s", Node_CommandName(command));
        return false;
    }
    state.queue[state.queue_len++] = command;
    return true;
}

void Node_CompleteCommand(Node_State& state, uint64_t now) {
    state.command = NodeCommand::NONE;
    state.phase = CommandPhase::NONE;
    state.attempts = 0;
    state.deadline = 0;

    if (state.queue_len == 0) return;

    NodeCommand next = state.queue[0];
    for (uint8_t i = 1; i < state.queue_len; i++) state.queue[i - 1] = state.queue[i];
    state.queue[--state.queue_len] = NodeCommand::NONE;
    Node_Enqueue(state, next, now);
}

void Node_ClearCommands(Node_State& state) {
    state.command = NodeCommand::NONE;
    state.phase = CommandPhase::NONE;
    state.attempts = 0;
    state.deadline = 0;
    for (uint8_t i = 0; i < NODE_COMMAND_QUEUE_LEN; i++) state.queue[i] = NodeCommand::NONE;
    state.queue_len = 0;
}

bool Node_HasCommand(const Node_State& state, NodeCommand command) {
    if (state.phase != CommandPhase::NONE && state.command == command) return true;
    for (uint8_t i = 0; i < state.queue_len; i++) {
        if (state.queue[i] == command) return true;
    }
    return false;
}

// --- Inbound Frames ---

static bool parse_log_status(const Node_Sentence& s, LoggerStatus& out) {
    using namespace Node_Protocol;
    if (s.FieldCount() < LOG_STATUS_MIN_FIELDS) return false;

    uint32_t percent = 0;
    LoggerStatus status;
    if (!Node_Sentence::ParseUint(s.Field(LOG_FIELD_INTERVAL), status.interval)) return false;
    // Status field is 0 while logging, 1 when stopped
    bool stopped = false;
    if (!Node_Sentence::ParseBool(s.Field(LOG_FIELD_STATUS), stopped)) return false;
    status.is_on = !stopped;
    if (!Node_Sentence::ParseUint(s.Field(LOG_FIELD_NUMBER), status.record_count)) return false;
    if (!Node_Sentence::ParseUint(s.Field(LOG_FIELD_PERCENT), percent) || percent > 100) return false;
    status.percent_full = (uint8_t)percent;
    out = status;
    return true;
}

static FrameVerdict classify_ack(const Node_State& state, const Node_Sentence& s) {
    using namespace Node_Protocol;

    const NodeCommand cmd = state.command;
    const bool awaiting = state.phase == CommandPhase::AWAIT_REPLY;
    const bool for_cmd = s.FieldCount() >= 2 && s.FieldIs(0, Node_CommandNumber(cmd));

    uint32_t flag = 0;
    bool succeeded = for_cmd && Node_Sentence::ParseUint(s.Field(1), flag) && flag == (uint32_t)AckFlag::SUCCEEDED;

    if (awaiting && Node_ExpectsAck(cmd)) {
        if (succeeded) return FrameVerdict::ACKED;
        if (for_cmd) {
            Logger::Debug("Ack flag %s for %s", s.Field(1), Node_CommandName(cmd));
        } else {
            Logger::Debug("Got ack for %s, expected ack for %s", s.Field(0), Node_CommandNumber(cmd));
        }
        return FrameVerdict::REJECTED;
    }

    // An earlier try went through after all, its ack just missed the timeout
    if (state.phase == CommandPhase::SEND_DUE && state.attempts > 0 && Node_ExpectsAck(cmd) && succeeded) {
        return FrameVerdict::ACKED;
    }

    if (awaiting && !for_cmd) {
        Logger::Debug("Got ack for %s while waiting on %s", s.Field(0), Node_CommandName(cmd));
        return FrameVerdict::REJECTED;
    }

    Logger::Debug("Ignoring stale ack for %s", s.Field(0));
    return FrameVerdict::CHATTER;
}

static FrameVerdict classify_locus(const Node_State& state, const Node_Sentence& s, Node_Reply& reply) {
    using namespace Node_Protocol;

    const LogDump& dump = state.dump;

    if (s.FieldIs(0, LOCUS_PACKET_START)) {
        uint32_t count = 0;
        if (!Node_Sentence::ParseUint(s.Field(1), count) || count > 0xFFFF) return FrameVerdict::MALFORMED;
        if (dump.started) {
            Logger::Error("Second LOCUS start packet");
            return FrameVerdict::REJECTED;
        }
        reply.packet_count = (uint16_t)count;
        return FrameVerdict::LOCUS_PACKET;
    }

    if (s.FieldIs(0, LOCUS_PACKET_DATA)) {
        uint32_t number = 0;
        if (!Node_Sentence::ParseUint(s.Field(1), number)) return FrameVerdict::MALFORMED;
        if (!dump.started || dump.received >= dump.packets || number != dump.received) {
            Logger::Error("Expected LOCUS data packet number %u, got number %lu",
                          (unsigned)dump.received, (unsigned long)number);
            return FrameVerdict::REJECTED;
        }
        return FrameVerdict::LOCUS_PACKET;
    }

    if (s.FieldIs(0, LOCUS_PACKET_END)) {
        if (!dump.started || dump.received != dump.packets) {
            Logger::Error("LOCUS end after %u of %u data packets", (unsigned)dump.received, (unsigned)dump.packets);
            return FrameVerdict::REJECTED;
        }
        return FrameVerdict::ACKED;
    }

    return FrameVerdict::MALFORMED;
}

FrameVerdict Node_ClassifyFrame(const Node_State& state, const Node_Frame& frame, Node_Reply& reply) {
    using namespace Node_Protocol;

    Node_Sentence& s = reply.sentence;
    SentenceError err = Node_Sentence::Parse(frame.data, frame.len, s);
    if (err != SentenceError::NONE) {
        Logger::Debug("Dropping frame: %s", SentenceErrorName(err));
        return FrameVerdict::MALFORMED;
    }

    // NMEA talker sentences and vendor output ($GPRMC, $CDACK, ...)
    if (strncmp(s.Name(), MTK_PREFIX, strlen(MTK_PREFIX)) != 0) {
        return FrameVerdict::CHATTER;
    }

    const bool awaiting = state.phase == CommandPhase::AWAIT_REPLY;

    if (s.NameIs(ReplyStr::ACK)) return classify_ack(state, s);

    if (s.NameIs(ReplyStr::LOG_STATUS)) {
        if (!awaiting || state.command != NodeCommand::QUERY_STATUS) return FrameVerdict::CHATTER;
        if (!parse_log_status(s, reply.status)) return FrameVerdict::MALFORMED;
        return FrameVerdict::LOG_STATUS;
    }

    if (s.NameIs(ReplyStr::RELEASE)) {
        if (!awaiting || state.command != NodeCommand::CHECK_READY) return FrameVerdict::CHATTER;
        if (s.FieldCount() < RELEASE_MIN_FIELDS) return FrameVerdict::MALFORMED;
        return FrameVerdict::ACKED;
    }

    if (s.NameIs(ReplyStr::LOCUS_DATA)) {
        if (!awaiting || state.command != NodeCommand::DUMP_LOGS) return FrameVerdict::CHATTER;
        return classify_locus(state, s, reply);
    }

    if (s.NameIs(ReplyStr::SYS_MSG)) {
        if (!s.FieldIs(0, BOOT_SYS_MSG_FIELD)) return FrameVerdict::CHATTER;
        reply.boot_flag = NODE_BOOT_SEEN_SYS_MSG;
        return FrameVerdict::BOOT;
    }
    if (s.NameIs(ReplyStr::TXT_MSG)) {
        if (!s.FieldIs(0, BOOT_TXT_MSG_FIELD)) return FrameVerdict::CHATTER;
        reply.boot_flag = NODE_BOOT_SEEN_TXT_MSG;
        return FrameVerdict::BOOT;
    }

    // A different reply than the one asked for counts against the command
    if (awaiting) {
        Logger::Debug("Expected reply to %s, got %s", Node_CommandName(state.command), s.Name());
        return FrameVerdict::REJECTED;
    }

    Logger::Debug("Unexpected sentence %s", s.Name());
    return FrameVerdict::UNEXPECTED;
}
