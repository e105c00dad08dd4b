#pragma once

#include <stdint.h>
#include <string.h>
#include <type_traits>
#include "I_Node_Pin.h"
#include "I_Node_Clock.h"
#include "I_Node_Transport.h"
#include "I_Node_Random.h"
#include "Node_Defs.h"
#include "Node_Config.h"
#include "Node_Machine.h"
#include "Node_Locus.h"
#include "Logger.h"

/**
 * @brief Application Core: drives the GPS logger module through the
 * capability contracts only.
 *
 * Parameterised on the concrete adapter types so calls resolve at compile
 * time; board and simulator adapters are `final`. Adapters are borrowed
 * for the lifetime of this object and never shared.
 *
 * The Device State is not stored here. Tick() takes a snapshot and
 * returns the next one, so a test can step the loop one iteration at a
 * time; Run() is the endless loop used on the target.
 */
template <class LedPin, class ButtonPin, class Clock, class Transport, class Random>
class Node_Logic {
    static_assert(std::is_base_of<I_Node_Pin, LedPin>::value, "LedPin must implement I_Node_Pin");
    static_assert(std::is_base_of<I_Node_Pin, ButtonPin>::value, "ButtonPin must implement I_Node_Pin");
    static_assert(std::is_base_of<I_Node_Clock, Clock>::value, "Clock must implement I_Node_Clock");
    static_assert(std::is_base_of<I_Node_Transport, Transport>::value, "Transport must implement I_Node_Transport");
    static_assert(std::is_base_of<I_Node_Random, Random>::value, "Random must implement I_Node_Random");

public:
    Node_Logic(LedPin& status_led, LedPin& fault_led, ButtonPin& button,
               Clock& clock, Transport& transport, Random& random,
               const NodeConfig& config = NodeConfig::Defaults())
        : _status_led(status_led), _fault_led(fault_led), _button(button),
          _clock(clock), _transport(transport), _random(random),
          _config_valid(config.Validate()),
          _config(_config_valid ? config : NodeConfig::Defaults()),
          _point_sink(nullptr) {
        if (!_config_valid) Logger::Error("Invalid config, falling back to defaults");
    }

    Node_Logic(const Node_Logic&) = delete;
    Node_Logic& operator=(const Node_Logic&) = delete;

    /**
     * @brief Drive outputs to their resting level and build the first state.
     *
     * Starts in ERROR when the config passed to the constructor was rejected.
     */
    Node_State Init() {
        Node_State s;
        _status_led.Set(PinLevel::LOW);
        _fault_led.Set(PinLevel::LOW);
        s.button_level = _button.Read();

        if (!_config_valid) {
            s.mode = DeviceState::ERROR;
            _fault_led.Set(PinLevel::HIGH);
        }
        Logger::Info("%s %s ready (%s)", DEVICE_MODEL, DEVICE_VERSION, Node_StateName(s.mode));
        return s;
    }

    /**
     * @brief One loop iteration: derive at most one event and apply it.
     *
     * When nothing happened, the clock's DelayUntil() is called with the
     * earliest pending deadline; the returned state records it in wake_at
     * and whether the caller must yield (suspended).
     */
    Node_State Tick(const Node_State& current) {
        Node_State s = current;
        s.suspended = false;

        uint64_t now = _clock.Now();
        NodeEvent event = NextEvent(s, now);
        s.last_event = event;

        if (event == NodeEvent::NONE) {
            Suspend(s, now);
            return s;
        }

        DeviceState next = Node_NextState(s.mode, event);
        Apply(s, event, now);
        if (next != s.mode) EnterState(s, next);
        return s;
    }

    /**
     * @brief Control loop for the target. Never returns.
     */
    void Run() {
        Node_State state = Init();
        for (;;) {
            state = Tick(state);
        }
    }

    bool ConfigValid() const { return _config_valid; }
    const NodeConfig& Config() const { return _config; }

    /**
     * @brief Receive the points of every LOCUS dump. nullptr only counts them.
     */
    void SetPointSink(PointSink sink) { _point_sink = sink; }

private:
    LedPin& _status_led;
    LedPin& _fault_led;
    ButtonPin& _button;
    Clock& _clock;
    Transport& _transport;
    Random& _random;

    const bool _config_valid;
    const NodeConfig _config;
    PointSink _point_sink;

    // Priority: due send, inbound frame, button edge, reply timeout, report timer
    NodeEvent NextEvent(Node_State& s, uint64_t now) {
        if (s.phase == CommandPhase::SEND_DUE && now >= s.deadline) {
            return SendOutstanding(s, now);
        }

        Node_Frame frame;
        if (_transport.TryReceive(frame)) {
            return OnFrame(s, frame, now);
        }

        PinLevel level = _button.Read();
        bool pressed = (level == PinLevel::HIGH && s.button_level == PinLevel::LOW);
        s.button_level = level;
        if (pressed) return NodeEvent::BUTTON_PRESSED;

        if (s.phase == CommandPhase::AWAIT_REPLY && now >= s.deadline) {
            return FailAttempt(s, now, "reply timeout");
        }

        if (s.mode == DeviceState::ACTIVE && now >= s.next_report) {
            return NodeEvent::REPORT_DUE;
        }

        return NodeEvent::NONE;
    }

    NodeEvent OnFrame(Node_State& s, const Node_Frame& frame, uint64_t now) {
        Node_Reply reply;
        switch (Node_ClassifyFrame(s, frame, reply)) {
            case FrameVerdict::ACKED:
                if (s.command == NodeCommand::CHECK_READY) {
                    strncpy(s.firmware_release, reply.sentence.Field(0), NODE_RELEASE_LEN - 1);
                    s.firmware_release[NODE_RELEASE_LEN - 1] = 0;
                    Logger::Info("Module ready (firmware release %s, build %s)",
                                 reply.sentence.Field(0), reply.sentence.Field(1));
                }
                return NodeEvent::COMMAND_ACKED;

            case FrameVerdict::LOG_STATUS:
                s.log_status = reply.status;
                return NodeEvent::LOG_STATUS;

            case FrameVerdict::BOOT:
                if (s.phase == CommandPhase::AWAIT_REPLY && Node_IsRestart(s.command)) {
                    s.boot_seen |= reply.boot_flag;
                    if (s.boot_seen == NODE_BOOT_SEEN_ALL) return NodeEvent::COMMAND_ACKED;
                }
                return NodeEvent::MODULE_BOOT;

            case FrameVerdict::LOCUS_PACKET:
                return OnLocusPacket(s, reply.sentence, reply.packet_count, now);

            case FrameVerdict::CHATTER:
                s.chatter_frames++;
                Logger::Debug("Ignoring %s", reply.sentence.Name());
                return NodeEvent::MODULE_CHATTER;

            case FrameVerdict::REJECTED:
                return FailAttempt(s, now, "rejected");

            case FrameVerdict::MALFORMED:
                if (s.phase == CommandPhase::AWAIT_REPLY) return FailAttempt(s, now, "corrupt reply");
                Logger::Error("Malformed frame in %s", Node_StateName(s.mode));
                return NodeEvent::UNKNOWN_FRAME;

            case FrameVerdict::UNEXPECTED:
                Logger::Error("Unexpected %s in %s", reply.sentence.Name(), Node_StateName(s.mode));
                return NodeEvent::UNKNOWN_FRAME;
        }
        return NodeEvent::UNKNOWN_FRAME;
    }

    // Start or data packet of the running dump; each one re-arms the reply timeout
    NodeEvent OnLocusPacket(Node_State& s, const Node_Sentence& packet, uint16_t packet_count, uint64_t now) {
        if (packet.FieldIs(0, Node_Protocol::LOCUS_PACKET_START)) {
            s.dump.started = true;
            s.dump.packets = packet_count;
            Logger::Info("Reading logs, %u packets", (unsigned)packet_count);
            s.deadline = now + _config.ack_timeout;
            return NodeEvent::LOG_DATA;
        }

        uint8_t count = 0;
        LocusError err = Node_Locus::PointCount(packet, count);
        for (uint8_t i = 0; err == LocusError::NONE && i < count; i++) {
            LoggedPoint point;
            err = Node_Locus::DecodePoint(packet, i, point);
            if (err == LocusError::WRONG_CHECKSUM) {
                s.dump.bad_points++;
                err = LocusError::NONE;
                continue;
            }
            if (err != LocusError::NONE) break;
            s.dump.points++;
            if (_point_sink) _point_sink(point);
        }
        if (err != LocusError::NONE) {
            Logger::Error("LOCUS packet %u: %s", (unsigned)s.dump.received, LocusErrorName(err));
            return FailAttempt(s, now, "corrupt log data");
        }

        s.dump.received++;
        s.deadline = now + _config.ack_timeout;
        return NodeEvent::LOG_DATA;
    }

    uint8_t RetryBudget(NodeCommand command) const {
        if (command == NodeCommand::DISABLE_NMEA) return _config.nmea_retry_budget;
        // A dump is long and partly delivered already, a second one would repeat points
        if (command == NodeCommand::DUMP_LOGS) return 0;
        return _config.retry_budget;
    }

    uint32_t ReplyTimeout(NodeCommand command) const {
        return Node_IsRestart(command) ? _config.boot_timeout : _config.ack_timeout;
    }

    NodeEvent SendOutstanding(Node_State& s, uint64_t now) {
        Node_Frame frame;
        if (!Node_BuildCommand(s.command, _config, frame)) {
            Logger::Error("Cannot encode %s", Node_CommandName(s.command));
            s.attempts = RetryBudget(s.command);
            return FailAttempt(s, now, "encode");
        }

        // Link down: count the try without touching the transmitter
        if (!_transport.IsConnected()) {
            return FailAttempt(s, now, Node_TransportErrorName(TransportError::DISCONNECTED));
        }

        TransportError err = _transport.Send(frame.data, frame.len);
        if (err == TransportError::NONE) {
            Logger::Debug("Sent %s (try %u)", Node_CommandName(s.command), (unsigned)(s.attempts + 1));
            s.phase = CommandPhase::AWAIT_REPLY;
            s.deadline = now + ReplyTimeout(s.command);
            s.boot_seen = 0;
            if (s.command == NodeCommand::DUMP_LOGS) s.dump = LogDump();
            return NodeEvent::NONE;
        }
        if (err == TransportError::INVALID_ARG) {
            // Contract violation, retrying the same frame cannot help
            s.attempts = RetryBudget(s.command);
        }
        return FailAttempt(s, now, Node_TransportErrorName(err));
    }

    NodeEvent FailAttempt(Node_State& s, uint64_t now, const char* reason) {
        const uint8_t budget = RetryBudget(s.command);
        s.attempts++;
        if (s.attempts > budget) {
            Logger::Error("Failed to send %s after %u tries (%s)",
                          Node_CommandName(s.command), (unsigned)s.attempts, reason);
            return NodeEvent::RETRIES_EXHAUSTED;
        }

        uint8_t shift = s.attempts - 1;
        if (shift > _config.backoff_max_shift) shift = _config.backoff_max_shift;
        uint64_t backoff = (uint64_t)_config.backoff_base << shift;
        if (_config.backoff_jitter > 0) {
            backoff += _random.NextU32() % ((uint64_t)_config.backoff_jitter + 1);
        }

        s.phase = CommandPhase::SEND_DUE;
        s.deadline = now + backoff;
        Logger::Warn("Retrying %s in %lu (%s, try %u)", Node_CommandName(s.command),
                     (unsigned long)backoff, reason, (unsigned)s.attempts);
        return NodeEvent::COMMAND_RETRY;
    }

    // Side effects that do not depend on the target state
    void Apply(Node_State& s, NodeEvent event, uint64_t now) {
        switch (event) {
            case NodeEvent::BUTTON_PRESSED:
                if (s.mode == DeviceState::IDLE) {
                    StartSession(s, now);
                } else if (s.mode == DeviceState::ACTIVE) {
                    Node_ClearCommands(s);
                    Node_Enqueue(s, NodeCommand::STOP_LOGGING, now);
                } else if (s.mode == DeviceState::ERROR) {
                    NodeCommand restart = Node_RestartCommand(_config.recovery_restart);
                    Logger::Info("Recovering, %s", Node_CommandName(restart));
                    Node_Enqueue(s, restart, now);
                }
                break;

            case NodeEvent::COMMAND_ACKED: {
                NodeCommand done = s.command;
                Logger::Debug("%s acked", Node_CommandName(done));
                if (done == NodeCommand::DUMP_LOGS) {
                    Logger::Info("Read %lu points (%lu bad)", (unsigned long)s.dump.points,
                                 (unsigned long)s.dump.bad_points);
                }
                Node_CompleteCommand(s, now);
                if (Node_IsRestart(done)) {
                    // Rebooted module talks NMEA again
                    Logger::Info("Module restarted");
                    Node_Enqueue(s, NodeCommand::DISABLE_NMEA, now);
                    Node_Enqueue(s, NodeCommand::CHECK_READY, now);
                }
                break;
            }

            case NodeEvent::LOG_STATUS:
                Logger::Info("Logger %s, %lu records, %u%% full, every %lus",
                             s.log_status.is_on ? "on" : "off",
                             (unsigned long)s.log_status.record_count,
                             (unsigned)s.log_status.percent_full,
                             (unsigned long)s.log_status.interval);
                if (s.mode == DeviceState::ACTIVE && _config.offload_percent > 0 &&
                    s.log_status.percent_full >= _config.offload_percent) {
                    StartOffload(s, now);
                }
                break;

            case NodeEvent::REPORT_DUE:
                if (!Node_HasCommand(s, NodeCommand::QUERY_STATUS)) {
                    Node_Enqueue(s, NodeCommand::QUERY_STATUS, now);
                }
                s.next_report = now + _config.report_interval;
                break;

            case NodeEvent::MODULE_BOOT:
                Logger::Info("Module booted");
                // Both boot sentences arrive back to back, re-arm once
                if (s.mode == DeviceState::ACTIVE && !Node_HasCommand(s, NodeCommand::START_LOGGING)) {
                    StartSession(s, now, true);
                }
                break;

            default:
                break;
        }
    }

    // PMTK314 goes first, NMEA output would otherwise interleave with every reply
    void StartSession(Node_State& s, uint64_t now, bool after_boot = false) {
        Node_ClearCommands(s);
        Node_Enqueue(s, NodeCommand::DISABLE_NMEA, now);
        if (after_boot) Node_Enqueue(s, NodeCommand::CHECK_READY, now);
        Node_Enqueue(s, NodeCommand::CONFIGURE_INTERVAL, now);
        Node_Enqueue(s, NodeCommand::START_LOGGING, now);
        s.next_report = now + _config.report_interval;
    }

    // Dump the flash, then erase it. A failed dump ends in ERROR, which drops the erase.
    void StartOffload(Node_State& s, uint64_t now) {
        if (Node_HasCommand(s, NodeCommand::DUMP_LOGS)) return;
        if (NODE_COMMAND_QUEUE_LEN - s.queue_len < 3) {
            Logger::Warn("No room to offload logs");
            return;
        }
        Logger::Info("Log flash %u%% full, offloading", (unsigned)s.log_status.percent_full);
        Node_Enqueue(s, NodeCommand::CHECK_READY, now);
        Node_Enqueue(s, NodeCommand::DUMP_LOGS, now);
        Node_Enqueue(s, NodeCommand::ERASE_LOGS, now);
    }

    void EnterState(Node_State& s, DeviceState next) {
        Logger::Info("%s -> %s (%s)", Node_StateName(s.mode), Node_StateName(next), Node_EventName(s.last_event));
        s.mode = next;
        s.transitions++;

        switch (next) {
            case DeviceState::ACTIVE:
                _fault_led.Set(PinLevel::LOW);
                _status_led.Set(PinLevel::HIGH);
                break;
            case DeviceState::IDLE:
                _fault_led.Set(PinLevel::LOW);
                _status_led.Set(PinLevel::LOW);
                break;
            case DeviceState::ERROR:
                Node_ClearCommands(s);
                _status_led.Set(PinLevel::LOW);
                _fault_led.Set(PinLevel::HIGH);
                break;
            default:
                break;
        }
    }

    void Suspend(Node_State& s, uint64_t now) {
        uint64_t wake = now + _config.poll_interval;
        if (s.phase != CommandPhase::NONE && s.deadline < wake) wake = s.deadline;
        if (s.mode == DeviceState::ACTIVE && s.next_report < wake) wake = s.next_report;

        s.wake_at = wake;
        s.suspended = !_clock.DelayUntil(wake);
    }
};
