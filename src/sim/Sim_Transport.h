#pragma once

#include <stdint.h>
#include <deque>
#include <string>
#include <vector>
#include "I_Node_Transport.h"

/**
 * @file Sim_Transport.h
 * @brief Queue-backed I_Node_Transport for host tests.
 *
 * Inbound frames are injected by the test and handed out FIFO by
 * TryReceive(). Every accepted Send() lands in Sent(). Failures are
 * injected with FailNextSends() or SetConnected(false).
 */
class Sim_Transport final : public I_Node_Transport {
public:
    typedef std::vector<uint8_t> Frame;

    Sim_Transport();

    TransportError Send(const uint8_t* data, uint16_t len) override;
    bool TryReceive(Node_Frame& out) override;
    bool IsConnected() override { return _connected; }

    // --- Test side ---

    /**
     * @brief Queue raw bytes as one inbound frame.
     * @return false if the frame is empty or longer than MAX_FRAME_LEN.
     */
    bool Inject(const uint8_t* data, uint16_t len);

    /**
     * @brief Queue "$<body>*HH\r\n" with the checksum computed for body.
     */
    bool InjectSentence(const char* body);

    /**
     * @brief Make the next `count` sends fail with `error`.
     */
    void FailNextSends(uint32_t count, TransportError error = TransportError::BUSY);

    void SetConnected(bool connected) { _connected = connected; }

    size_t PendingInbound() const { return _inbound.size(); }
    const std::vector<Frame>& Sent() const { return _outbound; }
    std::string SentText(size_t index) const;  ///< "" if out of range
    uint32_t SendAttempts() const { return _send_attempts; }
    void ClearSent() { _outbound.clear(); }

private:
    std::deque<Frame> _inbound;
    std::vector<Frame> _outbound;
    uint32_t _fail_remaining;
    TransportError _fail_error;
    uint32_t _send_attempts;
    bool _connected;
};
