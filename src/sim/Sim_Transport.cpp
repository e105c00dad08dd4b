#include "Sim_Transport.h"
#include <stdio.h>
#include <string.h>

Sim_Transport::Sim_Transport()
    : _fail_remaining(0), _fail_error(TransportError::BUSY), _send_attempts(0), _connected(true) {
}

TransportError Sim_Transport::Send(const uint8_t* data, uint16_t len) {
    _send_attempts++;

    // Same precondition as the UART implementation
    if (!data || len == 0 || len > Node_Protocol::MAX_FRAME_LEN) return TransportError::INVALID_ARG;
    if (!_connected) return TransportError::DISCONNECTED;
    if (_fail_remaining > 0) {
        _fail_remaining--;
        return _fail_error;
    }

    _outbound.push_back(Frame(data, data + len));
    return TransportError::NONE;
}

bool Sim_Transport::TryReceive(Node_Frame& out) {
    if (_inbound.empty()) return false;

    const Frame& front = _inbound.front();
    memcpy(out.data, front.data(), front.size());
    out.len = (uint16_t)front.size();
    _inbound.pop_front();
    return true;
}

bool Sim_Transport::Inject(const uint8_t* data, uint16_t len) {
    if (!data || len == 0 || len > Node_Protocol::MAX_FRAME_LEN) return false;
    _inbound.push_back(Frame(data, data + len));
    return true;
}

bool Sim_Transport::InjectSentence(const char* body) {
    if (!body) return false;

    uint8_t checksum = 0;
    for (const char* p = body; *p; p++) checksum ^= (uint8_t)*p;

    char text[Node_Protocol::MAX_FRAME_LEN + 1];
    int n = snprintf(text, sizeof(text), "$%s*%02X\r\n", body, (unsigned)checksum);
    if (n <= 0 || n > Node_Protocol::MAX_FRAME_LEN) return false;
    return Inject((const uint8_t*)text, (uint16_t)n);
}

void Sim_Transport::FailNextSends(uint32_t count, TransportError error) {
    _fail_remaining = count;
    _fail_error = error;
}

std::string Sim_Transport::SentText(size_t index) const {
    if (index >= _outbound.size()) return std::string();
    const Frame& f = _outbound[index];
    return std::string(f.begin(), f.end());
}
