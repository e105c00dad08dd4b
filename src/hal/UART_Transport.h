#pragma once

#include "I_Node_Transport.h"
#include "Hardware.h"

/**
 * @file UART_Transport.h
 * @brief UART implementation of I_Node_Transport
 *
 * Talks to the GPS module on USART2. Bytes are buffered from the RX
 * interrupt; TryReceive() assembles them into one sentence at a time.
 */
class UART_Transport final : public I_Node_Transport {
public:
    UART_Transport() {}
    virtual ~UART_Transport() {}

    void Init();

    TransportError Send(const uint8_t* data, uint16_t len) override;
    bool TryReceive(Node_Frame& out) override;
    bool IsConnected() override;

    // Internal: Called by RX interrupt to buffer incoming bytes
    void OnByteReceived(uint8_t byte);

private:
    static constexpr uint16_t RX_BUFFER_SIZE = 512;
    volatile uint8_t rx_buffer[RX_BUFFER_SIZE];
    volatile uint16_t rx_head = 0;
    volatile uint16_t rx_tail = 0;

    // Sentence being assembled, survives across TryReceive() calls
    uint8_t line[Node_Protocol::MAX_FRAME_LEN];
    uint16_t line_len = 0;
    bool line_overflow = false;
    bool initialized = false;

    int ReadByte();
};
