/**
 * @file UART_Transport.cpp
 * @brief UART implementation of I_Node_Transport
 */
#include "UART_Transport.h"
#include "Board_Pins.h"
#include "Logger.h"

// Global instance pointer for interrupt callback
static UART_Transport* g_transport_instance = nullptr;

// Callback for Hardware RX interrupt
static void uart_rx_callback(uint8_t byte) {
    if (g_transport_instance) {
        g_transport_instance->OnByteReceived(byte);
    }
}

void UART_Transport::Init() {
    g_transport_instance = this;
    Hardware::UART_Init(NODE_GPS_BAUD);
    Hardware::UART_SetRxCallback(uart_rx_callback);
    initialized = true;
}

TransportError UART_Transport::Send(const uint8_t* data, uint16_t len) {
    if (data == nullptr || len == 0 || len > Node_Protocol::MAX_FRAME_LEN) {
        return TransportError::INVALID_ARG;
    }
    if (!initialized) return TransportError::DISCONNECTED;
    if (Hardware::UART_IsBusy()) return TransportError::BUSY;
    if (!Hardware::UART_Send(data, len)) return TransportError::TIMEOUT;
    return TransportError::NONE;
}

bool UART_Transport::TryReceive(Node_Frame& out) {
    int c;
    while ((c = ReadByte()) >= 0) {
        uint8_t byte = (uint8_t)c;

        // '$' always starts a new sentence, whatever was pending is lost
        if (byte == Node_Protocol::PREFIX) {
            line_len = 0;
            line_overflow = false;
        } else if (line_len == 0) {
            continue; // noise between sentences
        }

        if (line_len >= Node_Protocol::MAX_FRAME_LEN) {
            if (!line_overflow) Logger::Warn("GPS sentence too long, dropped");
            line_overflow = true;
        } else {
            line[line_len++] = byte;
        }

        if (byte == '\n') {
            bool complete = !line_overflow && line_len >= 2 && line[line_len - 2] == '\r';
            uint16_t len = line_len;
            line_len = 0;
            line_overflow = false;
            if (!complete) continue;

            for (uint16_t i = 0; i < len; i++) out.data[i] = line[i];
            out.len = len;
            return true;
        }
    }
    return false;
}

bool UART_Transport::IsConnected() {
    // UART is always "connected" when initialized
    return initialized;
}

int UART_Transport::ReadByte() {
    if (rx_head == rx_tail) {
        return -1; // No data
    }
    uint8_t byte = rx_buffer[rx_tail];
    rx_tail = (rx_tail + 1) % RX_BUFFER_SIZE;
    return byte;
}

void UART_Transport::OnByteReceived(uint8_t byte) {
    uint16_t next_head = (rx_head + 1) % RX_BUFFER_SIZE;
    if (next_head != rx_tail) {
        rx_buffer[rx_head] = byte;
        rx_head = next_head;
    }
    // If buffer full, drop byte
}
