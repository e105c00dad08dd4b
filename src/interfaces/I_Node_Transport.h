#pragma once
#include <stdint.h>
#include "Node_Protocol.h"

/**
 * @file I_Node_Transport.h
 * @brief Frame transport to the attached module.
 *
 * Board builds implement this on the UART, tests on in-memory queues.
 * The Logic layer only ever deals in complete frames.
 */
class I_Node_Transport {
public:
    virtual ~I_Node_Transport() {}

    //=========================================================================
    // DATA TRANSFER
    //=========================================================================

    /**
     * @brief Send one frame.
     *
     * @param data Frame bytes. Must not be null.
     * @param len  Frame length, 1..Node_Protocol::MAX_FRAME_LEN.
     * @return TransportError::NONE on success. INVALID_ARG when the
     *         arguments break the precondition, otherwise the reason the
     *         link refused the frame.
     */
    virtual TransportError Send(const uint8_t* data, uint16_t len) = 0;

    /**
     * @brief Poll for one received frame. Never blocks.
     *
     * Frames come out in the order they arrived.
     *
     * @param out Filled with the frame when one is pending.
     * @return true if a frame was written to out.
     */
    virtual bool TryReceive(Node_Frame& out) = 0;

    //=========================================================================
    // CONNECTION STATUS
    //=========================================================================

    /**
     * @brief Check if the link is up.
     */
    virtual bool IsConnected() = 0;
};
