#pragma once

#include <stdint.h>

/**
 * @brief Timer / clock source capability.
 *
 * Ticks are an opaque monotonic unit. The board counts milliseconds,
 * the simulator counts whatever the test advances it by.
 */
class I_Node_Clock {
public:
    virtual ~I_Node_Clock() {}

    /**
     * @brief Current tick.
     *
     * Monotonic: never returns a value lower than a previous call.
     */
    virtual uint64_t Now() = 0;

    /**
     * @brief Suspension point. Wait until Now() >= tick.
     *
     * Implementations that can sleep (the board) return once the tick is
     * reached. Implementations that cannot move time themselves (the
     * simulator) return immediately.
     *
     * @param tick Absolute tick to wake at.
     * @return true  The tick has been reached, caller may proceed.
     * @return false The tick is still in the future, caller must yield.
     */
    virtual bool DelayUntil(uint64_t tick) = 0;
};
