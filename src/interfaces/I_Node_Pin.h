#pragma once

#include <stdint.h>

/**
 * @brief Sampled level of a digital line.
 */
enum class PinLevel : uint8_t {
    LOW  = 0,
    HIGH = 1,
};

/**
 * @brief Digital I/O capability.
 *
 * One instance per physical line. Output lines are driven with Set(),
 * input lines are sampled with Read(). Neither operation can fail, so
 * there is no error channel.
 */
class I_Node_Pin {
public:
    virtual ~I_Node_Pin() {}

    /**
     * @brief Drive the line.
     * @param level New line state.
     */
    virtual void Set(PinLevel level) = 0;

    /**
     * @brief Sample the line.
     *
     * Never blocks. For an output line this returns the last driven level.
     *
     * @return PinLevel Current level.
     */
    virtual PinLevel Read() = 0;
};
