#pragma once

#include <stdint.h>

/**
 * @brief Random number source.
 *
 * Used for retry jitter only. Not cryptographically strong on either
 * backend; the simulator is seeded so runs can be replayed.
 */
class I_Node_Random {
public:
    virtual ~I_Node_Random() {}

    virtual uint32_t NextU32() = 0;
};
