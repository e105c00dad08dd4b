#pragma once

#include <stdint.h>
#include "I_Node_Pin.h"

/**
 * @brief In-memory digital line.
 *
 * The Core drives it through Set(); a test drives inputs with SetLevel()
 * and inspects outputs with Read() / SetCount().
 */
class Sim_Pin final : public I_Node_Pin {
public:
    explicit Sim_Pin(PinLevel initial = PinLevel::LOW) : _level(initial), _set_count(0) {}

    void Set(PinLevel level) override {
        _level = level;
        _set_count++;
    }

    PinLevel Read() override { return _level; }

    // --- Test side ---
    void SetLevel(PinLevel level) { _level = level; }
    bool IsHigh() const { return _level == PinLevel::HIGH; }
    uint32_t SetCount() const { return _set_count; }

private:
    PinLevel _level;
    uint32_t _set_count;
};
