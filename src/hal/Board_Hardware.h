#pragma once

#include <stdint.h>
#include "I_Node_Pin.h"
#include "I_Node_Clock.h"
#include "I_Node_Random.h"
#include "UART_Transport.h"

/**
 * @brief GPIO line via the Arduino core. Used for the user button.
 *
 * With active_low the electrical level is inverted, so Read() returns
 * HIGH while the button is pressed.
 */
class Board_Pin final : public I_Node_Pin {
public:
    Board_Pin(uint32_t pin, bool is_output, bool active_low);

    void Init();
    void Set(PinLevel level) override;
    PinLevel Read() override;

private:
    uint32_t _pin;
    bool _is_output;
    bool _active_low;
};

/**
 * @brief One pixel of the mainboard NeoPixel chain, treated as a lamp.
 */
class Board_LedPin final : public I_Node_Pin {
public:
    Board_LedPin(int led_idx, uint8_t r, uint8_t g, uint8_t b);

    void Set(PinLevel level) override;
    PinLevel Read() override { return _level; }

private:
    int _led_idx;
    uint8_t _r, _g, _b;
    PinLevel _level;
};

class Board_Clock final : public I_Node_Clock {
public:
    uint64_t Now() override;
    bool DelayUntil(uint64_t tick) override;  // sleeps, always returns true
};

/**
 * @brief xorshift32 seeded from ADC noise. Not cryptographic.
 */
class Board_Random final : public I_Node_Random {
public:
    Board_Random() : _state(0) {}

    void Init();
    uint32_t NextU32() override;

private:
    uint32_t _state;
};

/**
 * @brief Board Adapter: the single owner of every peripheral handle.
 *
 * Constructed once in setup() and lent to Node_Logic.
 */
class Board_Hardware {
public:
    Board_Hardware();

    void Init();

    Board_LedPin status_led;
    Board_LedPin fault_led;
    Board_Pin button;
    Board_Clock clock;
    UART_Transport transport;
    Board_Random random;
};
