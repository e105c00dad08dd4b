#include "Board_Hardware.h"
#include "Board_Pins.h"
#include "Hardware.h"

// --- Board_Pin ---

Board_Pin::Board_Pin(uint32_t pin, bool is_output, bool active_low)
    : _pin(pin), _is_output(is_output), _active_low(active_low) {
}

void Board_Pin::Init() {
    if (_is_output) {
        pinMode(_pin, OUTPUT);
        Set(PinLevel::LOW);
    } else {
        pinMode(_pin, _active_low ? INPUT_PULLUP : INPUT);
    }
}

void Board_Pin::Set(PinLevel level) {
    if (!_is_output) return;
    bool high = (level == PinLevel::HIGH) != _active_low;
    digitalWrite(_pin, high ? HIGH : LOW);
}

PinLevel Board_Pin::Read() {
    bool high = (digitalRead(_pin) == HIGH) != _active_low;
    return high ? PinLevel::HIGH : PinLevel::LOW;
}

// --- Board_LedPin ---

Board_LedPin::Board_LedPin(int led_idx, uint8_t r, uint8_t g, uint8_t b)
    : _led_idx(led_idx), _r(r), _g(g), _b(b), _level(PinLevel::LOW) {
}

void Board_LedPin::Set(PinLevel level) {
    _level = level;
    if (level == PinLevel::HIGH) {
        Hardware::LED_SetColor(_led_idx, _r, _g, _b);
    } else {
        Hardware::LED_SetColor(_led_idx, 0, 0, 0);
    }
    Hardware::LED_Show();
}

// --- Board_Clock ---

uint64_t Board_Clock::Now() {
    return Hardware::GetTime();
}

bool Board_Clock::DelayUntil(uint64_t tick) {
    while (Hardware::GetTime() < tick) {
        Hardware::WaitForInterrupt();
    }
    return true;
}

// --- Board_Random ---

void Board_Random::Init() {
    _state = Hardware::ADC_CollectEntropy();
    if (_state == 0) _state = 0x6D2B79F5; // xorshift must not start at 0
}

uint32_t Board_Random::NextU32() {
    uint32_t x = _state;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    _state = x;
    return x;
}

// --- Board_Hardware ---

Board_Hardware::Board_Hardware()
    : status_led(NODE_LED_STATUS, 0, 50, 0),
      fault_led(NODE_LED_FAULT, 50, 0, 0),
      button(NODE_PIN_BUTTON, false, true) {
}

void Board_Hardware::Init() {
    Hardware::InitBase();
    button.Init();
    random.Init();
    transport.Init();
}
