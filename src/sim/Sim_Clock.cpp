#include "Sim_Clock.h"

Sim_Clock::Sim_Clock(uint64_t start)
    : _now(start), _last_wake_request(0), _has_wake_request(false), _delay_calls(0) {
}

uint64_t Sim_Clock::Now() {
    return _now;
}

bool Sim_Clock::DelayUntil(uint64_t tick) {
    _delay_calls++;
    _last_wake_request = tick;
    _has_wake_request = true;
    return _now >= tick;
}

void Sim_Clock::Advance(uint64_t delta) {
    // Saturate rather than wrap
    if (UINT64_MAX - _now < delta) {
        _now = UINT64_MAX;
        return;
    }
    _now += delta;
}

bool Sim_Clock::AdvanceTo(uint64_t tick) {
    if (tick < _now) return false;
    _now = tick;
    return true;
}
