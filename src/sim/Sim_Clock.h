#pragma once

#include <stdint.h>
#include "I_Node_Clock.h"

/**
 * @brief Virtual Clock.
 *
 * Time only moves when the test calls Advance()/AdvanceTo(). DelayUntil()
 * never waits: it reports whether the requested tick has been reached and
 * remembers the request so the test can see where the Core suspended.
 */
class Sim_Clock final : public I_Node_Clock {
public:
    explicit Sim_Clock(uint64_t start = 0);

    uint64_t Now() override;
    bool DelayUntil(uint64_t tick) override;

    // --- Test side ---
    void Advance(uint64_t delta);

    /**
     * @brief Jump to an absolute tick.
     * @return false (and no change) if tick is in the past.
     */
    bool AdvanceTo(uint64_t tick);

    bool HasWakeRequest() const { return _has_wake_request; }
    uint64_t LastWakeRequest() const { return _last_wake_request; }
    uint32_t DelayCalls() const { return _delay_calls; }

private:
    uint64_t _now;
    uint64_t _last_wake_request;
    bool _has_wake_request;
    uint32_t _delay_calls;
};
