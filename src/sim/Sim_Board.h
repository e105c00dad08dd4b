#pragma once

#include <stdint.h>
#include "Sim_Pin.h"
#include "Sim_Clock.h"
#include "Sim_Transport.h"
#include "Sim_Random.h"
#include "Node_Logic.h"

/**
 * @brief Simulated Adapter: one of every peripheral the Core needs.
 *
 * Host-side counterpart of Board_Hardware.
 */
struct Sim_Board {
    Sim_Pin status_led;
    Sim_Pin fault_led;
    Sim_Pin button;
    Sim_Clock clock;
    Sim_Transport transport;
    Sim_Random random;

    explicit Sim_Board(uint32_t seed = 1) : random(seed) {}
};

typedef Node_Logic<Sim_Pin, Sim_Pin, Sim_Clock, Sim_Transport, Sim_Random> Sim_NodeLogic;
