#pragma once

#include <stdint.h>
#include <random>
#include "I_Node_Random.h"

/**
 * @brief Seeded PRNG. Same seed, same sequence, on every host.
 */
class Sim_Random final : public I_Node_Random {
public:
    explicit Sim_Random(uint32_t seed = 1) : _engine(seed) {}

    uint32_t NextU32() override { return (uint32_t)_engine(); }

    void Seed(uint32_t seed) { _engine.seed(seed); }

private:
    std::mt19937 _engine;
};
