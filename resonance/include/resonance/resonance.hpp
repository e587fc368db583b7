#pragma once
// Resonance: bounded-state vector stabilization
//
// - Types: Components, errors, vector arithmetic
// - Stabilizer: StabilizingVector and its damped update rule
// - Config: run configuration (JSON)
// - Run: multi-step driver used by the CLI

#include "version.hpp"
#include "types.hpp"
#include "stabilizer.hpp"
#include "config.hpp"
#include "run.hpp"
