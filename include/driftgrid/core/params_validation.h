#pragma once

#include <string>
#include <vector>

#include "driftgrid/core/params.h"

namespace driftgrid {

// Validate a parameter set before handing it to the engine.
//
// Returns a list of human-readable error strings. An empty list means "valid".
// The engine itself only clamps the values its algorithm defines as clamped,
// so hosts (CLI, tuning panel, preset loader) run this first.
std::vector<std::string> validate_params(const Params& p);

} // namespace driftgrid
