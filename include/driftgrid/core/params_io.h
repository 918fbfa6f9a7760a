#pragma once

#include <string>

#include "driftgrid/core/params.h"
#include "driftgrid/util/json.h"

namespace driftgrid {

// Parameter presets as JSON. Keys mirror the Params field names; the two
// noise bands and the advection vector are nested objects.
json::Value params_to_json_value(const Params& p);
std::string params_to_json(const Params& p);

// Missing keys keep their defaults; keys with the wrong JSON type throw
// std::runtime_error naming the key. Unknown keys are ignored.
Params params_from_json_value(const json::Value& v);
Params params_from_json(const std::string& json_text);

// File helpers (throw std::runtime_error on I/O or parse failure).
Params load_params_file(const std::string& path);
void save_params_file(const std::string& path, const Params& p);

} // namespace driftgrid
