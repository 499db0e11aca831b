#pragma once
#include "sitnikov/types.hpp"

namespace sitnikov {

// Throws ConfigurationInvalid if any parameter of `cfg` is out of range
void validate(const ModelCfg& cfg);

// Core: Sitnikov problem with a fixed-step integrator, optionally with MEGNOs.
// Invalid configuration throws; integration failures are reported through
// `status` and `message` with empty series.
TrajectorySitnikov simulate_sitnikov(const ModelCfg& cfg);

class Model;

// Same, on an already constructed model
TrajectorySitnikov simulate_sitnikov(Model& model);

} // namespace sitnikov
