#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "gAI/ModelLoader.hpp"
#include "gAI/Types.hpp"

namespace gAI {

// Body of a /predict response, also used for each /predict-batch entry.
// Rejections and failures keep the success shape with a null prediction,
// zero confidence and a populated "error".
nlohmann::json toJson(const PredictionOutcome& outcome);

// Body of a /health response
nlohmann::json toJson(const HealthSnapshot& health, LoadState state);

// Batch entry for a file refused at the boundary
nlohmann::json itemError(const std::string& filename, const std::string& message);

} // namespace gAI
