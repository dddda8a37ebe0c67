#pragma once

#include "../algorithms/AlgorithmOptions.h"
#include "../layout/ForceLayoutOptions.h"

#include <string>

namespace sociograph {

/// Aggregate of all tunable engine settings
struct EngineConfig {
    ForceLayoutOptions layout;
    AlgorithmOptions algorithms;

    static EngineConfig createDefault() { return {}; }
};

/// JSON serialization for EngineConfig
///
/// Format:
/// @code
/// {
///   "layout": { "repulsion": 15000, "attraction": 0.04, "damping": 0.85, ... },
///   "algorithms": { "heuristicScale": 0.01, "defaultTopK": 5 }
/// }
/// @endcode
/// Missing, unknown or wrong-typed keys are ignored and keep their defaults.
class EngineConfigSerializer {
public:
    static std::string toJson(const EngineConfig& config);

    /// Parse JSON text; malformed input logs a warning and yields defaults
    static EngineConfig fromJson(const std::string& jsonStr);

    /// @return false if the file cannot be read or is not valid JSON; out is
    ///         left untouched in that case
    static bool loadFromFile(const std::string& path, EngineConfig& out);

    static bool saveToFile(const std::string& path, const EngineConfig& config);
};

}  // namespace sociograph
