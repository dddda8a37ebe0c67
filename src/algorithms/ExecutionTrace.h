#pragma once

#include "sociograph/algorithms/IGraphAlgorithm.h"

#include <chrono>
#include <string>
#include <vector>

namespace sociograph {
namespace algorithms {

/// Collects the step log and wall-clock timing of a single algorithm run and
/// packages them into an AlgorithmResult.
class ExecutionTrace {
public:
    ExecutionTrace() : start_(Clock::now()) {}

    /// Milliseconds since construction
    double elapsedMs() const;

    void record(StepType type, NodeId node, NodeId from = INVALID_NODE,
                double value = 0.0, int index = 0);

    std::size_t stepCount() const { return steps_.size(); }

    AlgorithmResult succeed(const char* name, AlgorithmPayload payload, std::string message);

    /// Failed results carry no steps or payload
    AlgorithmResult fail(const char* name, AlgorithmError error, std::string message);

private:
    using Clock = std::chrono::steady_clock;

    Clock::time_point start_;
    std::vector<AlgorithmStep> steps_;
};

/// Common validation of a start parameter
/// @return Error message, empty if the start node exists
std::string checkStartNode(const Graph& graph, const AlgorithmParams& params);

}  // namespace algorithms
}  // namespace sociograph
