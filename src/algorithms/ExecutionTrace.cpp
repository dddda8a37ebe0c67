#include "ExecutionTrace.h"
#include "sociograph/common/Logger.h"

namespace sociograph {
namespace algorithms {

double ExecutionTrace::elapsedMs() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
}

void ExecutionTrace::record(StepType type, NodeId node, NodeId from, double value, int index) {
    AlgorithmStep step;
    step.type = type;
    step.nodeId = node;
    step.fromNode = from;
    step.value = value;
    step.index = index;
    step.elapsedMs = elapsedMs();
    steps_.push_back(step);
}

AlgorithmResult ExecutionTrace::succeed(const char* name, AlgorithmPayload payload,
                                        std::string message) {
    AlgorithmResult result;
    result.name = name;
    result.success = true;
    result.elapsedMs = elapsedMs();
    result.payload = std::move(payload);
    result.steps = std::move(steps_);
    result.message = std::move(message);
    steps_.clear();

    LOG_DEBUG("{} finished in {:.3f} ms ({} steps): {}", result.name, result.elapsedMs,
              result.steps.size(), result.message);
    return result;
}

AlgorithmResult ExecutionTrace::fail(const char* name, AlgorithmError error, std::string message) {
    AlgorithmResult result;
    result.name = name;
    result.success = false;
    result.error = error;
    result.elapsedMs = elapsedMs();
    result.message = std::move(message);
    steps_.clear();

    LOG_WARN("{} failed ({}): {}", result.name, toString(error), result.message);
    return result;
}

std::string checkStartNode(const Graph& graph, const AlgorithmParams& params) {
    if (!params.startId) {
        return "start node not specified";
    }
    if (!graph.hasNode(*params.startId)) {
        return fmt::format("start node {} not found", *params.startId);
    }
    return {};
}

}  // namespace algorithms
}  // namespace sociograph
