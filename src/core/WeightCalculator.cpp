#include "sociograph/core/WeightCalculator.h"

#include <cmath>

namespace sociograph {

double WeightCalculator::weight(const NodeData& a, const NodeData& b) {
    return 1.0 / (1.0 + attributeDistance(a, b));
}

double WeightCalculator::cost(const NodeData& a, const NodeData& b) {
    return 1.0 / weight(a, b);
}

double WeightCalculator::similarityScore(const NodeData& a, const NodeData& b) {
    return weight(a, b) * 100.0;
}

PropertyDifferences WeightCalculator::differences(const NodeData& a, const NodeData& b) {
    PropertyDifferences diff;
    diff.activity = std::abs(a.activity - b.activity);
    diff.interaction = std::abs(a.interaction - b.interaction);
    diff.connection = std::abs(static_cast<double>(a.connectionCount) -
                               static_cast<double>(b.connectionCount));
    diff.total = attributeDistance(a, b);
    return diff;
}

double WeightCalculator::attributeDistance(const NodeData& a, const NodeData& b) {
    const double dActivity = a.activity - b.activity;
    const double dInteraction = a.interaction - b.interaction;
    // connectionCount is unsigned; subtract as doubles
    const double dConnection = static_cast<double>(a.connectionCount) -
                               static_cast<double>(b.connectionCount);
    return std::sqrt(dActivity * dActivity + dInteraction * dInteraction +
                     dConnection * dConnection);
}

}  // namespace sociograph
