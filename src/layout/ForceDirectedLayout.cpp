#include "sociograph/layout/ForceDirectedLayout.h"
#include "sociograph/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <unordered_map>
#include <vector>

namespace sociograph {

ForceDirectedLayout::ForceDirectedLayout() : ForceDirectedLayout(ForceLayoutOptions{}) {}

ForceDirectedLayout::ForceDirectedLayout(const ForceLayoutOptions& options) {
    setOptions(options);
    temperature_ = options_.initialTemperature;
}

void ForceDirectedLayout::setOptions(const ForceLayoutOptions& options) {
    options_ = options;

    // damping >= 1 lets kinetic energy grow without bound
    if (options_.damping < 0.0 || options_.damping >= 1.0) {
        LOG_WARN("Layout damping {} outside [0, 1), clamped", options_.damping);
        options_.damping = std::clamp(options_.damping, 0.0, 0.99);
    }
    if (options_.coolingRate <= 0.0 || options_.coolingRate > 1.0) {
        LOG_WARN("Layout cooling rate {} outside (0, 1], using 1", options_.coolingRate);
        options_.coolingRate = 1.0;
    }
    if (options_.minDistance < 0.0) {
        LOG_WARN("Layout min distance {} negative, using 0", options_.minDistance);
        options_.minDistance = 0.0;
    }
    if (options_.maxVelocity <= 0.0) {
        LOG_WARN("Layout max velocity {} not positive, using default", options_.maxVelocity);
        options_.maxVelocity = ForceLayoutOptions{}.maxVelocity;
    }
    options_.minTemperature = std::min(options_.minTemperature, options_.initialTemperature);
    temperature_ = std::clamp(temperature_, options_.minTemperature, options_.initialTemperature);
}

Point ForceDirectedLayout::separationDirection(NodeId a, NodeId b) {
    const uint32_t hash = (a * 73u + b * 151u) % 360u;
    const double angle = static_cast<double>(hash) * std::numbers::pi / 180.0;
    return {std::cos(angle), std::sin(angle)};
}

bool ForceDirectedLayout::step(Graph& graph) {
    const std::vector<NodeId> ids = graph.nodes();
    if (ids.empty()) {
        return false;
    }

    const std::size_t n = ids.size();
    std::vector<Point> positions(n);
    std::vector<Point> velocities(n);
    std::vector<Point> forces(n);
    std::unordered_map<NodeId, std::size_t> index;
    index.reserve(n);

    Point centroid;
    for (std::size_t i = 0; i < n; ++i) {
        const NodeData& node = graph.getNode(ids[i]);
        positions[i] = node.position;
        velocities[i] = node.velocity;
        index[ids[i]] = i;
        centroid += node.position;
    }
    centroid = centroid / static_cast<double>(n);

    // Repulsion between every pair
    const double minDistance = std::max(options_.minDistance, COINCIDENT_EPSILON);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            const Point delta = positions[i] - positions[j];
            const double distance = delta.length();
            const Point direction = distance < COINCIDENT_EPSILON
                                        ? separationDirection(ids[i], ids[j])
                                        : delta / distance;
            const double effective = std::max(distance, minDistance);
            const Point force = direction * (options_.repulsion / (effective * effective));
            forces[i] += force;
            forces[j] -= force;
        }
    }

    // Edge springs
    for (const EdgeData& edge : graph.edges()) {
        const std::size_t i = index.at(edge.source);
        const std::size_t j = index.at(edge.target);
        const Point delta = positions[j] - positions[i];
        const double distance = delta.length();
        if (distance < COINCIDENT_EPSILON) continue;

        double strength = options_.attraction;
        if (options_.weightModulation) {
            strength *= 1.0 + edge.weight;
        }
        const Point force = delta / distance * (strength * (distance - options_.springLength));
        forces[i] += force;
        forces[j] -= force;
    }

    // Centering gravity fades as the layout cools
    const double pull = options_.gravity * temperature_;
    for (std::size_t i = 0; i < n; ++i) {
        const Point delta = centroid - positions[i];
        const double distance = delta.length();
        if (distance > COINCIDENT_EPSILON) {
            forces[i] += delta / distance * pull;
        }
    }

    kineticEnergy_ = 0.0;
    maxDisplacement_ = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        Point velocity = (velocities[i] + forces[i]) * options_.damping;
        const double speed = velocity.length();
        if (speed > options_.maxVelocity) {
            velocity = velocity / speed * options_.maxVelocity;
        }

        const Point displacement = velocity * temperature_;
        kineticEnergy_ += velocity.x * velocity.x + velocity.y * velocity.y;
        maxDisplacement_ = std::max(maxDisplacement_, displacement.length());

        graph.setNodeVelocity(ids[i], velocity);
        graph.setNodePosition(ids[i], positions[i] + displacement);
    }

    temperature_ = std::max(options_.minTemperature, temperature_ * options_.coolingRate);
    ++stepCount_;
    return true;
}

std::size_t ForceDirectedLayout::run(Graph& graph) {
    return run(graph, options_.iterations);
}

std::size_t ForceDirectedLayout::run(Graph& graph, std::size_t iterations) {
    start();
    std::size_t taken = 0;
    while (running_ && taken < iterations) {
        if (!step(graph)) break;
        ++taken;
        if (observer_) {
            observer_(taken, *this);
        }
    }
    running_ = false;

    LOG_DEBUG("Layout ran {} steps: temperature={:.4f} energy={:.4f} maxDisplacement={:.4f}",
              taken, temperature_, kineticEnergy_, maxDisplacement_);
    return taken;
}

void ForceDirectedLayout::reset(Graph& graph) {
    graph.resetVelocities();
    temperature_ = options_.initialTemperature;
    kineticEnergy_ = 0.0;
    maxDisplacement_ = 0.0;
    stepCount_ = 0;
}

void ForceDirectedLayout::reheat() {
    temperature_ = std::min(options_.initialTemperature, temperature_ + REHEAT_AMOUNT);
}

}  // namespace sociograph
