#pragma once

#include "../core/Graph.h"
#include "ForceLayoutOptions.h"

#include <cstddef>
#include <functional>

namespace sociograph {

/// Iterative spring-electrical layout that moves node positions in place.
///
/// Each step applies pairwise repulsion, edge springs and a weak centering
/// pull, integrates velocities with damping and a speed cap, then cools the
/// temperature that scales displacement. Velocities live on the nodes, so
/// stopping and restarting resumes from the same physical state.
///
/// Usage:
/// @code
/// ForceDirectedLayout layout;
/// std::size_t steps = layout.run(graph);   // up to options().iterations
///
/// layout.start();                          // or drive it frame by frame
/// while (layout.isRunning() && layout.step(graph)) { ... }
/// @endcode
class ForceDirectedLayout {
public:
    /// Called after each step of run(); may call stop() to end the run
    using StepObserver = std::function<void(std::size_t step, ForceDirectedLayout& layout)>;

    ForceDirectedLayout();
    explicit ForceDirectedLayout(const ForceLayoutOptions& options);

    void setOptions(const ForceLayoutOptions& options);
    const ForceLayoutOptions& options() const { return options_; }

    void setStepObserver(StepObserver observer) { observer_ = std::move(observer); }

    // Run state
    void start() { running_ = true; }
    void stop() { running_ = false; }
    bool isRunning() const { return running_; }

    /// Advance one step regardless of run state
    /// @return false if the graph has no nodes
    bool step(Graph& graph);

    /// Run up to options().iterations steps, or until stop() is called
    /// @return Number of steps taken
    std::size_t run(Graph& graph);
    std::size_t run(Graph& graph, std::size_t iterations);

    /// Zero node velocities and restore the initial temperature
    void reset(Graph& graph);

    /// Raise temperature by 0.3, capped at the initial temperature
    void reheat();

    double temperature() const { return temperature_; }

    /// Sum of squared node speeds after the last step
    double kineticEnergy() const { return kineticEnergy_; }

    /// Largest per-node displacement of the last step
    double maxDisplacement() const { return maxDisplacement_; }

    /// Steps taken since construction or reset()
    std::size_t stepCount() const { return stepCount_; }

private:
    static constexpr double REHEAT_AMOUNT = 0.3;
    static constexpr double COINCIDENT_EPSILON = 1e-9;

    /// Deterministic unit vector separating two coincident nodes
    static Point separationDirection(NodeId a, NodeId b);

    ForceLayoutOptions options_;
    StepObserver observer_;
    bool running_ = false;
    double temperature_ = 1.0;
    double kineticEnergy_ = 0.0;
    double maxDisplacement_ = 0.0;
    std::size_t stepCount_ = 0;
};

}  // namespace sociograph
