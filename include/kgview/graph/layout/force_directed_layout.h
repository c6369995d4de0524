#ifndef KGVIEW_FORCE_DIRECTED_LAYOUT_H
#define KGVIEW_FORCE_DIRECTED_LAYOUT_H

#include <kgview/core/id_types.h>
#include <kgview/graph/layout/spatial_hash.h>

#include <glm/vec3.hpp>

#include <unordered_map>
#include <utility>
#include <vector>

namespace kgview {

namespace core {
class RandomSource;
}

namespace graph {

class GraphModel;

using PositionMap = std::unordered_map<NodeId, glm::vec3>;

/*
 * Force-directed 3D layout. Each iteration sums pairwise repulsion and
 * per-edge attraction into a displacement that is applied to the position
 * directly; there is no velocity or time step.
 *
 * Repulsion is O(n^2) per iteration. Above spatial_hash_threshold nodes only
 * pairs within repulsion_cutoff are visited.
 */
class ForceDirectedLayout {
public:
    struct LayoutParams {
        int iterations;
        float repulsion;
        float attraction;
        float initial_radius;
        float min_distance;         // Pair distances are clamped to at least this
        float max_step;             // Per-iteration displacement cap
        float initial_jitter;
        bool warm_start;            // Reuse previous positions for persisting nodes
        int spatial_hash_threshold;
        float repulsion_cutoff;

        LayoutParams();
    };

private:
    LayoutParams params_;
    core::RandomSource* rng_;
    std::vector<NodeId> node_ids_;
    std::vector<std::pair<NodeIndex, NodeIndex>> edges_;
    std::vector<glm::vec3> positions_;
    std::vector<glm::vec3> initial_positions_;
    std::vector<glm::vec3> displacements_;
    SpatialHash spatial_hash_;
    bool is_running_ = false;
    int current_iteration_ = 0;
    friend struct ForceDirectedLayoutDetail;

public:
    explicit ForceDirectedLayout(core::RandomSource& rng, const LayoutParams& params = LayoutParams());

    // Places nodes on the start sphere. With warm_start, nodes found in
    // previous keep their old position.
    void Initialize(const GraphModel& model, const PositionMap* previous = nullptr);
    // Runs one iteration. Returns false once all iterations are done.
    bool UpdateLayout();
    // Initialize + all iterations, synchronously.
    PositionMap ComputeLayout(const GraphModel& model, const PositionMap* previous = nullptr);

    PositionMap GetPositions() const;
    const std::vector<glm::vec3>& GetPositionArray() const { return positions_; }

    bool IsRunning() const;
    int GetCurrentIteration() const { return current_iteration_; }
    const LayoutParams& GetParams() const { return params_; }
    void SetParams(const LayoutParams& params);
};

} // namespace graph
} // namespace kgview

#endif // KGVIEW_FORCE_DIRECTED_LAYOUT_H
