#include <kgview/graph/layout/force_directed_layout.h>
#include <kgview/graph/graph_model.h>
#include <kgview/core/config.h>
#include <kgview/core/random_source.h>

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace kgview {
namespace graph {

namespace {
constexpr float kGoldenAngle = 2.39996322972865332f; // pi * (3 - sqrt(5))
constexpr float kCoincidentEpsilon = 1e-6f;

bool IsFinite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
} // anonymous namespace

struct ForceDirectedLayoutDetail {
    // Even spacing on a sphere by index (Fibonacci lattice), so no two nodes
    // start coincident.
    static glm::vec3 SpherePosition(ForceDirectedLayout& layout, std::size_t index, std::size_t count) {
        const float n = static_cast<float>(count);
        const float y = 1.0f - 2.0f * (static_cast<float>(index) + 0.5f) / n;
        const float ring = std::sqrt(std::max(0.0f, 1.0f - y * y));
        const float theta = kGoldenAngle * static_cast<float>(index);

        glm::vec3 p(ring * std::cos(theta), y, ring * std::sin(theta));
        p *= layout.params_.initial_radius;

        const float jitter = layout.params_.initial_jitter;
        if (jitter > 0.0f) {
            p.x += layout.rng_->NextFloat(-jitter, jitter);
            p.y += layout.rng_->NextFloat(-jitter, jitter);
            p.z += layout.rng_->NextFloat(-jitter, jitter);
        }
        return p;
    }

    static glm::vec3 RandomUnitVector(ForceDirectedLayout& layout) {
        for (int attempt = 0; attempt < 8; ++attempt) {
            glm::vec3 v(layout.rng_->NextFloat(-1.0f, 1.0f),
                        layout.rng_->NextFloat(-1.0f, 1.0f),
                        layout.rng_->NextFloat(-1.0f, 1.0f));
            const float len = glm::length(v);
            if (len > 1e-3f && len <= 1.0f) return v / len;
        }
        return glm::vec3(1.0f, 0.0f, 0.0f);
    }

    static void ApplyPairRepulsion(ForceDirectedLayout& layout, std::size_t i, std::size_t j) {
        glm::vec3 delta = layout.positions_[i] - layout.positions_[j];
        float distance = glm::length(delta);
        glm::vec3 direction;
        if (distance < kCoincidentEpsilon) {
            direction = RandomUnitVector(layout);
        } else {
            direction = delta / distance;
        }
        distance = std::max(distance, layout.params_.min_distance);

        const float magnitude = layout.params_.repulsion / (distance * distance);
        layout.displacements_[i] += direction * magnitude;
        layout.displacements_[j] -= direction * magnitude;
    }

    static void CalculateRepulsiveForces(ForceDirectedLayout& layout) {
        const std::size_t count = layout.positions_.size();
        if (count < 2) return;

        if (static_cast<int>(count) <= layout.params_.spatial_hash_threshold) {
            for (std::size_t i = 0; i < count; ++i) {
                for (std::size_t j = i + 1; j < count; ++j) {
                    ApplyPairRepulsion(layout, i, j);
                }
            }
            return;
        }

        const float cutoff = layout.params_.repulsion_cutoff;
        layout.spatial_hash_.Insert(layout.positions_);
        for (std::size_t i = 0; i < count; ++i) {
            for (std::uint32_t j : layout.spatial_hash_.Query(layout.positions_[i], cutoff)) {
                if (j <= i) continue;
                if (glm::length(layout.positions_[i] - layout.positions_[j]) > cutoff) continue;
                ApplyPairRepulsion(layout, i, j);
            }
        }
    }

    // Spring without rest length: pull proportional to distance.
    static void CalculateAttractiveForces(ForceDirectedLayout& layout) {
        for (const auto& edge : layout.edges_) {
            if (edge.first == edge.second) continue;
            const glm::vec3 delta = layout.positions_[edge.second] - layout.positions_[edge.first];
            const glm::vec3 pull = delta * layout.params_.attraction;
            layout.displacements_[edge.first] += pull;
            layout.displacements_[edge.second] -= pull;
        }
    }

    static void ApplyDisplacements(ForceDirectedLayout& layout) {
        const float max_step = layout.params_.max_step;
        for (std::size_t i = 0; i < layout.positions_.size(); ++i) {
            glm::vec3 step = layout.displacements_[i];
            if (!IsFinite(step)) continue;
            const float len = glm::length(step);
            if (max_step > 0.0f && len > max_step) {
                step *= max_step / len;
            }
            layout.positions_[i] += step;
        }
    }
};

ForceDirectedLayout::LayoutParams::LayoutParams()
    : iterations(config::kDefaultLayoutIterations),
      repulsion(config::kDefaultRepulsion),
      attraction(config::kDefaultAttraction),
      initial_radius(config::kDefaultInitialRadius),
      min_distance(config::kDefaultMinDistance),
      max_step(config::kDefaultMaxStep),
      initial_jitter(config::kDefaultInitialJitter),
      warm_start(false),
      spatial_hash_threshold(config::kDefaultSpatialHashThreshold),
      repulsion_cutoff(config::kDefaultRepulsionCutoff) {}

ForceDirectedLayout::ForceDirectedLayout(core::RandomSource& rng, const LayoutParams& params)
    : params_(params), rng_(&rng), spatial_hash_(params.repulsion_cutoff) {}

void ForceDirectedLayout::Initialize(const GraphModel& model, const PositionMap* previous) {
    const std::size_t count = model.NodeCount();
    node_ids_.clear();
    node_ids_.reserve(count);
    positions_.assign(count, glm::vec3(0.0f));
    displacements_.assign(count, glm::vec3(0.0f));

    for (std::size_t i = 0; i < count; ++i) {
        const NodeId& id = model.Nodes()[i].id();
        node_ids_.push_back(id);

        // The sphere slot is drawn for every node so the random sequence does
        // not depend on which nodes were warm-started.
        glm::vec3 start = ForceDirectedLayoutDetail::SpherePosition(*this, i, count);
        if (params_.warm_start && previous) {
            auto it = previous->find(id);
            if (it != previous->end() && IsFinite(it->second)) {
                start = it->second;
            }
        }
        positions_[i] = start;
    }
    initial_positions_ = positions_;

    edges_.clear();
    edges_.reserve(model.EdgeCount());
    for (const auto& edge : model.Edges()) {
        edges_.emplace_back(edge.source, edge.target);
    }

    current_iteration_ = 0;
    is_running_ = count > 0 && params_.iterations > 0;
}

bool ForceDirectedLayout::UpdateLayout() {
    if (!is_running_ || current_iteration_ >= params_.iterations) {
        is_running_ = false;
        return false;
    }

    std::fill(displacements_.begin(), displacements_.end(), glm::vec3(0.0f));
    ForceDirectedLayoutDetail::CalculateRepulsiveForces(*this);
    ForceDirectedLayoutDetail::CalculateAttractiveForces(*this);
    ForceDirectedLayoutDetail::ApplyDisplacements(*this);

    current_iteration_++;
    if (current_iteration_ >= params_.iterations) {
        is_running_ = false;
    }
    return is_running_;
}

PositionMap ForceDirectedLayout::ComputeLayout(const GraphModel& model, const PositionMap* previous) {
    Initialize(model, previous);

    while (UpdateLayout()) {
        // Continue until the iteration budget is spent
    }
    return GetPositions();
}

PositionMap ForceDirectedLayout::GetPositions() const {
    PositionMap result;
    result.reserve(node_ids_.size());
    for (std::size_t i = 0; i < node_ids_.size(); ++i) {
        glm::vec3 p = positions_[i];
        if (!IsFinite(p)) {
            std::cerr << "Warning: layout produced a non-finite position for node '" << node_ids_[i]
                      << "', resetting it to its start position." << std::endl;
            p = IsFinite(initial_positions_[i]) ? initial_positions_[i] : glm::vec3(0.0f);
        }
        result.emplace(node_ids_[i], p);
    }
    return result;
}

bool ForceDirectedLayout::IsRunning() const {
    return is_running_;
}

void ForceDirectedLayout::SetParams(const LayoutParams& params) {
    params_ = params;
    spatial_hash_ = SpatialHash(params_.repulsion_cutoff);
    is_running_ = false;
    current_iteration_ = 0;
}

} // namespace graph
} // namespace kgview
