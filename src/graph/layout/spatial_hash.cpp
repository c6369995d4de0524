#include <kgview/graph/layout/spatial_hash.h>

#include <algorithm>
#include <cmath>

namespace kgview {
namespace graph {

SpatialHash::SpatialHash(float cell_size) : cell_size_(std::max(1.0f, cell_size)) {}

std::int32_t SpatialHash::CellCoord(float value) const {
    return static_cast<std::int32_t>(std::floor(value / cell_size_));
}

void SpatialHash::Insert(const std::vector<glm::vec3>& positions) {
    buckets_.clear();
    buckets_.reserve(positions.size() * 2);

    for (std::size_t idx = 0; idx < positions.size(); ++idx) {
        const glm::vec3& p = positions[idx];
        buckets_[detail::PackCell(CellCoord(p.x), CellCoord(p.y), CellCoord(p.z))]
            .push_back(static_cast<std::uint32_t>(idx));
    }
}

std::vector<std::uint32_t> SpatialHash::Query(const glm::vec3& position, float radius) const {
    std::vector<std::uint32_t> result;
    const std::int32_t cx = CellCoord(position.x);
    const std::int32_t cy = CellCoord(position.y);
    const std::int32_t cz = CellCoord(position.z);
    const int search_radius = static_cast<int>(std::ceil(radius / cell_size_));

    for (int dx = -search_radius; dx <= search_radius; ++dx) {
        for (int dy = -search_radius; dy <= search_radius; ++dy) {
            for (int dz = -search_radius; dz <= search_radius; ++dz) {
                auto bucket_it = buckets_.find(detail::PackCell(cx + dx, cy + dy, cz + dz));
                if (bucket_it != buckets_.end()) {
                    result.insert(result.end(), bucket_it->second.begin(), bucket_it->second.end());
                }
            }
        }
    }
    return result;
}

} // namespace graph
} // namespace kgview
