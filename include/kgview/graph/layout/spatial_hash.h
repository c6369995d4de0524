#ifndef KGVIEW_SPATIAL_HASH_H
#define KGVIEW_SPATIAL_HASH_H

#include <glm/vec3.hpp>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace kgview {
namespace graph {

namespace detail {
// Helper: pack 3D grid cell coordinates (21 bits each) into a 64-bit bucket key
constexpr std::uint64_t PackCell(std::int32_t x, std::int32_t y, std::int32_t z) {
    constexpr std::uint64_t kMask = (1ull << 21) - 1;
    return ((static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) & kMask) << 42) |
           ((static_cast<std::uint64_t>(static_cast<std::uint32_t>(y)) & kMask) << 21) |
           (static_cast<std::uint64_t>(static_cast<std::uint32_t>(z)) & kMask);
}
} // namespace detail

// Uniform grid over 3D points, rebuilt once per layout iteration.
class SpatialHash {
public:
    explicit SpatialHash(float cell_size);

    void Insert(const std::vector<glm::vec3>& positions);
    // Indices of all points in cells overlapping the cube of half-size radius.
    std::vector<std::uint32_t> Query(const glm::vec3& position, float radius) const;

    float GetCellSize() const { return cell_size_; }

private:
    std::int32_t CellCoord(float value) const;

    float cell_size_;
    std::unordered_map<std::uint64_t, std::vector<std::uint32_t>> buckets_;
};

} // namespace graph
} // namespace kgview

#endif // KGVIEW_SPATIAL_HASH_H
