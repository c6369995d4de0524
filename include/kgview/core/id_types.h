#pragma once
#include <cstdint>
#include <limits>
#include <string>

namespace kgview {

// Node identifiers come from the data collaborator and are opaque strings.
using NodeId = std::string;

// Dense index of a node inside one GraphModel snapshot.
using NodeIndex = std::uint32_t;

// Sentinel value representing an invalid / unresolved node index
constexpr NodeIndex kInvalidNodeIndex = std::numeric_limits<NodeIndex>::max();

} // namespace kgview
