#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kgview {
namespace core {

struct CommandLineOptions {
    std::string graph_path;
    std::optional<std::uint32_t> seed;  // Fixed layout seed; random when absent
    bool no_animate = false;
    int iterations_per_frame = 0;
    bool warm_start = false;
    bool show_help = false;
};

// kgview <graph.json> [--seed N] [--no-animate] [--chunk N] [--warm-start]
// args excludes the program name. Throws std::invalid_argument on bad input.
CommandLineOptions ParseCommandLine(const std::vector<std::string>& args);

std::string UsageText(const std::string& program_name);

} // namespace core
} // namespace kgview
