#include <kgview/core/command_line.h>

#include <limits>
#include <stdexcept>

namespace kgview {
namespace core {

namespace {
long long ParseInteger(const std::string& option, const std::string& text, long long min_value, long long max_value) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects an integer, got '" + text + "'");
    }
    if (consumed != text.size() || value < min_value || value > max_value) {
        throw std::invalid_argument(option + " value out of range: '" + text + "'");
    }
    return value;
}
} // anonymous namespace

CommandLineOptions ParseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto next_value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--seed") {
            options.seed = static_cast<std::uint32_t>(
                ParseInteger(arg, next_value(), 0, std::numeric_limits<std::uint32_t>::max()));
        } else if (arg == "--no-animate") {
            options.no_animate = true;
        } else if (arg == "--chunk") {
            options.iterations_per_frame = static_cast<int>(ParseInteger(arg, next_value(), 0, 10000));
        } else if (arg == "--warm-start") {
            options.warm_start = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (options.graph_path.empty()) {
            options.graph_path = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (options.graph_path.empty() && !options.show_help) {
        throw std::invalid_argument("Missing graph file");
    }
    return options;
}

std::string UsageText(const std::string& program_name) {
    return "Usage: " + program_name + " <graph.json> [options]\n"
           "  --seed N        Fixed layout seed\n"
           "  --no-animate    Start with the frame loop stopped\n"
           "  --chunk N       Layout iterations per frame (0 = all at once)\n"
           "  --warm-start    Keep node positions across graph reloads\n"
           "  -h, --help      Show this help\n";
}

} // namespace core
} // namespace kgview
