#ifndef KGVIEW_FILESYSTEM_UTILS_H
#define KGVIEW_FILESYSTEM_UTILS_H

#include <filesystem>
#include <optional>

namespace kgview {
namespace utils {
    // Get the user's home directory path (cross-platform)
    // Returns an empty path if the home directory cannot be determined
    std::filesystem::path get_home_directory_path();

    // Modification time of a regular file, or nullopt if it cannot be read.
    std::optional<std::filesystem::file_time_type> get_last_write_time(const std::filesystem::path& path);
}
} // namespace kgview

#endif // KGVIEW_FILESYSTEM_UTILS_H
