#include <kgview/core/filesystem_utils.h>
#include <cstdlib>
#include <system_error>

namespace kgview {
namespace utils {

std::filesystem::path get_home_directory_path() {
    #ifdef _WIN32
        const char* userprofile = std::getenv("USERPROFILE");
        if (userprofile) {
            return std::filesystem::path(userprofile);
        }
        const char* homedrive = std::getenv("HOMEDRIVE");
        const char* homepath = std::getenv("HOMEPATH");
        if (homedrive && homepath) {
            return std::filesystem::path(homedrive) / homepath;
        }
    #else
        const char* home_env = std::getenv("HOME");
        if (home_env && *home_env) {
            return std::filesystem::path(home_env);
        }
    #endif
    return std::filesystem::path();
}

std::optional<std::filesystem::file_time_type> get_last_write_time(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    auto time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return time;
}

} // namespace utils
} // namespace kgview
