#include "common/PathUtils.h"

#include <system_error>

namespace tickpilot {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const std::filesystem::path from_cwd = std::filesystem::current_path() / relative_path;
    std::error_code ec;
    if (std::filesystem::exists(from_cwd, ec) || std::filesystem::exists(from_cwd.parent_path(), ec)) {
        return from_cwd;
    }
    return getExecutableDir() / relative_path;
}

} // namespace utils
} // namespace tickpilot
