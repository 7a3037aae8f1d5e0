#pragma once

#include <string>
#include <filesystem>

namespace tickpilot {
namespace utils {

class PathUtils {
public:
    // directory of the running executable (falls back to the CWD)
    static std::filesystem::path getExecutableDir();

    // relative paths resolve against the CWD first, then the executable dir
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace tickpilot
