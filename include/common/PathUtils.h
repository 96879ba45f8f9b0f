#pragma once

#include <string>
#include <filesystem>

namespace signalbench {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable
    static std::filesystem::path getExecutableDir();

    // Relative paths resolve against the working directory when the target
    // exists there, otherwise against the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace signalbench
