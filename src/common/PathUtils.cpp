#include "common/PathUtils.h"

#include <system_error>

namespace signalbench {
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
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    const auto from_cwd = ec ? std::filesystem::path(relative_path) : cwd / relative_path;
    if (std::filesystem::exists(from_cwd, ec)) {
        return from_cwd;
    }
    const auto from_exe = getExecutableDir() / relative_path;
    if (std::filesystem::exists(from_exe, ec)) {
        return from_exe;
    }
    // Neither exists yet (output paths): create under the working directory
    return from_cwd;
}

} // namespace utils
} // namespace signalbench
