#include "common/PathUtils.h"

#ifdef _WIN32
#include <Windows.h>
#endif

#include <system_error>

namespace regimepairs {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
#ifdef _WIN32
    char buffer[MAX_PATH];
    GetModuleFileNameA(NULL, buffer, MAX_PATH);
    std::filesystem::path exe_path(buffer);
    return exe_path.parent_path();
#else
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        // procfs unavailable: fall back to the working directory
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
#endif
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

} // namespace utils
} // namespace regimepairs
