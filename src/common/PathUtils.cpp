#include "common/PathUtils.h"

#ifdef _WIN32
#include <Windows.h>
#else
#include <limits.h>
#include <unistd.h>
#endif

namespace auctionheat {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
#ifdef _WIN32
    char buffer[MAX_PATH];
    GetModuleFileNameA(NULL, buffer, MAX_PATH);
    std::filesystem::path exe_path(buffer);
    return exe_path.parent_path();
#else
    char buffer[PATH_MAX];
    const ssize_t len = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len <= 0) {
        return std::filesystem::current_path();
    }
    buffer[len] = '\0';
    return std::filesystem::path(buffer).parent_path();
#endif
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    // Working-directory copy wins over the one beside the binary
    std::error_code ec;
    const auto cwd_candidate = std::filesystem::current_path(ec) / relative_path;
    if (!ec && std::filesystem::exists(cwd_candidate)) {
        return cwd_candidate;
    }
    return getExecutableDir() / relative_path;
}

} // namespace utils
} // namespace auctionheat
