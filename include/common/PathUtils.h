#pragma once

#include <string>
#include <filesystem>

namespace auctionheat {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable
    static std::filesystem::path getExecutableDir();
    
    // Executable-relative path to absolute path
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace auctionheat
