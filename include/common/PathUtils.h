#pragma once

#include <string>
#include <filesystem>

namespace crosstrade {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable, or the working directory
    // when /proc/self/exe cannot be read.
    static std::filesystem::path getExecutableDir();
    
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace crosstrade
