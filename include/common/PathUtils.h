#pragma once

#include <string>
#include <filesystem>

namespace stratlab {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the CWD)
    static std::filesystem::path getExecutableDir();

    // An existing CWD-relative path wins; otherwise resolve next to the executable
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace stratlab
