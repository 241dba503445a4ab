#pragma once

#include <string>

namespace arbor::core {

struct FileSystem {
    static bool exists(const std::string& path);

    // Returns an empty string if the file cannot be opened
    static std::string read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace arbor::core
