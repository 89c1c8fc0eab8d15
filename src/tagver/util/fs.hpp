#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace tagver {

namespace fs = std::filesystem;

using path_ref = const fs::path&;

struct e_open_file_path {
    fs::path value;
};

struct e_write_file_path {
    fs::path value;
};

struct e_read_file_path {
    fs::path value;
};

[[nodiscard]] std::fstream open_file(path_ref filepath, std::ios::openmode);
void                       write_file(path_ref path, std::string_view);
[[nodiscard]] std::string  read_file(path_ref path);

/**
 * @brief Obtain an absolute, lexically normal form of the given path, without a trailing
 * directory separator
 */
fs::path normalize_path(path_ref);

}  // namespace tagver
