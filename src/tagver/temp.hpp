#pragma once

#include <tagver/util/fs.hpp>

#include <memory>

namespace tagver {

/**
 * @brief A freshly created, uniquely named directory.
 *
 * Copies share ownership of the directory. The directory and all of its contents are removed when
 * the last copy is destroyed.
 */
class temporary_dir {
    std::shared_ptr<const fs::path> _path;

    explicit temporary_dir(fs::path p);

public:
    /// Create a new directory within the system's temporary directory
    static temporary_dir create();

    path_ref path() const noexcept { return *_path; }
};

}  // namespace tagver
