#pragma once

#include <filesystem>
#include <string>

namespace tagver {

struct e_parse_yaml_file_path {
    std::filesystem::path value;
};

struct e_yaml_parse_error {
    std::string value;
};

}  // namespace tagver
