#pragma once

#include <yaml-cpp/node/node.h>

#include <filesystem>
#include <string_view>

namespace tagver {

/**
 * @brief Parse the given file as YAML. JSON documents are accepted as well.
 *
 * @throws YAML::Exception with an e_yaml_parse_error attached if the content is malformed.
 */
YAML::Node parse_yaml_file(const std::filesystem::path&);
YAML::Node parse_yaml_string(std::string_view);

}  // namespace tagver
