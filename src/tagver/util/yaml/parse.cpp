#include "./parse.hpp"

#include "./errors.hpp"

#include <tagver/error/on_error.hpp>
#include <tagver/util/fs.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

#include <string>

using namespace tagver;

YAML::Node tagver::parse_yaml_file(const std::filesystem::path& fpath) {
    TAGVER_E_SCOPE(e_parse_yaml_file_path{fpath});
    auto content = tagver::read_file(fpath);
    return parse_yaml_string(content);
}

YAML::Node tagver::parse_yaml_string(std::string_view sv) {
    try {
        return YAML::Load(std::string(sv));
    } catch (YAML::Exception const& exc) {
        BOOST_LEAF_THROW_EXCEPTION(exc, e_yaml_parse_error{exc.what()});
    }
}
