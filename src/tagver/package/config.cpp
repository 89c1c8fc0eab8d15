#include "./config.hpp"

#include "./error.hpp"

#include <tagver/error/on_error.hpp>
#include <tagver/util/log.hpp>
#include <tagver/util/yaml/errors.hpp>
#include <tagver/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/iterator.h>
#include <yaml-cpp/yaml.h>

using namespace tagver;

namespace {

std::string scalar_string(const YAML::Node& node, std::string_view key) {
    if (!node.IsScalar()) {
        BOOST_LEAF_THROW_EXCEPTION(config_error(fmt::format("Manifest key '{}' must be a string",
                                                            key)),
                                   e_manifest_key{std::string(key)});
    }
    return node.Scalar();
}

}  // namespace

config config::from_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        BOOST_LEAF_THROW_EXCEPTION(config_error("A package manifest must be a mapping"));
    }

    config ret;
    for (auto& pair : node) {
        auto key = pair.first.as<std::string>();
        if (key == "name") {
            ret.name = scalar_string(pair.second, key);
        } else if (key == "version") {
            ret.version = scalar_string(pair.second, key);
        } else if (key == "workspace") {
            if (!pair.second.IsSequence()) {
                BOOST_LEAF_THROW_EXCEPTION(
                    config_error("Manifest key 'workspace' must be a list of directories"),
                    e_manifest_key{key});
            }
            for (auto& child : pair.second) {
                ret.workspace.push_back(scalar_string(child, key));
            }
        } else {
            tagver_log(trace, "Ignoring unrecognized manifest key '{}'", key);
        }
    }
    return ret;
}

std::optional<fs::path> tagver::find_manifest(path_ref dir) {
    for (auto fname : {"pkg.yaml", "pkg.json"}) {
        auto cand = dir / fname;
        if (file_exists(cand)) {
            return cand;
        }
    }
    if (file_exists(dir / "pkg.yml")) {
        tagver_log(warn,
                   "There's a [pkg.yml] file in the package directory, but tagver expects a "
                   "'.yaml' file extension. The file [{}] will be ignored.",
                   (dir / "pkg.yml").string());
    }
    return std::nullopt;
}

config tagver::load_config(path_ref dir) {
    TAGVER_E_SCOPE(e_package_directory{dir});
    auto manifest = find_manifest(dir);
    if (!manifest) {
        BOOST_LEAF_THROW_EXCEPTION(
            config_error(fmt::format("Cannot read package config: No pkg.yaml or pkg.json in [{}]",
                                     dir.string())));
    }
    TAGVER_E_SCOPE(e_manifest_path{*manifest});
    tagver_log(debug, "Loading package manifest [{}]", manifest->string());
    YAML::Node node;
    try {
        node = parse_yaml_file(*manifest);
    } catch (const YAML::Exception& exc) {
        BOOST_LEAF_THROW_EXCEPTION(config_error(fmt::format("Cannot parse package config [{}]: {}",
                                                            manifest->string(),
                                                            exc.what())),
                                   e_yaml_parse_error{exc.what()});
    }
    return config::from_yaml(node);
}
