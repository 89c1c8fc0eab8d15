#include "./error_handler.hpp"

#include <tagver/error/handle.hpp>
#include <tagver/git/error.hpp>
#include <tagver/package/error.hpp>
#include <tagver/util/fs.hpp>
#include <tagver/util/log.hpp>
#include <tagver/util/proc.hpp>
#include <tagver/util/yaml/errors.hpp>

#include <semver/ident.hpp>
#include <semver/version.hpp>

#include <boost/leaf.hpp>

#include <system_error>

using namespace tagver;

namespace {

auto handlers = std::tuple(  //
    [](const version_error&       exc,
       e_package_directory const* dir,
       e_tag_name const*          tag,
       e_declared_version const*  declared) {
        tagver_log(error, "Invalid versioning: {}", exc.what());
        if (tag) {
            tagver_log(error, "  (While reading release tag '{}')", tag->value);
        }
        if (declared) {
            tagver_log(error, "  (The declared version is '{}')", declared->value);
        }
        if (dir) {
            tagver_log(error, "  (In package [{}])", dir->value.string());
        }
        return 1;
    },
    [](const config_error&       exc,
       e_manifest_path const*    manifest,
       e_manifest_key const*     key,
       e_yaml_parse_error const* yaml_err) {
        tagver_log(error, "{}", exc.what());
        if (key) {
            tagver_log(error, "  (While reading the '{}' key)", key->value);
        }
        if (yaml_err) {
            tagver_log(debug, "YAML parser error: {}", yaml_err->value);
        }
        if (manifest) {
            tagver_log(error, "  (While loading manifest [{}])", manifest->value.string());
        }
        return 1;
    },
    [](const git::git_error& exc) {
        tagver_log(error, "{}", exc.what());
        tagver_log(error, "  Command: {}", quote_command(exc.command));
        tagver_log(error, "  Exit code: {}", exc.exit_code);
        if (!exc.output.empty()) {
            tagver_log(error, "  Output:\n{}", exc.output);
        }
        return 1;
    },
    [](const git::decode_error& exc, git::e_git_output const* output) {
        tagver_log(error, "Unexpected output from git: {}", exc.what());
        if (output) {
            tagver_log(debug, "The output that failed to decode:\n{}", output->value);
        }
        return 1;
    },
    [](const semver::invalid_version& exc) {
        tagver_log(error, "Invalid semantic version: {}", exc.what());
        return 1;
    },
    [](const semver::invalid_ident& exc) {
        tagver_log(error, "Invalid semantic version identifier: {}", exc.what());
        return 1;
    },
    [](const std::system_error& exc,
       e_open_file_path const*  open_path,
       e_read_file_path const*  read_path) {
        tagver_log(error, "{}: {}", exc.what(), exc.code().message());
        if (read_path) {
            tagver_log(error, "  (While reading file [{}])", read_path->value.string());
        } else if (open_path) {
            tagver_log(error, "  (While opening file [{}])", open_path->value.string());
        }
        return 1;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        leaf_handle_unknown("An unhandled error arose. THIS IS A TAGVER BUG!", diag);
        return 42;
    });

}  // namespace

int tagver::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
