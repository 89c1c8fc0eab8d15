#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagver {

/**
 * @brief Quote a command-line argument for display so that a POSIX shell would read it back as the
 * same single word. Arguments that need no quoting are returned unchanged.
 */
std::string quote_argument(std::string_view);

/// Quote each argument of the command and join them with spaces
template <typename Container>
std::string quote_command(const Container& c) {
    std::string ret;
    for (const auto& arg : c) {
        if (!ret.empty()) {
            ret.push_back(' ');
        }
        ret.append(quote_argument(arg));
    }
    return ret;
}

struct proc_result {
    int signal = 0;
    int retc   = 0;
    // The content written to stdout
    std::string output;
    // The content written to stderr
    std::string error_output;

    bool okay() const noexcept { return retc == 0 && signal == 0; }
};

struct proc_options {
    std::vector<std::string> command;

    std::optional<std::filesystem::path> cwd = std::nullopt;

    /// Variables set in the child's environment, in addition to those inherited from the parent
    std::vector<std::pair<std::string, std::string>> environment = {};
};

/**
 * @brief Execute a subprocess and wait for it to exit, collecting its output.
 *
 * The child's stdin is attached to the null device. Throws std::system_error if the process
 * cannot be spawned or waited on. A non-zero exit is *not* an error at this level.
 */
proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

}  // namespace tagver
