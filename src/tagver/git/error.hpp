#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace tagver::git {

/**
 * @brief Thrown when the output of git does not have the structure that was requested of it.
 */
class decode_error : public std::runtime_error {
    using runtime_error::runtime_error;
};

/**
 * @brief Thrown when a git subprocess exits unsuccessfully.
 */
class git_error : public std::runtime_error {
public:
    std::vector<std::string> command;
    int                      exit_code = 0;
    std::string              output;

    git_error(std::string message, std::vector<std::string> command, int exit_code, std::string output)
        : runtime_error(std::move(message))
        , command(std::move(command))
        , exit_code(exit_code)
        , output(std::move(output)) {}
};

/**
 * @brief The directory given to git is not inside of any working tree
 */
class not_a_repository_error : public git_error {
    using git_error::git_error;
};

/// The output of git that failed to decode
struct e_git_output {
    std::string value;
};

/// The full command line of a git invocation that failed
struct e_git_command {
    std::string value;
};

struct e_git_exit_code {
    int value;
};

}  // namespace tagver::git
