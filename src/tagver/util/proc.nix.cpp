#ifndef _WIN32
#include "./proc.hpp"

#include <tagver/util/log.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

using namespace tagver;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

/// Owns a file descriptor, closing it when destroyed
struct fd_holder {
    int fd = -1;

    fd_holder() = default;
    fd_holder(const fd_holder&) = delete;
    fd_holder& operator=(const fd_holder&) = delete;
    ~fd_holder() { close(); }

    void close() noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

struct pipe_pair {
    fd_holder read;
    fd_holder write;
};

void open_pipe(pipe_pair& p, std::string_view what) {
    int fds[2] = {};
    // Children must not inherit the pipes of other concurrently spawned children
    check_rc(::pipe2(fds, O_CLOEXEC) == 0, what);
    p.read.fd  = fds[0];
    p.write.fd = fds[1];
}

::pid_t spawn_child(const proc_options& opts, int stdout_write, int stderr_write) {
    // We must allocate BEFORE fork(), since the CRT might stumble with malloc()-related locks that
    // are held during the fork().
    std::vector<const char*> strings;
    strings.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        strings.push_back(s.data());
    }
    strings.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (auto& [key, value] : opts.environment) {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (char** var = environ; *var != nullptr; ++var) {
        std::string_view entry = *var;
        auto             key   = entry.substr(0, entry.find('='));
        bool overridden = std::any_of(opts.environment.begin(),
                                      opts.environment.end(),
                                      [&](auto& pair) { return pair.first == key; });
        if (!overridden) {
            envp.push_back(*var);
        }
    }
    for (auto& s : env_strings) {
        envp.push_back(s.data());
    }
    envp.push_back(nullptr);

    std::string workdir = opts.cwd.value_or(std::filesystem::current_path()).string();
    auto        not_found_err
        = fmt::format("[tagver child executor] The requested executable [{}] could not be found.",
                      strings[0]);

    auto child_pid = ::fork();
    check_rc(child_pid != -1, "Failed to fork() a subprocess");
    if (child_pid != 0) {
        return child_pid;
    }
    // We are child
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull == -1 || ::dup2(devnull, STDIN_FILENO) == -1
        || ::dup2(stdout_write, STDOUT_FILENO) == -1
        || ::dup2(stderr_write, STDERR_FILENO) == -1) {
        std::fputs("[tagver child executor] Failed to set up stdio\n", stderr);
        std::_Exit(-1);
    }
    if (::chdir(workdir.data()) == -1) {
        std::fputs("[tagver child executor] Failed to chdir() for subprocess\n", stderr);
        std::_Exit(-1);
    }

    environ = envp.data();
    ::execvp(strings[0], (char* const*)strings.data());

    if (errno == ENOENT) {
        std::fputs(not_found_err.c_str(), stderr);
        std::_Exit(-1);
    }

    std::fputs("[tagver child executor] execvp returned! This is a fatal error: ", stderr);
    std::fputs(std::strerror(errno), stderr);
    std::fputs("\n", stderr);
    std::_Exit(-1);
}

}  // namespace

proc_result tagver::run_proc(const proc_options& opts) {
    tagver_log(debug, "Spawning subprocess: {}", quote_command(opts.command));

    pipe_pair stdout_pipe;
    pipe_pair stderr_pipe;
    open_pipe(stdout_pipe, "Create stdout pipe for subprocess");
    open_pipe(stderr_pipe, "Create stderr pipe for subprocess");

    auto child = spawn_child(opts, stdout_pipe.write.fd, stderr_pipe.write.fd);

    stdout_pipe.write.close();
    stderr_pipe.write.close();

    proc_result res;

    std::array<pollfd, 2> fds{};
    fds[0].fd     = stdout_pipe.read.fd;
    fds[0].events = POLLIN;
    fds[1].fd     = stderr_pipe.read.fd;
    fds[1].events = POLLIN;
    std::array<std::string*, 2> sinks   = {&res.output, &res.error_output};
    std::array<fd_holder*, 2>   holders = {&stdout_pipe.read, &stderr_pipe.read};

    std::string buffer;
    buffer.resize(4096);
    int n_open = 2;
    while (n_open > 0) {
        auto rc = ::poll(fds.data(), fds.size(), -1);
        if (rc == -1 && errno == EINTR) {
            errno = 0;
            continue;
        }
        check_rc(rc > 0, "Failed in poll()");
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            auto nread = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (nread == -1 && errno == EINTR) {
                continue;
            }
            check_rc(nread >= 0, "Failed in read()");
            if (nread == 0) {
                // EOF on this stream
                holders[i]->close();
                fds[i].fd = -1;
                --n_open;
                continue;
            }
            sinks[i]->append(buffer.data(), static_cast<std::size_t>(nread));
        }
    }

    int status = 0;
    int rc     = 0;
    do {
        rc = ::waitpid(child, &status, 0);
    } while (rc == -1 && errno == EINTR);
    check_rc(rc >= 0, "Failed in waitpid()");

    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }
    tagver_log(trace, "Subprocess exited [retc={}, signal={}]", res.retc, res.signal);
    return res;
}

#endif  // _WIN32
