//! # Subprocess Execution
//!
//! fork + execvp with pipes for stdin, stdout and stderr. The parent keeps
//! all three pipes non-blocking and multiplexes them with poll(), so large
//! outputs never stall the child, and checks the deadline and the cancel
//! callback between polls.

#include "generate/subprocess.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace forge::generate {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int POLL_INTERVAL_MS = 20;

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        if (sigaction(SIGPIPE, &action, nullptr) != 0) {
            FORGE_LOG_DEBUG("generate", "Failed to ignore SIGPIPE: " << std::strerror(errno));
        }
    });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/// `environ` with `overrides` applied, as "KEY=value" strings.
auto merged_environment(const std::vector<std::pair<std::string, std::string>>& overrides)
    -> std::vector<std::string> {
    std::vector<std::string> out;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string var(*entry);
        std::string key = var.substr(0, var.find('='));
        bool replaced = false;
        for (const auto& [name, value] : overrides) {
            if (name == key) {
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            out.push_back(std::move(var));
        }
    }
    for (const auto& [name, value] : overrides) {
        out.push_back(name + "=" + value);
    }
    return out;
}

/// Reads what is available; closes `fd` at EOF.
void drain(int& fd, std::string& out) {
    char buf[8192];
    while (fd >= 0) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(fd);
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            close_fd(fd);
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return;
    }
}

} // namespace

auto format_command(const std::vector<std::string>& argv) -> std::string {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += "'" + arg + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

auto run_subprocess(const std::vector<std::string>& argv, const SubprocessOptions& options)
    -> SubprocessResult {
    auto start = Clock::now();
    SubprocessResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    ignore_sigpipe_once();

    // Built before fork: the child only calls async-signal-safe functions
    std::vector<char*> c_args;
    for (const auto& a : argv) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> c_env;
    if (!options.env.empty()) {
        env_strings = merged_environment(options.env);
        for (auto& var : env_strings) {
            c_env.push_back(var.data());
        }
        c_env.push_back(nullptr);
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // Close-on-exec so children forked by concurrent workers never inherit
    // these ends; dup2 in the child clears the flag on fds 0, 1 and 2.
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("Failed to fork: ") + std::strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            ::close(p[0]);
            ::close(p[1]);
        }
        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            _exit(126);
        }

        if (c_env.empty()) {
            execvp(c_args[0], c_args.data());
        } else {
            execvpe(c_args[0], c_args.data(), c_env.data());
        }
        _exit(127);
    }

    result.launched = true;
    setpgid(pid, pid);

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    size_t stdin_written = 0;
    if (options.stdin_data.empty()) {
        close_fd(in_fd);
    }

    bool has_deadline = options.timeout_seconds > 0;
    auto deadline = start + std::chrono::duration_cast<Clock::duration>(
                                std::chrono::duration<double>(options.timeout_seconds));

    int status = 0;
    bool exited = false;

    while (true) {
        if (!exited) {
            pid_t ret = waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                exited = true;
            }
        }
        if (exited) {
            // Pick up whatever the child left in the pipes
            drain(out_fd, result.stdout_output);
            drain(err_fd, result.stderr_output);
            break;
        }

        if (has_deadline && Clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        if (options.should_cancel && options.should_cancel()) {
            result.cancelled = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t count = 0;
        if (in_fd >= 0) {
            fds[count++] = {in_fd, POLLOUT, 0};
        }
        if (out_fd >= 0) {
            fds[count++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            fds[count++] = {err_fd, POLLIN, 0};
        }
        if (count == 0) {
            usleep(POLL_INTERVAL_MS * 1000);
            continue;
        }
        if (poll(fds, count, POLL_INTERVAL_MS) < 0 && errno != EINTR) {
            FORGE_LOG_DEBUG("generate", "poll failed: " << std::strerror(errno));
        }

        if (in_fd >= 0) {
            ssize_t n = ::write(in_fd, options.stdin_data.data() + stdin_written,
                                options.stdin_data.size() - stdin_written);
            if (n > 0) {
                stdin_written += static_cast<size_t>(n);
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                // EPIPE: the child stopped reading
                close_fd(in_fd);
            }
            if (stdin_written >= options.stdin_data.size()) {
                close_fd(in_fd);
            }
        }
        drain(out_fd, result.stdout_output);
        drain(err_fd, result.stderr_output);
    }

    if (!exited) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    result.duration_us =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
    if (exited && result.exit_code == 127) {
        FORGE_LOG_DEBUG("generate", "Command may not exist: " << format_command(argv));
    }
    return result;
}

} // namespace forge::generate
