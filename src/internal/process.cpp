#include "process.hpp"

#include "perftrack/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

using namespace perftrack::literals;
using namespace std::string_view_literals;

namespace perftrack::internal {

    namespace detail {

        using clock = std::chrono::steady_clock;

        static void close_pair(int (&fds)[2]) {
            for (auto& fd : fds) {
                if (fd >= 0) {
                    ::close(fd);
                    fd = -1;
                }
            }
        }

        static void write_stderr(const char* prefix, const char* detail) {
            auto ignored = ::write(STDERR_FILENO, prefix, std::strlen(prefix));
            ignored = ::write(STDERR_FILENO, detail, std::strlen(detail));
            ignored = ::write(STDERR_FILENO, "\n", 1);
            static_cast<void>(ignored);
        }

        [[noreturn]] static void exec_child(const process_request& request, int stdout_fd, int stderr_fd) {
            if (request.own_process_group) {
                ::setpgid(0, 0);
            }

            // an inherited SIGCHLD=SIG_IGN would make the benchmark's own children unwaitable
            ::signal(SIGCHLD, SIG_DFL);

            // the parent may block interrupt signals for its watcher thread
            sigset_t empty{};
            sigemptyset(&empty);
            ::sigprocmask(SIG_SETMASK, &empty, nullptr);

            if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }
            ::close(stdout_fd);
            ::close(stderr_fd);

            auto devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }

            if (request.cwd && ::chdir(request.cwd->c_str()) != 0) {
                write_stderr("chdir failed: ", std::strerror(errno));
                _exit(127);
            }

            std::vector<char*> argv{};
            argv.reserve(request.args.size() + 1U);
            for (const auto& arg : request.args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            write_stderr("exec failed: ", std::strerror(errno));
            _exit(127);
        }

        static void kill_child(pid_t pid, bool own_group) {
            if (own_group) {
                ::kill(-pid, SIGKILL);
            }
            ::kill(pid, SIGKILL);
        }

        enum class wait_outcome { exited, deadline, failed };

        // on `failed` errno holds the waitpid error and `status` is meaningless
        static wait_outcome wait_until(pid_t pid, clock::time_point deadline, int& status) {
            for (;;) {
                auto ret = ::waitpid(pid, &status, WNOHANG);
                if (ret == pid) {
                    return wait_outcome::exited;
                }
                if (ret < 0 && errno != EINTR) {
                    return wait_outcome::failed;
                }
                if (clock::now() >= deadline) {
                    return wait_outcome::deadline;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{5});
            }
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    std::string describe_command(const std::vector<std::string>& args) {
        return utils::join_with_separator(args, " "sv);
    }

    process_result run_process(const process_request& request) {
        process_result result{};
        if (request.args.empty()) {
            result.spawn_failed = true;
            result.stderr_output = "empty command";
            return result;
        }

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        if (::pipe(stdout_pipe) != 0 || ::pipe(stderr_pipe) != 0) {
            detail::close_pair(stdout_pipe);
            detail::close_pair(stderr_pipe);
            result.spawn_failed = true;
            result.stderr_output = "pipe() failed";
            return result;
        }

        debug_log("spawn: ", describe_command(request.args));

        auto pid = ::fork();
        if (pid < 0) {
            detail::close_pair(stdout_pipe);
            detail::close_pair(stderr_pipe);
            result.spawn_failed = true;
            result.stderr_output = "fork() failed";
            return result;
        }

        if (pid == 0) {
            ::close(stdout_pipe[0]);
            ::close(stderr_pipe[0]);
            detail::exec_child(request, stdout_pipe[1], stderr_pipe[1]);
        }

        if (request.own_process_group) {
            // also set from the parent so the group exists before any kill
            ::setpgid(pid, pid);
        }

        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};
        int fds_open = 2;

        auto deadline = detail::clock::now() + std::chrono::milliseconds(request.timeout_ms);

        while (fds_open > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - detail::clock::now())
                                     .count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }

            int ret = ::poll(fds, 2, static_cast<int>(remaining));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                result.timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_output : result.stderr_output).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        ::close(fds[i].fd);
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        int status = 0;
        if (!result.timed_out) {
            switch (detail::wait_until(pid, deadline, status)) {
                case detail::wait_outcome::exited:
                    break;
                case detail::wait_outcome::deadline:
                    result.timed_out = true;
                    break;
                case detail::wait_outcome::failed: {
                    // e.g. ECHILD when SIGCHLD is ignored and the kernel reaped the child; the exit status is lost
                    std::string reason = std::strerror(errno);
                    for (auto& fd : fds) {
                        if (fd.fd >= 0) {
                            ::close(fd.fd);
                        }
                    }
                    result.exit_code = -1;
                    if (!result.stderr_output.empty() && result.stderr_output.back() != '\n') {
                        result.stderr_output.push_back('\n');
                    }
                    result.stderr_output += "waitpid failed, exit status unknown: {}"_format(reason);
                    return result;
                }
            }
        }
        if (result.timed_out) {
            detail::kill_child(pid, request.own_process_group);
            ::waitpid(pid, &status, 0);
        }

        for (auto& fd : fds) {
            if (fd.fd >= 0) {
                ::close(fd.fd);
            }
        }

        if (result.timed_out) {
            result.exit_code = -1;
            if (!result.stderr_output.empty() && result.stderr_output.back() != '\n') {
                result.stderr_output.push_back('\n');
            }
            result.stderr_output += "subprocess timed out after {} ms"_format(request.timeout_ms);
            return result;
        }

        result.exit_code = detail::decode_status(status);
        return result;
    }

}  // namespace perftrack::internal
