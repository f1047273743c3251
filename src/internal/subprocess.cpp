#include "subprocess.hpp"

extern "C" {
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace runway::internal {

    namespace detail {

        static constexpr std::string_view default_search_path{"/usr/bin:/bin"};

        static bool is_executable_file(const fs::path& candidate) {
            std::error_code ec{};
            if (!fs::is_regular_file(candidate, ec) || ec) {
                return false;
            }
            return ::access(candidate.c_str(), X_OK) == 0;
        }

        static std::vector<char*> make_argv(const command& cmd) {
            std::vector<char*> argv{};
            argv.reserve(cmd.args.size() + 1U);
            for (const auto& arg : cmd.args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);
            return argv;
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

        static int wait_for(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw std::runtime_error("waitpid failed");
                }
            }
            return decode_status(status);
        }

        static command_result run_inherited(const command& cmd) {
            auto argv = make_argv(cmd);

            auto pid = ::fork();
            if (pid < 0) {
                throw std::runtime_error("fork failed");
            }

            if (pid == 0) {
                ::execvp(argv[0], argv.data());
                _exit(127);
            }

            return {.exit_code = wait_for(pid)};
        }

        static command_result run_captured(const command& cmd) {
            int stdout_pipe[2]{};
            int stderr_pipe[2]{};
            if (::pipe(stdout_pipe) != 0) {
                throw std::runtime_error("pipe() failed");
            }
            if (::pipe(stderr_pipe) != 0) {
                ::close(stdout_pipe[0]);
                ::close(stdout_pipe[1]);
                throw std::runtime_error("pipe() failed");
            }

            auto argv = make_argv(cmd);

            auto pid = ::fork();
            if (pid < 0) {
                ::close(stdout_pipe[0]);
                ::close(stdout_pipe[1]);
                ::close(stderr_pipe[0]);
                ::close(stderr_pipe[1]);
                throw std::runtime_error("fork() failed");
            }

            if (pid == 0) {
                ::close(stdout_pipe[0]);
                ::close(stderr_pipe[0]);
                if (::dup2(stdout_pipe[1], STDOUT_FILENO) < 0 || ::dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
                    _exit(127);
                }
                ::close(stdout_pipe[1]);
                ::close(stderr_pipe[1]);

                ::execvp(argv[0], argv.data());
                _exit(127);
            }

            // parent
            ::close(stdout_pipe[1]);
            ::close(stderr_pipe[1]);

            std::string out_buf{};
            std::string err_buf{};
            int fds_open = 2;

            pollfd fds[2]{};
            fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
            fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};

            while (fds_open > 0) {
                int ret = ::poll(fds, 2, -1);
                if (ret < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
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
                            (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                        }
                        else if (n < 0 && errno == EINTR) {
                            continue;
                        }
                        else {
                            ::close(fds[i].fd);
                            fds[i].fd = -1;
                            --fds_open;
                        }
                    }
                }
            }

            // close any remaining pipe fds
            if (fds[0].fd >= 0) {
                ::close(fds[0].fd);
            }
            if (fds[1].fd >= 0) {
                ::close(fds[1].fd);
            }

            auto exit_code = wait_for(pid);
            return {.exit_code = exit_code, .stdout_output = std::move(out_buf), .stderr_output = std::move(err_buf)};
        }

    }  // namespace detail

    std::optional<fs::path> find_executable(const fs::path& tool, std::string_view path_env) {
        if (tool.empty()) {
            return std::nullopt;
        }
        if (tool.has_parent_path()) {
            if (detail::is_executable_file(tool)) {
                return tool;
            }
            return std::nullopt;
        }
        // unset PATH searches the system directories, never the working directory
        if (path_env.empty()) {
            path_env = detail::default_search_path;
        }

        while (true) {
            auto sep = path_env.find(':');
            auto entry = path_env.substr(0, sep);
            auto dir = entry.empty() ? fs::path{"."} : fs::path{entry};
            auto candidate = dir / tool;
            if (detail::is_executable_file(candidate)) {
                return candidate;
            }
            if (sep == std::string_view::npos) {
                break;
            }
            path_env.remove_prefix(sep + 1U);
        }
        return std::nullopt;
    }

    std::optional<fs::path> system_runner::find_tool(const fs::path& tool) {
        const char* path_env = std::getenv("PATH");
        return find_executable(tool, path_env != nullptr ? std::string_view{path_env} : std::string_view{});
    }

    command_result system_runner::run(const command& cmd, io_mode mode) {
        if (cmd.args.empty()) {
            throw std::invalid_argument("empty command");
        }
        debug_log("exec: ", cmd.to_string());
        switch (mode) {
            case io_mode::captured:
                return detail::run_captured(cmd);
            case io_mode::inherited:
                return detail::run_inherited(cmd);
        }
        return detail::run_inherited(cmd);
    }

}  // namespace runway::internal
