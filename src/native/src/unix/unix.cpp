#include "native.h"

#include <array>
#include <cerrno>
#include <clocale>
#include <cstring>
#include <format>
#include <optional>
#include <thread>

namespace tad::native
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        // deadline of an unbounded run
        constexpr Clock::time_point NO_DEADLINE = Clock::time_point::max();

        constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{10};

        Clock::time_point _deadlineFor(const std::chrono::milliseconds timeout)
        {
            return timeout.count() > 0 ? Clock::now() + timeout : NO_DEADLINE;
        }

        std::vector<char*> _buildArgv(const std::string & command, std::vector<std::string> & args)
        {
            std::vector<char*> argv;
            argv.reserve(args.size() + 2);
            argv.push_back(const_cast<char*>(command.c_str()));
            for(std::string & arg : args)
            {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);
            return argv;
        }

        void _closeFd(int & fd)
        {
            if(fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        /**
         * Reads both pipes until they reach EOF.
         *
         * @return false when the deadline passed or polling failed before both pipes closed.
         */
        bool _collect(const int out_fd, const int err_fd, std::string & out, std::string & err, const Clock::time_point deadline)
        {
            std::array<pollfd, 2> fds{
                pollfd{.fd = out_fd, .events = POLLIN, .revents = 0},
                pollfd{.fd = err_fd, .events = POLLIN, .revents = 0}
            };
            const std::array<std::string*, 2> sinks{&out, &err};
            std::array<char, 4096> buffer{};

            while(fds[0].fd >= 0 || fds[1].fd >= 0)
            {
                int wait_ms = -1;
                if(deadline != NO_DEADLINE)
                {
                    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
                    if(left.count() <= 0)
                    {
                        return false;
                    }
                    wait_ms = static_cast<int>(left.count());
                }

                // negative descriptors are skipped by poll()
                const int ready = ::poll(fds.data(), fds.size(), wait_ms);
                if(ready < 0)
                {
                    if(errno == EINTR)
                    {
                        continue;
                    }
                    err += std::format("poll() failed: {}", std::strerror(errno));
                    return false;
                }

                for(std::size_t i = 0; i < fds.size(); ++i)
                {
                    if(fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                    {
                        continue;
                    }

                    const ssize_t count = ::read(fds[i].fd, buffer.data(), buffer.size());
                    if(count > 0)
                    {
                        sinks[i]->append(buffer.data(), static_cast<std::size_t>(count));
                    }
                    else if(count == 0 || errno != EINTR)
                    {
                        fds[i].fd = -1;
                    }
                }
            }
            return true;
        }

        int _decodeStatus(const int status)
        {
            if(WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            if(WIFSIGNALED(status))
            {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }

        int _waitBlocking(const pid_t pid)
        {
            int status = 0;
            while(::waitpid(pid, &status, 0) < 0)
            {
                if(errno != EINTR)
                {
                    return -1;
                }
            }
            return _decodeStatus(status);
        }

        /**
         * @return exit code, or std::nullopt when the deadline passed first.
         */
        std::optional<int> _waitUntil(const pid_t pid, const Clock::time_point deadline)
        {
            if(deadline == NO_DEADLINE)
            {
                return _waitBlocking(pid);
            }

            while(true)
            {
                int status = 0;
                const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
                if(reaped == pid)
                {
                    return _decodeStatus(status);
                }
                if(reaped < 0 && errno != EINTR)
                {
                    return -1;
                }
                if(Clock::now() >= deadline)
                {
                    return std::nullopt;
                }
                std::this_thread::sleep_for(REAP_POLL_INTERVAL);
            }
        }

        void _killGroup(const pid_t pid)
        {
            // the child leads its own group, so helpers it started die with it
            if(::kill(-pid, SIGKILL) != 0)
            {
                ::kill(pid, SIGKILL);
            }
        }

        // stdout_fd < 0 captures stdout into ProcessResult::output
        ProcessResult _spawn(const std::string & command, std::vector<std::string> args, const int stdout_fd, const std::chrono::milliseconds timeout)
        {
            ProcessResult result;
            const bool capture_stdout = stdout_fd < 0;

            int out_pipe[2] = {-1, -1};
            int err_pipe[2] = {-1, -1};
            if(::pipe(err_pipe) != 0)
            {
                result.errors = std::format("pipe() failed: {}", std::strerror(errno));
                return result;
            }
            if(capture_stdout && ::pipe(out_pipe) != 0)
            {
                result.errors = std::format("pipe() failed: {}", std::strerror(errno));
                _closeFd(err_pipe[0]);
                _closeFd(err_pipe[1]);
                return result;
            }

            // argv must be ready before fork
            std::vector<char*> argv = _buildArgv(command, args);
            const Clock::time_point deadline = _deadlineFor(timeout);

            const pid_t pid = ::fork();
            if(pid < 0)
            {
                result.errors = std::format("fork() failed: {}", std::strerror(errno));
                _closeFd(out_pipe[0]);
                _closeFd(out_pipe[1]);
                _closeFd(err_pipe[0]);
                _closeFd(err_pipe[1]);
                return result;
            }

            if(pid == 0)
            {
                ::setpgid(0, 0);

                _closeFd(out_pipe[0]);
                _closeFd(err_pipe[0]);

                const int null_fd = ::open("/dev/null", O_RDONLY);
                if(null_fd >= 0)
                {
                    ::dup2(null_fd, STDIN_FILENO);
                    ::close(null_fd);
                }

                ::dup2(capture_stdout ? out_pipe[1] : stdout_fd, STDOUT_FILENO);
                ::dup2(err_pipe[1], STDERR_FILENO);
                _closeFd(out_pipe[1]);
                _closeFd(err_pipe[1]);
                if(!capture_stdout)
                {
                    ::close(stdout_fd);
                }

                ::execvp(command.c_str(), argv.data());
                ::_exit(127);
            }

            _closeFd(out_pipe[1]);
            _closeFd(err_pipe[1]);

            const bool drained = _collect(out_pipe[0], err_pipe[0], result.output, result.errors, deadline);
            _closeFd(out_pipe[0]);
            _closeFd(err_pipe[0]);

            const std::optional<int> exit_code = drained ? _waitUntil(pid, deadline) : std::nullopt;
            if(exit_code)
            {
                result.exit_code = *exit_code;
                return result;
            }

            _killGroup(pid);
            _waitBlocking(pid);

            result.exit_code = -1;
            result.timed_out = true;
            if(!result.errors.empty())
            {
                result.errors += '\n';
            }
            result.errors += std::format("{} killed after {} ms", command, timeout.count());
            return result;
        }
    }

    bool configureTerminal()
    {
        if(std::setlocale(LC_ALL, "C.UTF-8") == nullptr && std::setlocale(LC_ALL, "") == nullptr)
        {
            return false;
        }
        return ::isatty(STDOUT_FILENO) == 1;
    }

    ProcessResult runProcess(const std::string & command, std::vector<std::string> args, const std::chrono::milliseconds timeout)
    {
        return _spawn(command, std::move(args), -1, timeout);
    }

    ProcessResult runProcessToFile(const std::string & command, std::vector<std::string> args, const std::filesystem::path & output_path, const std::chrono::milliseconds timeout)
    {
        const int out_fd = ::open(output_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if(out_fd < 0)
        {
            return ProcessResult{
                .exit_code = -1,
                .errors = std::format("Cannot open {}: {}", output_path.string(), std::strerror(errno))
            };
        }

        auto result = _spawn(command, std::move(args), out_fd, timeout);
        ::close(out_fd);
        return result;
    }
}
