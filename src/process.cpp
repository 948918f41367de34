// process.cpp - posix_spawn + poll(2) process runner
// no alarm(), no global signal handlers: every call carries its own deadline

#include "sshwrap/process.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sshwrap::process
{

    namespace
    {

        constexpr std::size_t read_chunk_size = 16 * 1024;
        constexpr auto terminate_grace = std::chrono::milliseconds{500};
        constexpr auto reap_poll_interval = std::chrono::milliseconds{10};

        [[nodiscard]] auto errno_message(std::string_view what, int const err) -> std::string
        {
            return fmt::format("{}: {}", what, std::strerror(err));
        }

        [[nodiscard]] auto decode_wait_status(int const status) noexcept -> int
        {
            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status))
            {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }

        struct pipe_pair
        {
            unique_fd read_end;
            unique_fd write_end;
        };

        [[nodiscard]] auto make_pipe() -> result<pipe_pair>
        {
            std::array<int, 2> fds{-1, -1};
            if (::pipe2(fds.data(), O_CLOEXEC) != 0)
            {
                return std::unexpected{process_error{failure::spawn_failed, errno_message("pipe2", errno)}};
            }
            return pipe_pair{unique_fd{fds[0]}, unique_fd{fds[1]}};
        }

        [[nodiscard]] auto set_nonblocking(int const fd) noexcept -> bool
        {
            auto const flags = ::fcntl(fd, F_GETFL);
            return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
        }

        // blocks SIGPIPE for the calling thread only; a SIGPIPE raised by our own writes
        // is swallowed on the way out so it never reaches the rest of the process
        class sigpipe_block
        {
            sigset_t previous_{};
            bool already_pending_{false};

        public:
            sigpipe_block() noexcept
            {
                sigset_t set;
                ::sigemptyset(&set);
                ::sigaddset(&set, SIGPIPE);
                ::pthread_sigmask(SIG_BLOCK, &set, &previous_);

                sigset_t pending;
                ::sigemptyset(&pending);
                ::sigpending(&pending);
                already_pending_ = ::sigismember(&pending, SIGPIPE) == 1;
            }

            ~sigpipe_block() noexcept
            {
                if (!already_pending_)
                {
                    sigset_t set;
                    ::sigemptyset(&set);
                    ::sigaddset(&set, SIGPIPE);
                    timespec const zero{};
                    while (::sigtimedwait(&set, nullptr, &zero) == SIGPIPE)
                    {
                    }
                }
                ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
            }

            sigpipe_block(sigpipe_block const &) = delete;
            auto operator=(sigpipe_block const &) -> sigpipe_block & = delete;
            sigpipe_block(sigpipe_block &&) = delete;
            auto operator=(sigpipe_block &&) -> sigpipe_block & = delete;
        };

        // caller environment with the overridden keys replaced
        [[nodiscard]] auto build_environment(std::vector<std::pair<std::string, std::string>> const &overrides)
            -> std::vector<std::string>
        {
            std::vector<std::string> env;
            for (char **entry = ::environ; entry != nullptr && *entry != nullptr; ++entry)
            {
                std::string_view const var{*entry};
                auto const key = var.substr(0, var.find('='));
                auto const overridden = std::ranges::any_of(
                    overrides, [&](auto const &kv) { return kv.first == key; });
                if (!overridden)
                {
                    env.emplace_back(var);
                }
            }
            for (auto const &[key, value] : overrides)
            {
                env.push_back(fmt::format("{}={}", key, value));
            }
            return env;
        }

        [[nodiscard]] auto to_c_array(std::vector<std::string> const &strings) -> std::vector<char *>
        {
            std::vector<char *> out;
            out.reserve(strings.size() + 1);
            for (auto const &s : strings)
            {
                out.push_back(const_cast<char *>(s.c_str()));
            }
            out.push_back(nullptr);
            return out;
        }

        struct spawn_file_actions
        {
            posix_spawn_file_actions_t actions{};

            spawn_file_actions() noexcept { ::posix_spawn_file_actions_init(&actions); }
            ~spawn_file_actions() noexcept { ::posix_spawn_file_actions_destroy(&actions); }

            spawn_file_actions(spawn_file_actions const &) = delete;
            auto operator=(spawn_file_actions const &) -> spawn_file_actions & = delete;
            spawn_file_actions(spawn_file_actions &&) = delete;
            auto operator=(spawn_file_actions &&) -> spawn_file_actions & = delete;
        };

        enum class drain_state : std::uint8_t
        {
            more,
            eof,
        };

        // read everything currently available; EAGAIN just means "come back after poll"
        [[nodiscard]] auto drain(int const fd, std::string &sink) -> std::expected<drain_state, int>
        {
            std::array<char, read_chunk_size> buffer{};
            while (true)
            {
                auto const n = ::read(fd, buffer.data(), buffer.size());
                if (n > 0)
                {
                    sink.append(buffer.data(), static_cast<std::size_t>(n));
                    continue;
                }
                if (n == 0)
                {
                    return drain_state::eof;
                }
                if (errno == EINTR)
                {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                {
                    return drain_state::more;
                }
                return std::unexpected{errno};
            }
        }

    } // namespace

    // =============================================================================
    // deadline
    // =============================================================================

    auto deadline::expiry_after(std::chrono::milliseconds const budget) noexcept -> clock::time_point
    {
        auto const now = clock::now();
        auto const headroom = std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - now);
        if (budget >= headroom)
        {
            return clock::time_point::max();
        }
        return now + budget;
    }

    auto deadline::remaining() const noexcept -> std::chrono::milliseconds
    {
        auto const left = expires_at_ - clock::now();
        if (left <= clock::duration::zero())
        {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::ceil<std::chrono::milliseconds>(left);
    }

    auto deadline::poll_timeout() const noexcept -> int
    {
        auto const left = remaining().count();
        return static_cast<int>(std::min<std::int64_t>(left, std::numeric_limits<int>::max()));
    }

    // =============================================================================
    // guards
    // =============================================================================

    void unique_fd::reset() noexcept
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    auto child_process::try_wait(int &status) noexcept -> std::expected<bool, int>
    {
        if (pid_ <= 0)
        {
            return std::unexpected{ECHILD};
        }
        while (true)
        {
            auto const ret = ::waitpid(pid_, &status, WNOHANG);
            if (ret == pid_)
            {
                pid_ = -1;
                return true;
            }
            if (ret == 0)
            {
                return false;
            }
            if (errno == EINTR)
            {
                continue;
            }
            auto const err = errno;
            // nothing left to reap, forget the pid so the destructor does not signal a recycled one
            pid_ = -1;
            return std::unexpected{err};
        }
    }

    void child_process::terminate() noexcept
    {
        if (pid_ <= 0)
        {
            return;
        }

        ::kill(pid_, SIGTERM);

        auto const give_up_at = std::chrono::steady_clock::now() + terminate_grace;
        while (std::chrono::steady_clock::now() < give_up_at)
        {
            int status = 0;
            auto const ret = ::waitpid(pid_, &status, WNOHANG);
            if (ret == pid_ || (ret < 0 && errno != EINTR))
            {
                pid_ = -1;
                return;
            }
            std::this_thread::sleep_for(reap_poll_interval);
        }

        ::kill(pid_, SIGKILL);
        while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR)
        {
        }
        pid_ = -1;
    }

    auto to_string(failure const reason) -> std::string_view
    {
        switch (reason)
        {
        case failure::spawn_failed:
            return "spawn_failed";
        case failure::timed_out:
            return "timed_out";
        case failure::io_failed:
            return "io_failed";
        }
        return "unknown";
    }

    // =============================================================================
    // run
    // =============================================================================

    auto run(run_options const &options) -> result<exit_status>
    {
        if (options.argv.empty())
        {
            return std::unexpected{process_error{failure::spawn_failed, "empty argument vector"}};
        }

        auto const &program = options.argv.front();

        auto stdin_pipe = make_pipe();
        if (!stdin_pipe)
        {
            return std::unexpected{stdin_pipe.error()};
        }
        auto stdout_pipe = make_pipe();
        if (!stdout_pipe)
        {
            return std::unexpected{stdout_pipe.error()};
        }
        auto stderr_pipe = make_pipe();
        if (!stderr_pipe)
        {
            return std::unexpected{stderr_pipe.error()};
        }

        // -------------------------------------------------------------------------
        // spawn
        // -------------------------------------------------------------------------

        child_process child;
        {
            spawn_file_actions file_actions;
            ::posix_spawn_file_actions_adddup2(&file_actions.actions, stdin_pipe->read_end.get(), STDIN_FILENO);
            ::posix_spawn_file_actions_adddup2(&file_actions.actions, stdout_pipe->write_end.get(), STDOUT_FILENO);
            ::posix_spawn_file_actions_adddup2(&file_actions.actions, stderr_pipe->write_end.get(), STDERR_FILENO);

            auto const env_strings = build_environment(options.env_overrides);
            auto argv = to_c_array(options.argv);
            auto envp = to_c_array(env_strings);

            pid_t pid = -1;
            auto const rc = ::posix_spawn(&pid, program.c_str(), &file_actions.actions, nullptr, argv.data(),
                                          envp.data());
            if (rc != 0)
            {
                return std::unexpected{
                    process_error{failure::spawn_failed, errno_message(fmt::format("cannot execute {}", program), rc)}};
            }
            child = child_process{pid};
        }

        // the child owns these ends now
        stdin_pipe->read_end.reset();
        stdout_pipe->write_end.reset();
        stderr_pipe->write_end.reset();

        auto &child_stdin = stdin_pipe->write_end;
        auto &child_stdout = stdout_pipe->read_end;
        auto &child_stderr = stderr_pipe->read_end;

        if (!set_nonblocking(child_stdin.get()) || !set_nonblocking(child_stdout.get()) ||
            !set_nonblocking(child_stderr.get()))
        {
            auto const err = errno;
            child.terminate();
            return std::unexpected{process_error{failure::io_failed, errno_message("fcntl", err)}};
        }

        // -------------------------------------------------------------------------
        // communicate
        // -------------------------------------------------------------------------

        deadline const timer{options.timeout};
        sigpipe_block const no_sigpipe;

        auto const timed_out = [&]() -> std::unexpected<process_error>
        {
            child.terminate();
            return std::unexpected{
                process_error{failure::timed_out, fmt::format("{} timed out after {}", program, timer.budget())}};
        };

        auto const io_failed = [&](std::string_view what, int const err) -> std::unexpected<process_error>
        {
            child.terminate();
            return std::unexpected{process_error{failure::io_failed, errno_message(what, err)}};
        };

        exit_status status;
        std::size_t written = 0;

        if (options.input.empty())
        {
            child_stdin.reset();
        }

        while (child_stdout.is_open() || child_stderr.is_open())
        {
            if (timer.expired())
            {
                return timed_out();
            }

            std::array<pollfd, 3> fds{};
            nfds_t count = 0;
            int stdin_slot = -1;
            int stdout_slot = -1;
            int stderr_slot = -1;

            if (child_stdin.is_open())
            {
                stdin_slot = static_cast<int>(count);
                fds[count++] = pollfd{child_stdin.get(), POLLOUT, 0};
            }
            if (child_stdout.is_open())
            {
                stdout_slot = static_cast<int>(count);
                fds[count++] = pollfd{child_stdout.get(), POLLIN, 0};
            }
            if (child_stderr.is_open())
            {
                stderr_slot = static_cast<int>(count);
                fds[count++] = pollfd{child_stderr.get(), POLLIN, 0};
            }

            auto const ready = ::poll(fds.data(), count, timer.poll_timeout());
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return io_failed("poll", errno);
            }
            if (ready == 0)
            {
                continue;
            }

            if (stdin_slot >= 0 && fds[static_cast<std::size_t>(stdin_slot)].revents != 0)
            {
                auto const revents = fds[static_cast<std::size_t>(stdin_slot)].revents;
                if ((revents & (POLLERR | POLLHUP)) != 0)
                {
                    // child closed its stdin early; whatever it did not read is its business
                    child_stdin.reset();
                }
                else if ((revents & POLLOUT) != 0)
                {
                    auto const pending = std::string_view{options.input}.substr(written);
                    auto const n = ::write(child_stdin.get(), pending.data(), pending.size());
                    if (n >= 0)
                    {
                        written += static_cast<std::size_t>(n);
                        if (written == options.input.size())
                        {
                            child_stdin.reset();
                        }
                    }
                    else if (errno == EPIPE)
                    {
                        child_stdin.reset();
                    }
                    else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    {
                        return io_failed("write to child stdin", errno);
                    }
                }
            }

            auto const collect = [&](int const slot, unique_fd &fd, std::string &sink) -> std::expected<void, int>
            {
                if (slot < 0 || fds[static_cast<std::size_t>(slot)].revents == 0)
                {
                    return {};
                }
                auto const drained = drain(fd.get(), sink);
                if (!drained)
                {
                    return std::unexpected{drained.error()};
                }
                if (*drained == drain_state::eof)
                {
                    fd.reset();
                }
                return {};
            };

            if (auto const out = collect(stdout_slot, child_stdout, status.stdout_bytes); !out)
            {
                return io_failed("read child stdout", out.error());
            }
            if (auto const err = collect(stderr_slot, child_stderr, status.stderr_bytes); !err)
            {
                return io_failed("read child stderr", err.error());
            }
        }

        child_stdin.reset();

        // -------------------------------------------------------------------------
        // reap
        // -------------------------------------------------------------------------

        while (true)
        {
            int raw_status = 0;
            auto const reaped = child.try_wait(raw_status);
            if (!reaped && reaped.error() == ECHILD)
            {
                // SIGCHLD is SIG_IGN in this process: the kernel already reaped the child, status is lost
                status.exit_code = 0;
                return status;
            }
            if (!reaped)
            {
                return std::unexpected{process_error{failure::io_failed, errno_message("waitpid", reaped.error())}};
            }
            if (*reaped)
            {
                status.exit_code = decode_wait_status(raw_status);
                return status;
            }
            if (timer.expired())
            {
                return timed_out();
            }
            std::this_thread::sleep_for(std::min(reap_poll_interval, timer.remaining()));
        }
    }

} // namespace sshwrap::process
