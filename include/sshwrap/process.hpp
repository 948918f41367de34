// process.hpp - spawn an external program, feed stdin, collect stdout/stderr
// under a wall-clock deadline that belongs to the call and nobody else

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace sshwrap::process
{

    // =============================================================================
    // failures
    // =============================================================================

    enum class failure : std::uint8_t
    {
        spawn_failed = 1,
        timed_out,
        io_failed,
    };

    struct process_error
    {
        failure reason{failure::io_failed};
        std::string message;
    };

    template <typename T>
    using result = std::expected<T, process_error>;

    // =============================================================================
    // invocation
    // =============================================================================

    struct run_options
    {
        std::vector<std::string> argv;                                 // argv[0] is an absolute path
        std::vector<std::pair<std::string, std::string>> env_overrides; // applied on top of the caller environment
        std::string input;                                              // written to stdin, then stdin is closed
        std::chrono::milliseconds timeout{std::chrono::seconds{60}};
    };

    struct exit_status
    {
        std::string stdout_bytes;
        std::string stderr_bytes;
        int exit_code{0}; // 128 + signal number when the child was killed by a signal
    };

    /// @brief Run a program to completion or until the deadline elapses
    /// @note On timeout or I/O failure the child is terminated and reaped before returning
    [[nodiscard]] auto run(run_options const &options) -> result<exit_status>;

    // =============================================================================
    // per-call deadline
    // =============================================================================

    class deadline
    {
    public:
        using clock = std::chrono::steady_clock;

        // a budget past the end of the clock saturates to time_point::max()
        explicit deadline(std::chrono::milliseconds const budget) noexcept
            : budget_{budget}, expires_at_{expiry_after(budget)}
        {
        }

        [[nodiscard]] auto budget() const noexcept -> std::chrono::milliseconds { return budget_; }
        [[nodiscard]] auto expired() const noexcept -> bool { return clock::now() >= expires_at_; }
        [[nodiscard]] auto remaining() const noexcept -> std::chrono::milliseconds;

        // milliseconds suitable for poll(2), rounded up so we never spin on a zero timeout
        [[nodiscard]] auto poll_timeout() const noexcept -> int;

    private:
        [[nodiscard]] static auto expiry_after(std::chrono::milliseconds budget) noexcept -> clock::time_point;

        std::chrono::milliseconds budget_;
        clock::time_point expires_at_;
    };

    // =============================================================================
    // RAII guards
    // =============================================================================

    class unique_fd
    {
        int fd_{-1};

    public:
        unique_fd() noexcept = default;
        explicit unique_fd(int const fd) noexcept : fd_{fd} {}
        ~unique_fd() noexcept { reset(); }

        unique_fd(unique_fd const &) = delete;
        auto operator=(unique_fd const &) -> unique_fd & = delete;

        unique_fd(unique_fd &&other) noexcept : fd_{std::exchange(other.fd_, -1)} {}
        auto operator=(unique_fd &&other) noexcept -> unique_fd &
        {
            if (this != &other)
            {
                reset();
                fd_ = std::exchange(other.fd_, -1);
            }
            return *this;
        }

        [[nodiscard]] auto get() const noexcept -> int { return fd_; }
        [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }

        void reset() noexcept;
    };

    // owns a spawned pid; a child that is still around when this goes away gets killed and reaped
    class child_process
    {
        pid_t pid_{-1};

    public:
        child_process() noexcept = default;
        explicit child_process(pid_t const pid) noexcept : pid_{pid} {}
        ~child_process() noexcept { terminate(); }

        child_process(child_process const &) = delete;
        auto operator=(child_process const &) -> child_process & = delete;

        child_process(child_process &&other) noexcept : pid_{std::exchange(other.pid_, -1)} {}
        auto operator=(child_process &&other) noexcept -> child_process &
        {
            if (this != &other)
            {
                terminate();
                pid_ = std::exchange(other.pid_, -1);
            }
            return *this;
        }

        [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }
        [[nodiscard]] auto running() const noexcept -> bool { return pid_ > 0; }

        /// @brief Non-blocking reap
        /// @return true and the raw wait status once the child has exited
        [[nodiscard]] auto try_wait(int &status) noexcept -> std::expected<bool, int>;

        // SIGTERM, a short grace period, then SIGKILL; always reaps
        void terminate() noexcept;
    };

    [[nodiscard]] auto to_string(failure reason) -> std::string_view;

} // namespace sshwrap::process
