// connection.hpp - validated ssh/scp connection parameters plus run and copy
// everything here shells out to the OpenSSH binaries, nothing speaks the protocol itself

#pragma once

#include "sshwrap/common.hpp"
#include "sshwrap/transfer_source.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sshwrap
{

    // =============================================================================
    // connection configuration
    // =============================================================================

    struct connection_config
    {
        std::string host;
        std::string login;                  // optional, ssh picks the current user if empty
        std::optional<std::uint16_t> port;  // optional, ssh_config or 22 otherwise
        std::filesystem::path config_file;  // optional, must exist; ~ is expanded
        std::filesystem::path identity_file; // optional, must exist; ~ is expanded
        std::string agent_socket;           // optional, overrides SSH_AUTH_SOCK for the child
        std::chrono::seconds timeout{constants::default_timeout};

        // absolute paths of the executables; overridable so tests can stand in for them
        std::filesystem::path ssh_binary{constants::ssh_binary};
        std::filesystem::path scp_binary{constants::scp_binary};
    };

    // =============================================================================
    // command result
    // =============================================================================

    struct command_result
    {
        std::string command;       // raw bytes that were fed to the interpreter
        std::string stdout_output; // trimmed, no charset applied
        std::string stderr_output; // trimmed, no charset applied
        int exit_code{0};

        [[nodiscard]] auto success() const noexcept -> bool { return exit_code == 0; }

        [[nodiscard]] auto stdout_text() const -> std::string { return text::to_utf8_lossy(stdout_output); }
        [[nodiscard]] auto stderr_text() const -> std::string { return text::to_utf8_lossy(stderr_output); }
    };

    // =============================================================================
    // connection
    // =============================================================================

    class connection
    {
    public:
        /// @brief Validate the configuration; no network traffic happens here
        /// @return validation error for illegal host/login characters or a missing config/identity file
        [[nodiscard]] static auto create(connection_config config) -> result<connection>;

        [[nodiscard]] auto config() const noexcept -> connection_config const & { return config_; }
        [[nodiscard]] auto host() const noexcept -> std::string_view { return config_.host; }
        [[nodiscard]] auto login() const noexcept -> std::string_view { return config_.login; }
        [[nodiscard]] auto timeout() const noexcept -> std::chrono::seconds { return config_.timeout; }

        // -------------------------------------------------------------------------
        // remote execution
        // -------------------------------------------------------------------------

        /// @brief Feed `command` to `interpreter` on the remote host, roughly
        ///        `echo command | ssh login@host interpreter`
        /// @return result with any exit code except 255; connection error on 255, timeout or I/O failure
        [[nodiscard]] auto run(std::string_view command,
                               std::string_view interpreter = constants::default_interpreter,
                               bool forward_agent = false) const -> result<command_result>;

        // -------------------------------------------------------------------------
        // file transfer
        // -------------------------------------------------------------------------

        /// @brief scp the sources to `target`, then optionally chmod/chown what arrived
        /// @param mode chmod(1) mode string such as "0644"
        /// @param owner chown(1) owner string such as "www-data:www-data"
        [[nodiscard]] auto copy(std::span<source const> files,
                                std::string_view target,
                                std::optional<std::string_view> mode = std::nullopt,
                                std::optional<std::string_view> owner = std::nullopt) const -> void_result;

        /// @brief Remote paths the files end up at: target/basename for a remote directory, else target itself
        [[nodiscard]] auto get_targets(std::span<std::string const> files, std::string_view target) const
            -> result<std::vector<std::string>>;

        /// @brief Variables to override in the child environment
        [[nodiscard]] auto environment_overrides() const -> std::vector<std::pair<std::string, std::string>>;

    private:
        explicit connection(connection_config config) noexcept : config_{std::move(config)} {}

        [[nodiscard]] auto run_post_process(std::string_view tool, std::string_view argument,
                                            std::span<std::string const> targets) const -> void_result;

        connection_config config_;
    };

    // =============================================================================
    // validation helpers
    // =============================================================================

    /// @brief True if the name is non-empty and uses only [A-Za-z0-9._-]
    [[nodiscard]] auto is_safe_name(std::string_view name) noexcept -> bool;

    /// @brief Expand a leading "~" or "~/" to the home directory
    [[nodiscard]] auto expand_user(std::filesystem::path const &path) -> std::filesystem::path;

} // namespace sshwrap

template <>
struct fmt::formatter<sshwrap::command_result> : fmt::formatter<std::string_view>
{
    auto format(sshwrap::command_result const &res, format_context &ctx) const
    {
        auto const text = fmt::format("command: {}\nstdout: {}\nstderr: {}\nreturncode: {}",
                                      sshwrap::text::to_utf8_lossy(res.command), res.stdout_text(),
                                      res.stderr_text(), res.exit_code);
        return fmt::formatter<std::string_view>::format(text, ctx);
    }
};
