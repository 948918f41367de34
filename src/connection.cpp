// connection.cpp - validation, remote execution and file transfer on top of the process runner

#include "sshwrap/connection.hpp"

#include "sshwrap/command_builder.hpp"
#include "sshwrap/process.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace sshwrap
{

    namespace
    {

        [[nodiscard]] constexpr auto is_name_char(char const c) noexcept -> bool
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' ||
                   c == '-' || c == '_';
        }

        [[nodiscard]] auto home_directory(std::string_view user) -> std::optional<std::string>
        {
            if (user.empty())
            {
                if (auto const *home = std::getenv("HOME"); home != nullptr && *home != '\0')
                {
                    return std::string{home};
                }
                if (auto const *pw = ::getpwuid(::getuid()); pw != nullptr && pw->pw_dir != nullptr)
                {
                    return std::string{pw->pw_dir};
                }
                return std::nullopt;
            }

            std::string const name{user};
            if (auto const *pw = ::getpwnam(name.c_str()); pw != nullptr && pw->pw_dir != nullptr)
            {
                return std::string{pw->pw_dir};
            }
            return std::nullopt;
        }

        [[nodiscard]] auto check_file(std::filesystem::path &path, std::string_view what) -> void_result
        {
            if (path.empty())
            {
                return {};
            }
            path = expand_user(path);

            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                return fail(error_kind::validation, fmt::format("{} {} is not found", what, path.string()));
            }
            return {};
        }

        // seconds to the runner's milliseconds without overflowing on "effectively forever" values
        [[nodiscard]] auto to_budget(std::chrono::seconds const timeout) noexcept -> std::chrono::milliseconds
        {
            constexpr auto limit = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds::max());
            if (timeout >= limit)
            {
                return std::chrono::milliseconds::max();
            }
            return timeout;
        }

        [[nodiscard]] auto stderr_or(std::string const &stderr_output, std::string_view fallback_tool,
                                     int const exit_code) -> std::string
        {
            if (!stderr_output.empty())
            {
                return stderr_output;
            }
            return fmt::format("{} exited with status {}", fallback_tool, exit_code);
        }

    } // namespace

    // =============================================================================
    // validation helpers
    // =============================================================================

    auto is_safe_name(std::string_view name) noexcept -> bool
    {
        return !name.empty() && std::ranges::all_of(name, is_name_char);
    }

    auto expand_user(std::filesystem::path const &path) -> std::filesystem::path
    {
        auto const text = path.string();
        if (text.empty() || text.front() != '~')
        {
            return path;
        }

        auto const slash = text.find('/');
        auto const user = std::string_view{text}.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
        auto const home = home_directory(user);
        if (!home.has_value())
        {
            return path;
        }
        if (slash == std::string::npos)
        {
            return std::filesystem::path{*home};
        }
        return std::filesystem::path{*home + text.substr(slash)};
    }

    // =============================================================================
    // construction
    // =============================================================================

    auto connection::create(connection_config config) -> result<connection>
    {
        if (!is_safe_name(config.host))
        {
            return fail(error_kind::validation, "Server name contains illegal symbols");
        }
        if (!config.login.empty() && !is_safe_name(config.login))
        {
            return fail(error_kind::validation, "User login contains illegal symbols");
        }
        if (config.timeout <= std::chrono::seconds::zero())
        {
            return fail(error_kind::validation, fmt::format("Timeout must be positive, got {}s", config.timeout.count()));
        }
        if (auto checked = check_file(config.config_file, "Config file"); !checked)
        {
            return std::unexpected{checked.error()};
        }
        if (auto checked = check_file(config.identity_file, "Key file"); !checked)
        {
            return std::unexpected{checked.error()};
        }

        return connection{std::move(config)};
    }

    auto connection::environment_overrides() const -> std::vector<std::pair<std::string, std::string>>
    {
        std::vector<std::pair<std::string, std::string>> overrides;
        if (!config_.agent_socket.empty())
        {
            overrides.emplace_back(constants::agent_socket_variable, config_.agent_socket);
        }
        return overrides;
    }

    // =============================================================================
    // remote execution
    // =============================================================================

    auto connection::run(std::string_view command, std::string_view interpreter, bool forward_agent) const
        -> result<command_result>
    {
        auto outcome = process::run(process::run_options{
            .argv = build_run_command(*this, interpreter, forward_agent),
            .env_overrides = environment_overrides(),
            .input = std::string{command},
            .timeout = to_budget(config_.timeout),
        });

        if (!outcome)
        {
            return fail(error_kind::connection, std::move(outcome.error().message));
        }

        if (outcome->exit_code == constants::ssh_client_failure)
        {
            auto const err = text::trim(outcome->stderr_bytes);
            return fail(error_kind::connection, stderr_or(err, "ssh", outcome->exit_code));
        }

        // any other exit code belongs to the remote command; the caller decides what it means
        return command_result{
            .command = std::string{command},
            .stdout_output = text::trim(outcome->stdout_bytes),
            .stderr_output = text::trim(outcome->stderr_bytes),
            .exit_code = outcome->exit_code,
        };
    }

    // =============================================================================
    // file transfer
    // =============================================================================

    auto connection::copy(std::span<source const> files, std::string_view target,
                          std::optional<std::string_view> mode, std::optional<std::string_view> owner) const
        -> void_result
    {
        // the temp dir (if any) lives in `resolved` and is removed exactly once when it goes out of scope
        auto resolved = resolve_sources(files);
        if (!resolved)
        {
            return std::unexpected{resolved.error()};
        }

        auto argv = build_copy_command(*this, resolved->paths, target);
        if (!argv)
        {
            return std::unexpected{argv.error()};
        }

        auto outcome = process::run(process::run_options{
            .argv = std::move(*argv),
            .env_overrides = environment_overrides(),
            .input = {},
            .timeout = to_budget(config_.timeout),
        });

        if (!outcome)
        {
            return fail(error_kind::transfer, std::move(outcome.error().message));
        }
        if (outcome->exit_code != 0)
        {
            auto const err = text::trim(outcome->stderr_bytes);
            return fail(error_kind::transfer, stderr_or(err, "scp", outcome->exit_code));
        }

        bool const has_mode = mode.has_value() && !mode->empty();
        bool const has_owner = owner.has_value() && !owner->empty();
        if (!has_mode && !has_owner)
        {
            return {};
        }

        auto targets = get_targets(resolved->paths, target);
        if (!targets)
        {
            return fail(error_kind::post_process, targets.error().message());
        }

        if (has_mode)
        {
            if (auto changed = run_post_process("chmod", *mode, *targets); !changed)
            {
                return changed;
            }
        }
        if (has_owner)
        {
            if (auto changed = run_post_process("chown", *owner, *targets); !changed)
            {
                return changed;
            }
        }
        return {};
    }

    auto connection::get_targets(std::span<std::string const> files, std::string_view target) const
        -> result<std::vector<std::string>>
    {
        std::vector<std::string> const probe{"test", "-d", std::string{target}};
        auto is_dir = run(shell_join(probe));
        if (!is_dir)
        {
            return std::unexpected{is_dir.error()};
        }

        if (!is_dir->success())
        {
            return std::vector<std::string>{std::string{target}};
        }

        std::vector<std::string> targets;
        targets.reserve(files.size());
        for (auto const &file : files)
        {
            auto const basename = std::filesystem::path{file}.filename().string();
            if (target.empty() || target.back() == '/')
            {
                targets.push_back(fmt::format("{}{}", target, basename));
            }
            else
            {
                targets.push_back(fmt::format("{}/{}", target, basename));
            }
        }
        return targets;
    }

    auto connection::run_post_process(std::string_view tool, std::string_view argument,
                                      std::span<std::string const> targets) const -> void_result
    {
        std::vector<std::string> tokens{std::string{tool}, std::string{argument}};
        tokens.insert(tokens.end(), targets.begin(), targets.end());

        auto outcome = run(shell_join(tokens));
        if (!outcome)
        {
            return fail(error_kind::post_process, outcome.error().message());
        }
        if (!outcome->success())
        {
            return fail(error_kind::post_process, stderr_or(outcome->stderr_output, tool, outcome->exit_code));
        }
        return {};
    }

} // namespace sshwrap
