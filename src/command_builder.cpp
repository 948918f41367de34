// command_builder.cpp - argument vectors for ssh and scp, shell quoting for the remote side

#include "sshwrap/command_builder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace sshwrap
{

    namespace
    {

        [[nodiscard]] constexpr auto is_shell_safe(char const c) noexcept -> bool
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '@' ||
                   c == '%' || c == '+' || c == '=' || c == ':' || c == ',' || c == '.' || c == '/' || c == '_' ||
                   c == '-';
        }

        // port 0 is the same as no port
        [[nodiscard]] auto has_port(connection_config const &cfg) noexcept -> bool
        {
            return cfg.port.has_value() && *cfg.port != 0;
        }

        void append_identity_flags(std::vector<std::string> &cmd, connection_config const &cfg)
        {
            if (!cfg.config_file.empty())
            {
                cmd.emplace_back("-F");
                cmd.push_back(cfg.config_file.string());
            }
            if (!cfg.identity_file.empty())
            {
                cmd.emplace_back("-i");
                cmd.push_back(cfg.identity_file.string());
            }
        }

    } // namespace

    auto build_run_command(connection const &conn, std::string_view interpreter, bool forward_agent)
        -> std::vector<std::string>
    {
        auto const &cfg = conn.config();

        std::vector<std::string> cmd;
        cmd.push_back(cfg.ssh_binary.string());
        if (!cfg.login.empty())
        {
            cmd.emplace_back("-l");
            cmd.push_back(cfg.login);
        }
        append_identity_flags(cmd, cfg);
        if (forward_agent)
        {
            cmd.emplace_back("-A");
        }
        if (has_port(cfg))
        {
            cmd.emplace_back("-p");
            cmd.push_back(fmt::format("{}", *cfg.port));
        }
        cmd.push_back(cfg.host);
        cmd.emplace_back(interpreter);
        return cmd;
    }

    auto build_copy_command(connection const &conn, std::span<std::string const> sources, std::string_view target)
        -> result<std::vector<std::string>>
    {
        if (sources.empty())
        {
            return fail(error_kind::validation, "You should name at least one file to copy");
        }

        auto const &cfg = conn.config();

        std::vector<std::string> cmd;
        cmd.reserve(sources.size() + 10);
        cmd.push_back(cfg.scp_binary.string());
        cmd.emplace_back("-q");
        cmd.emplace_back("-r");
        append_identity_flags(cmd, cfg);
        // scp spells the port flag with a capital P
        if (has_port(cfg))
        {
            cmd.emplace_back("-P");
            cmd.push_back(fmt::format("{}", *cfg.port));
        }
        std::ranges::copy(sources, std::back_inserter(cmd));

        auto const remote = cfg.login.empty() ? cfg.host : fmt::format("{}@{}", cfg.login, cfg.host);
        cmd.push_back(fmt::format("{}:{}", remote, target));
        return cmd;
    }

    auto shell_quote(std::string_view token) -> std::string
    {
        if (token.empty())
        {
            return "''";
        }
        if (std::ranges::all_of(token, is_shell_safe))
        {
            return std::string{token};
        }

        std::string quoted;
        quoted.reserve(token.size() + 2);
        quoted.push_back('\'');
        for (auto const c : token)
        {
            if (c == '\'')
            {
                quoted.append(R"('"'"')");
            }
            else
            {
                quoted.push_back(c);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    auto shell_join(std::span<std::string const> tokens) -> std::string
    {
        std::string joined;
        for (auto const &token : tokens)
        {
            if (!joined.empty())
            {
                joined.push_back(' ');
            }
            joined.append(shell_quote(token));
        }
        return joined;
    }

} // namespace sshwrap
