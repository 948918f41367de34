// command_builder.hpp - argv construction for ssh and scp
// argv stays a vector of strings all the way to posix_spawn; only chmod/chown go through a shell

#pragma once

#include "sshwrap/common.hpp"
#include "sshwrap/connection.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sshwrap
{

    /// @brief [ssh, -l login?, -F config?, -i identity?, -A?, -p port?, host, interpreter]
    [[nodiscard]] auto build_run_command(connection const &conn, std::string_view interpreter, bool forward_agent)
        -> std::vector<std::string>;

    /// @brief [scp, -q, -r, -F config?, -i identity?, -P port?, source..., [login@]host:target]
    /// @return validation error if no source is given
    [[nodiscard]] auto build_copy_command(connection const &conn, std::span<std::string const> sources,
                                          std::string_view target) -> result<std::vector<std::string>>;

    /// @brief Quote one token for a POSIX shell, leaving safe tokens untouched
    [[nodiscard]] auto shell_quote(std::string_view token) -> std::string;

    /// @brief shell_quote every token and join with single spaces
    [[nodiscard]] auto shell_join(std::span<std::string const> tokens) -> std::string;

} // namespace sshwrap
