#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace sshwrap
{

    // ============================================================================
    // error handling - one error type, four kinds, no exceptions
    // ============================================================================

    enum class error_kind : std::uint8_t
    {
        validation = 1,
        connection,
        transfer,
        post_process,
    };

    struct error_kind_formatter
    {
        [[nodiscard]] static constexpr auto to_string(error_kind const kind) noexcept
            -> std::string_view
        {
            switch (kind)
            {
            case error_kind::validation:
                return "validation_error";
            case error_kind::connection:
                return "connection_error";
            case error_kind::transfer:
                return "transfer_error";
            case error_kind::post_process:
                return "post_process_error";
            }
            return "unknown_error";
        }
    };

    [[nodiscard]] auto make_error_code(error_kind kind) noexcept -> std::error_code;

    /// @brief Human-readable description of an error kind
    [[nodiscard]] auto to_string(error_kind kind) -> std::string;

    class error
    {
        error_kind kind_{error_kind::validation};
        std::string message_;

    public:
        error(error_kind const kind, std::string message) : kind_{kind}, message_{std::move(message)} {}

        [[nodiscard]] auto kind() const noexcept -> error_kind { return kind_; }
        [[nodiscard]] auto message() const noexcept -> std::string const & { return message_; }
        [[nodiscard]] auto code() const noexcept -> std::error_code { return make_error_code(kind_); }
    };

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

    [[nodiscard]] inline auto fail(error_kind const kind, std::string message) -> std::unexpected<error>
    {
        return std::unexpected{error{kind, std::move(message)}};
    }

    namespace constants
    {
        inline constexpr std::string_view ssh_binary = "/usr/bin/ssh";
        inline constexpr std::string_view scp_binary = "/usr/bin/scp";
        inline constexpr std::string_view default_interpreter = "/bin/bash";
        inline constexpr std::string_view agent_socket_variable = "SSH_AUTH_SOCK";

        // ssh reserves 255 for its own connection and authentication failures
        inline constexpr int ssh_client_failure = 255;

        inline constexpr std::chrono::seconds default_timeout{60};
    }

    namespace text
    {
        /// @brief Strip leading and trailing ASCII whitespace
        [[nodiscard]] auto trim(std::string_view bytes) -> std::string;

        /// @brief Decode raw bytes as UTF-8, replacing invalid sequences with U+FFFD
        [[nodiscard]] auto to_utf8_lossy(std::string_view bytes) -> std::string;
    }

} // namespace sshwrap

template <>
struct std::is_error_code_enum<sshwrap::error_kind> : std::true_type
{
};

template <>
struct fmt::formatter<sshwrap::error_kind> : fmt::formatter<std::string_view>
{
    auto format(sshwrap::error_kind const kind, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            sshwrap::error_kind_formatter::to_string(kind), ctx);
    }
};

template <>
struct fmt::formatter<sshwrap::error> : fmt::formatter<std::string_view>
{
    auto format(sshwrap::error const &err, format_context &ctx) const
    {
        auto const text = fmt::format("{}: {}", err.kind(), err.message());
        return fmt::formatter<std::string_view>::format(text, ctx);
    }
};
