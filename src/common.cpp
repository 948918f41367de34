// common.cpp - error category and byte helpers shared by every module

#include "sshwrap/common.hpp"

#include <fmt/format.h>

namespace sshwrap
{

    namespace
    {

        class sshwrap_error_category_impl : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "sshwrap"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error_kind>(ev))
                {
                case error_kind::validation:
                    return "invalid connection parameters or arguments";
                case error_kind::connection:
                    return "remote command execution failed";
                case error_kind::transfer:
                    return "file transfer failed";
                case error_kind::post_process:
                    return "remote chmod/chown after transfer failed";
                default:
                    return fmt::format("unknown sshwrap error ({})", ev);
                }
            }
        };

        [[nodiscard]] auto sshwrap_error_category() noexcept -> std::error_category const &
        {
            static sshwrap_error_category_impl const instance;
            return instance;
        }

        [[nodiscard]] constexpr auto is_space(char const c) noexcept -> bool
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        [[nodiscard]] constexpr auto is_continuation(unsigned char const c) noexcept -> bool
        {
            return (c & 0xC0U) == 0x80U;
        }

        constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

    } // namespace

    auto make_error_code(error_kind kind) noexcept -> std::error_code
    {
        return {static_cast<int>(kind), sshwrap_error_category()};
    }

    auto to_string(error_kind kind) -> std::string
    {
        return sshwrap_error_category().message(static_cast<int>(kind));
    }

    namespace text
    {

        auto trim(std::string_view bytes) -> std::string
        {
            while (!bytes.empty() && is_space(bytes.front()))
            {
                bytes.remove_prefix(1);
            }
            while (!bytes.empty() && is_space(bytes.back()))
            {
                bytes.remove_suffix(1);
            }
            return std::string{bytes};
        }

        auto to_utf8_lossy(std::string_view bytes) -> std::string
        {
            std::string out;
            out.reserve(bytes.size());

            std::size_t i = 0;
            while (i < bytes.size())
            {
                auto const lead = static_cast<unsigned char>(bytes[i]);

                std::size_t length = 0;
                std::uint32_t min_code_point = 0;
                if (lead < 0x80U)
                {
                    out.push_back(static_cast<char>(lead));
                    ++i;
                    continue;
                }
                if ((lead & 0xE0U) == 0xC0U)
                {
                    length = 2;
                    min_code_point = 0x80;
                }
                else if ((lead & 0xF0U) == 0xE0U)
                {
                    length = 3;
                    min_code_point = 0x800;
                }
                else if ((lead & 0xF8U) == 0xF0U)
                {
                    length = 4;
                    min_code_point = 0x10000;
                }
                else
                {
                    out.append(replacement_character);
                    ++i;
                    continue;
                }

                if (i + length > bytes.size())
                {
                    out.append(replacement_character);
                    ++i;
                    continue;
                }

                std::uint32_t code_point = lead & (0xFFU >> (length + 1));
                bool well_formed = true;
                for (std::size_t k = 1; k < length; ++k)
                {
                    auto const next = static_cast<unsigned char>(bytes[i + k]);
                    if (!is_continuation(next))
                    {
                        well_formed = false;
                        break;
                    }
                    code_point = (code_point << 6) | (next & 0x3FU);
                }

                // overlong forms, surrogates and values past U+10FFFF are all rejected
                if (!well_formed || code_point < min_code_point || code_point > 0x10FFFF ||
                    (code_point >= 0xD800 && code_point <= 0xDFFF))
                {
                    out.append(replacement_character);
                    ++i;
                    continue;
                }

                out.append(bytes.substr(i, length));
                i += length;
            }

            return out;
        }

    } // namespace text

} // namespace sshwrap
