// sshwrap_cli.cpp - command line front end for sshwrap::connection
// run a command remotely or push files, with the same validation and timeouts as the library

#include "sshwrap/command_builder.hpp"
#include "sshwrap/connection.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fmt/color.h>
#include <fmt/format.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{

    // =============================================================================
    // configuration
    // =============================================================================

    struct cli_config
    {
        std::string mode;
        sshwrap::connection_config connection;

        // run settings
        std::string interpreter{sshwrap::constants::default_interpreter};
        bool forward_agent{false};

        // copy settings
        std::optional<std::string> file_mode;
        std::optional<std::string> owner;
        std::optional<std::string> stdin_name;

        std::vector<std::string> positional;
        bool verbose{false};
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} run  [options] [--] <command...>
       {} copy [options] [--mode <mode>] [--owner <owner>] <source...> <target>

Connection options:
  --host <host>             Remote host name or address (required)
  --login <user>            Remote login (default: ssh decides)
  --port <port>             Remote port
  --config <file>           ssh_config(5) file passed with -F
  --identity <file>         Private key passed with -i
  --agent-socket <path>     SSH_AUTH_SOCK for the ssh/scp process
  --timeout <seconds>       Connect and execution timeout (default: 60)
  --ssh <path>              ssh binary (default: /usr/bin/ssh)
  --scp <path>              scp binary (default: /usr/bin/scp)

Run options:
  --interpreter <path>      Remote program reading the command on stdin (default: /bin/bash)
  --forward-agent           Forward the ssh agent (-A)

Copy options:
  --mode <mode>             chmod the copied files, e.g. 0644
  --owner <owner>           chown the copied files, e.g. www-data:www-data
  --stdin-name <name>       Remote file name for a '-' source read from stdin

Other:
  --verbose                 Print the ssh/scp command line before running it
  --help                    Show this text

If no command is given to 'run', the command text is read from stdin.

Examples:
  {} run --host build01 --login deploy -- uname -a
  {} copy --host build01 --login deploy --mode 0644 ./app.conf /etc/app/
  echo hello | {} copy --host build01 --stdin-name hello.txt - /tmp

)",
                   program_name, program_name, program_name, program_name, program_name);
    }

    auto print_status(std::string_view msg) -> void
    {
        fmt::print(stderr, fmt::fg(fmt::color::cyan), "[sshwrap] {}\n", msg);
    }

    auto print_error(std::string_view msg) -> void
    {
        fmt::print(stderr, fmt::fg(fmt::color::red), "Error: {}\n", msg);
    }

    template <typename T>
    [[nodiscard]] auto parse_number(std::string_view text) -> std::optional<T>
    {
        T value{};
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

    // =============================================================================
    // command line parsing
    // =============================================================================

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<cli_config>
    {
        if (argc < 2)
        {
            return std::nullopt;
        }

        cli_config config;
        config.mode = argv[1];
        if (config.mode != "run" && config.mode != "copy")
        {
            if (config.mode != "--help" && config.mode != "-h")
            {
                fmt::print(stderr, "Error: unknown mode '{}'\n", config.mode);
            }
            return std::nullopt;
        }

        bool options_done = false;
        for (int i = 2; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (options_done || arg == "-" || !arg.starts_with("-"))
            {
                config.positional.emplace_back(arg);
            }
            else if (arg == "--")
            {
                options_done = true;
            }
            else if (arg == "--host" && i + 1 < argc)
            {
                config.connection.host = argv[++i];
            }
            else if (arg == "--login" && i + 1 < argc)
            {
                config.connection.login = argv[++i];
            }
            else if (arg == "--port" && i + 1 < argc)
            {
                auto const port = parse_number<std::uint16_t>(argv[++i]);
                if (!port.has_value() || *port == 0)
                {
                    fmt::print(stderr, "Error: invalid port '{}'\n", argv[i]);
                    return std::nullopt;
                }
                config.connection.port = *port;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                config.connection.config_file = argv[++i];
            }
            else if (arg == "--identity" && i + 1 < argc)
            {
                config.connection.identity_file = argv[++i];
            }
            else if (arg == "--agent-socket" && i + 1 < argc)
            {
                config.connection.agent_socket = argv[++i];
            }
            else if (arg == "--timeout" && i + 1 < argc)
            {
                auto const seconds = parse_number<std::int64_t>(argv[++i]);
                if (!seconds.has_value() || *seconds <= 0)
                {
                    fmt::print(stderr, "Error: invalid timeout '{}'\n", argv[i]);
                    return std::nullopt;
                }
                config.connection.timeout = std::chrono::seconds{*seconds};
            }
            else if (arg == "--ssh" && i + 1 < argc)
            {
                config.connection.ssh_binary = argv[++i];
            }
            else if (arg == "--scp" && i + 1 < argc)
            {
                config.connection.scp_binary = argv[++i];
            }
            else if (arg == "--interpreter" && i + 1 < argc)
            {
                config.interpreter = argv[++i];
            }
            else if (arg == "--forward-agent")
            {
                config.forward_agent = true;
            }
            else if (arg == "--mode" && i + 1 < argc)
            {
                config.file_mode = argv[++i];
            }
            else if (arg == "--owner" && i + 1 < argc)
            {
                config.owner = argv[++i];
            }
            else if (arg == "--stdin-name" && i + 1 < argc)
            {
                config.stdin_name = argv[++i];
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                return std::nullopt;
            }
            else
            {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                return std::nullopt;
            }
        }

        if (config.connection.host.empty())
        {
            fmt::print(stderr, "Error: --host is required\n");
            return std::nullopt;
        }
        if (config.mode == "copy" && config.positional.size() < 2)
        {
            fmt::print(stderr, "Error: copy needs at least one source and a target\n");
            return std::nullopt;
        }

        return config;
    }

    [[nodiscard]] auto read_stdin() -> std::string
    {
        return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
    }

    // =============================================================================
    // modes
    // =============================================================================

    auto run_remote(sshwrap::connection const &conn, cli_config const &config) -> int
    {
        auto const command =
            config.positional.empty() ? read_stdin() : fmt::format("{}", fmt::join(config.positional, " "));

        if (config.verbose)
        {
            auto const argv = sshwrap::build_run_command(conn, config.interpreter, config.forward_agent);
            print_status(fmt::format("{}", fmt::join(argv, " ")));
            print_status(fmt::format("stdin: {}", command));
        }

        auto const result = conn.run(command, config.interpreter, config.forward_agent);
        if (!result.has_value())
        {
            print_error(fmt::format("{}", result.error()));
            return 1;
        }

        if (!result->stdout_output.empty())
        {
            fmt::print("{}\n", result->stdout_output);
        }
        if (!result->stderr_output.empty())
        {
            fmt::print(stderr, "{}\n", result->stderr_output);
        }
        if (config.verbose)
        {
            print_status(fmt::format("exit code {}", result->exit_code));
        }
        return result->exit_code;
    }

    auto copy_files(sshwrap::connection const &conn, cli_config const &config) -> int
    {
        auto const &target = config.positional.back();

        std::vector<sshwrap::source> sources;
        sources.reserve(config.positional.size() - 1);
        bool stdin_used = false;
        for (auto it = config.positional.begin(); it != std::prev(config.positional.end()); ++it)
        {
            if (*it == "-")
            {
                if (stdin_used)
                {
                    print_error("stdin can only be used as a source once");
                    return 1;
                }
                stdin_used = true;
                sources.push_back(sshwrap::from_bytes(read_stdin(), config.stdin_name));
            }
            else
            {
                sources.push_back(sshwrap::from_path(*it));
            }
        }

        if (config.verbose)
        {
            print_status(fmt::format("copying {} file(s) to {}:{}", sources.size(), conn.host(), target));
        }

        std::optional<std::string_view> mode;
        std::optional<std::string_view> owner;
        if (config.file_mode.has_value())
        {
            mode = *config.file_mode;
        }
        if (config.owner.has_value())
        {
            owner = *config.owner;
        }

        auto const result = conn.copy(sources, target, mode, owner);
        if (!result.has_value())
        {
            print_error(fmt::format("{}", result.error()));
            return 1;
        }

        if (config.verbose)
        {
            print_status("done");
        }
        return 0;
    }

} // anonymous namespace

auto main(int argc, char const *argv[]) -> int
{
    auto config_opt = parse_args(argc, argv);
    if (!config_opt.has_value())
    {
        print_usage(argv[0]);
        return 1;
    }
    auto const &config = *config_opt;

    auto conn = sshwrap::connection::create(config.connection);
    if (!conn.has_value())
    {
        print_error(fmt::format("{}", conn.error()));
        return 1;
    }

    if (config.mode == "run")
    {
        return run_remote(*conn, config);
    }
    return copy_files(*conn, config);
}
