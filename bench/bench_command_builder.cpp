// bench/bench_command_builder.cpp - argv construction and quoting, no processes involved

#include "sshwrap/command_builder.hpp"
#include "sshwrap/connection.hpp"
#include "sshwrap/transfer_source.hpp"

#include <fmt/format.h>
#include <nanobench.h>
#include <string>
#include <vector>

namespace bench
{

    void run_command_builder_benchmarks()
    {
        using namespace ankerl::nanobench;

        auto conn = sshwrap::connection::create({.host = "build01.example.com", .login = "deploy", .port = 2222});
        if (!conn)
        {
            fmt::print(stderr, "Skipping builder benchmarks: {}\n", conn.error());
            return;
        }

        Bench().run("BuildRunCommand",
                    [&]
                    {
                        auto argv = sshwrap::build_run_command(*conn, "/bin/bash", true);
                        doNotOptimizeAway(argv);
                    });

        std::vector<std::string> sources;
        for (int i = 0; i < 32; ++i)
        {
            sources.push_back(fmt::format("/var/cache/build/artifact-{}.tar.gz", i));
        }
        Bench().batch(sources.size()).run("BuildCopyCommand_32",
                                          [&]
                                          {
                                              auto argv = sshwrap::build_copy_command(*conn, sources, "/srv/releases/");
                                              doNotOptimizeAway(argv);
                                          });

        Bench().run("ShellQuote_Safe",
                    [&]
                    {
                        auto quoted = sshwrap::shell_quote("/srv/releases/artifact-1.tar.gz");
                        doNotOptimizeAway(quoted);
                    });

        Bench().run("ShellQuote_Unsafe",
                    [&]
                    {
                        auto quoted = sshwrap::shell_quote("it's a file with spaces; and $(meta)");
                        doNotOptimizeAway(quoted);
                    });

        std::vector<std::string> const chmod_tokens{"chmod", "0644", "/srv/a b", "/srv/c", "/srv/d'e"};
        Bench().run("ShellJoin_Chmod",
                    [&]
                    {
                        auto line = sshwrap::shell_join(chmod_tokens);
                        doNotOptimizeAway(line);
                    });

        std::vector<sshwrap::source> const paths(16, sshwrap::from_path("/etc/hostname"));
        Bench().batch(paths.size()).run("ResolveSources_PathsOnly",
                                        [&]
                                        {
                                            auto resolved = sshwrap::resolve_sources(paths);
                                            doNotOptimizeAway(resolved);
                                        });
    }

} // namespace bench
