// tests/unit/test_connection_flows.cpp - run/copy against stand-in ssh and scp binaries
// the fake ssh runs the interpreter locally and the fake scp copies into a local "remote" directory

#include "sshwrap/connection.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>
#include <fmt/format.h>

#include <chrono>

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

using namespace sshwrap;
using namespace sshwrap::testing;

TEST_SUITE("connection_run")
{
    TEST_CASE_FIXTURE(fake_remote, "command output is trimmed")
    {
        auto const conn = connect();

        auto const res = conn.run("echo '  padded  '");

        REQUIRE(res.has_value());
        CHECK(res->success());
        CHECK(res->command == "echo '  padded  '");
        CHECK(res->stdout_output == "padded");
        CHECK(res->stderr_output.empty());
    }

    TEST_CASE_FIXTURE(fake_remote, "ssh receives options, host and interpreter")
    {
        auto const conn = connect();

        REQUIRE(conn.run("true").has_value());

        CHECK(read_lines(ssh_log) == std::vector<std::string>{"-l", "tester", "localhost", "/bin/bash"});
    }

    TEST_CASE_FIXTURE(fake_remote, "multi-line scripts go through stdin")
    {
        auto const conn = connect();

        auto const res = conn.run("echo first\necho second\n");

        REQUIRE(res.has_value());
        CHECK(res->stdout_output == "first\nsecond");
    }

    TEST_CASE_FIXTURE(fake_remote, "nonzero exit is data, not an error")
    {
        auto const conn = connect();

        auto const res = conn.run("echo nope >&2; exit 7");

        REQUIRE(res.has_value());
        CHECK_FALSE(res->success());
        CHECK(res->exit_code == 7);
        CHECK(res->stderr_output == "nope");
    }

    TEST_CASE_FIXTURE(fake_remote, "custom interpreter is the last ssh argument")
    {
        auto const conn = connect();

        auto const res = conn.run("echo $0", "/bin/sh");

        REQUIRE(res.has_value());
        CHECK(res->stdout_output == "/bin/sh");
        CHECK(read_lines(ssh_log).back() == "/bin/sh");
    }

    TEST_CASE_FIXTURE(fake_remote, "agent forwarding adds -A")
    {
        auto const conn = connect();

        REQUIRE(conn.run("true", constants::default_interpreter, true).has_value());

        CHECK(read_lines(ssh_log) == std::vector<std::string>{"-l", "tester", "-A", "localhost", "/bin/bash"});
    }

    TEST_CASE_FIXTURE(fake_remote, "agent socket reaches the ssh process")
    {
        config.agent_socket = "/tmp/sshwrap-agent.sock";
        auto const conn = connect();

        auto const res = conn.run("printf '%s' \"$SSH_AUTH_SOCK\"");

        REQUIRE(res.has_value());
        CHECK(res->stdout_output == "/tmp/sshwrap-agent.sock");
    }

    TEST_CASE_FIXTURE(fake_remote, "exit status 255 is a connection error")
    {
        config.ssh_binary = workspace.write_script("ssh-refused", refused_ssh_script);
        auto const conn = connect();

        auto const res = conn.run("whoami");

        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind() == error_kind::connection);
        CHECK(res.error().message() == "ssh: connect to host example.invalid port 22: Connection refused");
    }

    TEST_CASE_FIXTURE(fake_remote, "silent exit 255 still explains itself")
    {
        config.ssh_binary = workspace.write_script("ssh-silent", "#!/bin/sh\nexit 255\n");
        auto const conn = connect();

        auto const res = conn.run("whoami");

        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind() == error_kind::connection);
        CHECK(res.error().message() == "ssh exited with status 255");
    }

    TEST_CASE_FIXTURE(fake_remote, "hanging ssh is cut off by the timeout")
    {
        auto const pid_file = workspace.path() / "ssh.pid";
        config.ssh_binary = workspace.write_script("ssh-hang", hanging_script(pid_file));
        config.timeout = std::chrono::seconds{1};
        auto const conn = connect();

        auto const started = std::chrono::steady_clock::now();
        auto const res = conn.run("whoami");
        auto const elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind() == error_kind::connection);
        CHECK(res.error().message().find("timed out") != std::string::npos);
        CHECK(elapsed < std::chrono::seconds{5});
        CHECK(process_is_gone(pid_file));
    }

    TEST_CASE_FIXTURE(fake_remote, "hanging scp is cut off and leaves nothing behind")
    {
        auto const before = count_sshwrap_temp_dirs();
        auto const pid_file = workspace.path() / "scp.pid";
        config.scp_binary = workspace.write_script("scp-hang", hanging_script(pid_file));
        config.timeout = std::chrono::seconds{1};
        auto const conn = connect();
        std::vector<source> const files{from_bytes("x", "x.txt")};

        auto const copied = conn.copy(files, remote_dir.string());

        REQUIRE_FALSE(copied.has_value());
        CHECK(copied.error().kind() == error_kind::transfer);
        CHECK(process_is_gone(pid_file));
        CHECK(count_sshwrap_temp_dirs() == before);
    }

    TEST_CASE_FIXTURE(fake_remote, "huge timeout means no practical limit")
    {
        config.timeout = std::chrono::seconds{10'000'000'000};
        auto const conn = connect();

        auto const res = conn.run("sleep 0.2; echo hi");

        REQUIRE(res.has_value());
        CHECK(res->stdout_output == "hi");
    }

    TEST_CASE_FIXTURE(fake_remote, "largest representable timeout still runs")
    {
        config.timeout = std::chrono::seconds::max();
        auto const conn = connect();

        auto const res = conn.run("echo hi");

        REQUIRE(res.has_value());
        CHECK(res->stdout_output == "hi");
    }

    TEST_CASE_FIXTURE(fake_remote, "ignored SIGCHLD does not turn success into an error")
    {
        ignored_sigchld const ignore;
        auto const conn = connect();

        auto const res = conn.run("echo hi");

        REQUIRE(res.has_value());
        CHECK(res->exit_code == 0);
        CHECK(res->stdout_output == "hi");
    }

    TEST_CASE_FIXTURE(fake_remote, "missing ssh binary is a connection error")
    {
        config.ssh_binary = workspace.path() / "no-such-ssh";
        auto const conn = connect();

        auto const res = conn.run("whoami");

        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind() == error_kind::connection);
    }
}

TEST_SUITE("connection_copy")
{
    TEST_CASE_FIXTURE(fake_remote, "local file into a directory")
    {
        auto const local = workspace.write_file("app.conf", "key = value\n");
        auto const conn = connect();
        std::vector<source> const files{from_path(local)};

        auto const copied = conn.copy(files, remote_dir.string());

        REQUIRE(copied.has_value());
        CHECK(read_file(remote_dir / "app.conf") == "key = value\n");
        auto const argv = read_lines(scp_log);
        REQUIRE(argv.size() == 4);
        CHECK(argv[0] == "-q");
        CHECK(argv[1] == "-r");
        CHECK(argv[2] == local.string());
        CHECK(argv[3] == fmt::format("tester@localhost:{}", remote_dir.string()));
    }

    TEST_CASE_FIXTURE(fake_remote, "named stream lands under its own name")
    {
        auto const before = count_sshwrap_temp_dirs();
        auto const conn = connect();
        std::vector<source> const files{from_bytes("streamed bytes", "notes.txt")};

        auto const copied = conn.copy(files, remote_dir.string());

        REQUIRE(copied.has_value());
        CHECK(read_file(remote_dir / "notes.txt") == "streamed bytes");

        auto const argv = read_lines(scp_log);
        REQUIRE(argv.size() == 4);
        std::filesystem::path const staged{argv[2]};
        CHECK(staged.filename() == "notes.txt");
        CHECK(staged.parent_path().filename().string().starts_with("sshwrap-"));
        CHECK_FALSE(std::filesystem::exists(staged.parent_path()));
        CHECK(count_sshwrap_temp_dirs() == before);
    }

    TEST_CASE_FIXTURE(fake_remote, "anonymous stream to an explicit file name")
    {
        auto const conn = connect();
        auto const target = remote_dir / "out.bin";
        std::vector<source> const files{from_bytes(std::string{"\x7F" "ELF\x00", 5})};

        auto const copied = conn.copy(files, target.string());

        REQUIRE(copied.has_value());
        CHECK(read_file(target) == std::string{"\x7F" "ELF\x00", 5});
    }

    TEST_CASE_FIXTURE(fake_remote, "scp failure is a transfer error and cleans up")
    {
        auto const before = count_sshwrap_temp_dirs();
        auto const conn = connect();
        std::vector<source> const files{from_bytes("x", "x.txt")};

        auto const copied = conn.copy(files, (remote_dir / "missing" / "").string());

        REQUIRE_FALSE(copied.has_value());
        CHECK(copied.error().kind() == error_kind::transfer);
        CHECK_FALSE(copied.error().message().empty());
        CHECK(count_sshwrap_temp_dirs() == before);
    }

    TEST_CASE_FIXTURE(fake_remote, "missing scp binary is a transfer error")
    {
        config.scp_binary = workspace.path() / "no-such-scp";
        auto const conn = connect();
        std::vector<source> const files{from_path("/etc/hostname")};

        auto const copied = conn.copy(files, remote_dir.string());

        REQUIRE_FALSE(copied.has_value());
        CHECK(copied.error().kind() == error_kind::transfer);
    }

    TEST_CASE_FIXTURE(fake_remote, "empty source list is a validation error")
    {
        auto const conn = connect();

        auto const copied = conn.copy({}, remote_dir.string());

        REQUIRE_FALSE(copied.has_value());
        CHECK(copied.error().kind() == error_kind::validation);
        CHECK(copied.error().message() == "You should name at least one file to copy");
    }

    TEST_CASE_FIXTURE(fake_remote, "mode is applied to every copied file")
    {
        auto const a = workspace.write_file("a.txt", "a");
        auto const b = workspace.write_file("b.txt", "b");
        auto const conn = connect();
        std::vector<source> const files{from_path(a), from_path(b)};

        auto const copied = conn.copy(files, remote_dir.string(), "0600");

        REQUIRE(copied.has_value());
        auto const expected = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
        CHECK(std::filesystem::status(remote_dir / "a.txt").permissions() == expected);
        CHECK(std::filesystem::status(remote_dir / "b.txt").permissions() == expected);
    }

    TEST_CASE_FIXTURE(fake_remote, "mode on a file target")
    {
        auto const local = workspace.write_file("run.sh", "#!/bin/sh\n");
        auto const target = remote_dir / "deploy.sh";
        auto const conn = connect();
        std::vector<source> const files{from_path(local)};

        auto const copied = conn.copy(files, target.string(), "0750");

        REQUIRE(copied.has_value());
        auto const expected = std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                              std::filesystem::perms::group_exec;
        CHECK(std::filesystem::status(target).permissions() == expected);
    }

    TEST_CASE_FIXTURE(fake_remote, "invalid mode is a post-process error")
    {
        auto const local = workspace.write_file("a.txt", "a");
        auto const conn = connect();
        std::vector<source> const files{from_path(local)};

        auto const copied = conn.copy(files, remote_dir.string(), "bogus");

        REQUIRE_FALSE(copied.has_value());
        CHECK(copied.error().kind() == error_kind::post_process);
        CHECK(copied.error().message().find("bogus") != std::string::npos);
        // the file itself made it across
        CHECK(std::filesystem::exists(remote_dir / "a.txt"));
    }

    TEST_CASE_FIXTURE(fake_remote, "owner change to the current user")
    {
        auto const *pw = ::getpwuid(::getuid());
        auto const *gr = ::getgrgid(::getgid());
        REQUIRE(pw != nullptr);
        REQUIRE(gr != nullptr);
        auto const owner = fmt::format("{}:{}", pw->pw_name, gr->gr_name);

        auto const local = workspace.write_file("a.txt", "a");
        auto const conn = connect();
        std::vector<source> const files{from_path(local)};

        auto const copied = conn.copy(files, remote_dir.string(), std::nullopt, owner);

        REQUIRE(copied.has_value());
        CHECK(std::filesystem::exists(remote_dir / "a.txt"));
    }

    TEST_CASE_FIXTURE(fake_remote, "empty mode and owner skip post-processing")
    {
        auto const local = workspace.write_file("a.txt", "a");
        auto const conn = connect();
        std::vector<source> const files{from_path(local)};

        REQUIRE(conn.copy(files, remote_dir.string(), "", "").has_value());

        CHECK_FALSE(std::filesystem::exists(ssh_log));
    }

    TEST_CASE_FIXTURE(fake_remote, "unreachable host during post-processing is a post-process error")
    {
        config.ssh_binary = workspace.write_script("ssh-refused", refused_ssh_script);
        auto const local = workspace.write_file("a.txt", "a");
        auto const conn = connect();
        std::vector<source> const files{from_path(local)};

        auto const copied = conn.copy(files, remote_dir.string(), "0644");

        REQUIRE_FALSE(copied.has_value());
        CHECK(copied.error().kind() == error_kind::post_process);
    }
}

TEST_SUITE("connection_get_targets")
{
    TEST_CASE_FIXTURE(fake_remote, "directory target gets one path per file")
    {
        auto const conn = connect();
        std::vector<std::string> const files{"/local/a.txt", "b.txt", "/tmp/sshwrap-x/c.bin"};

        auto const targets = conn.get_targets(files, remote_dir.string());

        REQUIRE(targets.has_value());
        CHECK(*targets == std::vector<std::string>{
                              (remote_dir / "a.txt").string(),
                              (remote_dir / "b.txt").string(),
                              (remote_dir / "c.bin").string(),
                          });
    }

    TEST_CASE_FIXTURE(fake_remote, "trailing slash does not double up")
    {
        auto const conn = connect();
        std::vector<std::string> const files{"a.txt"};

        auto const targets = conn.get_targets(files, remote_dir.string() + "/");

        REQUIRE(targets.has_value());
        CHECK(*targets == std::vector<std::string>{remote_dir.string() + "/a.txt"});
    }

    TEST_CASE_FIXTURE(fake_remote, "non-directory target is returned as is")
    {
        auto const conn = connect();
        std::vector<std::string> const files{"a.txt", "b.txt"};
        auto const target = (remote_dir / "renamed.txt").string();

        auto const targets = conn.get_targets(files, target);

        REQUIRE(targets.has_value());
        CHECK(*targets == std::vector<std::string>{target});
    }

    TEST_CASE_FIXTURE(fake_remote, "target with spaces is probed as one word")
    {
        auto const spaced = workspace.make_dir("remote dir");
        auto const conn = connect();
        std::vector<std::string> const files{"a.txt"};

        auto const targets = conn.get_targets(files, spaced.string());

        REQUIRE(targets.has_value());
        CHECK(*targets == std::vector<std::string>{(spaced / "a.txt").string()});
    }
}
