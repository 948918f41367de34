// transfer_source.cpp - stream sources are written into a private temp dir before scp sees them

#include "sshwrap/transfer_source.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <istream>
#include <iterator>
#include <system_error>
#include <utility>

#include <stdlib.h>
#include <unistd.h>

namespace sshwrap
{

    namespace
    {

        constexpr std::string_view temp_dir_template = "sshwrap-XXXXXX";
        constexpr std::string_view anonymous_file_template = "stream-XXXXXX";

        [[nodiscard]] auto write_file(std::filesystem::path const &path, std::string_view bytes) -> void_result
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                return fail(error_kind::transfer, fmt::format("cannot create {}", path.string()));
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.close();
            if (!out)
            {
                return fail(error_kind::transfer, fmt::format("cannot write {}", path.string()));
            }
            return {};
        }

        // unique empty file inside dir, like mkstemp(3)
        [[nodiscard]] auto make_anonymous_file(std::filesystem::path const &dir) -> result<std::filesystem::path>
        {
            auto name = (dir / anonymous_file_template).string();
            auto const fd = ::mkstemp(name.data());
            if (fd < 0)
            {
                return fail(error_kind::transfer,
                            fmt::format("cannot create temporary file in {}: {}", dir.string(), std::strerror(errno)));
            }
            ::close(fd);
            return std::filesystem::path{name};
        }

        [[nodiscard]] auto materialize(stream_source const &stream, std::filesystem::path const &dir)
            -> result<std::string>
        {
            if (!stream.read)
            {
                return fail(error_kind::transfer, "stream source has no byte producer");
            }

            auto bytes = stream.read();
            if (!bytes)
            {
                return std::unexpected{bytes.error()};
            }

            std::filesystem::path target;
            if (stream.name.has_value())
            {
                auto const basename = std::filesystem::path{*stream.name}.filename();
                if (!basename.empty())
                {
                    target = dir / basename;
                }
            }
            if (target.empty())
            {
                auto anonymous = make_anonymous_file(dir);
                if (!anonymous)
                {
                    return std::unexpected{anonymous.error()};
                }
                target = std::move(*anonymous);
            }

            if (auto written = write_file(target, *bytes); !written)
            {
                return std::unexpected{written.error()};
            }
            return target.string();
        }

    } // namespace

    // =============================================================================
    // source constructors
    // =============================================================================

    auto from_path(std::filesystem::path const &path) -> source
    {
        return path_source{path.string()};
    }

    auto from_bytes(std::string bytes, std::optional<std::string> name) -> source
    {
        return stream_source{
            .read = [data = std::move(bytes)]() -> result<std::string> { return data; },
            .name = std::move(name),
        };
    }

    auto from_stream(std::shared_ptr<std::istream> stream, std::optional<std::string> name) -> source
    {
        return stream_source{
            .read = [stream = std::move(stream)]() -> result<std::string>
            {
                if (!stream)
                {
                    return fail(error_kind::transfer, "stream source is null");
                }
                std::string data{std::istreambuf_iterator<char>{*stream}, std::istreambuf_iterator<char>{}};
                if (stream->bad())
                {
                    return fail(error_kind::transfer, "failed to read stream source");
                }
                return data;
            },
            .name = std::move(name),
        };
    }

    // =============================================================================
    // scoped_temp_dir
    // =============================================================================

    scoped_temp_dir::scoped_temp_dir(std::filesystem::path path) noexcept : path_{std::move(path)} {}

    scoped_temp_dir::~scoped_temp_dir() noexcept
    {
        remove();
    }

    scoped_temp_dir::scoped_temp_dir(scoped_temp_dir &&other) noexcept : path_{std::exchange(other.path_, {})} {}

    auto scoped_temp_dir::operator=(scoped_temp_dir &&other) noexcept -> scoped_temp_dir &
    {
        if (this != &other)
        {
            remove();
            path_ = std::exchange(other.path_, {});
        }
        return *this;
    }

    auto scoped_temp_dir::create() -> result<scoped_temp_dir>
    {
        std::error_code ec;
        auto const base = std::filesystem::temp_directory_path(ec);
        if (ec)
        {
            return fail(error_kind::transfer, fmt::format("no temporary directory available: {}", ec.message()));
        }

        auto name = (base / temp_dir_template).string();
        if (::mkdtemp(name.data()) == nullptr)
        {
            return fail(error_kind::transfer,
                        fmt::format("cannot create temporary directory in {}: {}", base.string(), std::strerror(errno)));
        }
        return scoped_temp_dir{std::filesystem::path{name}};
    }

    void scoped_temp_dir::remove() noexcept
    {
        if (path_.empty())
        {
            return;
        }
        // best effort, like rm -rf
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        path_.clear();
    }

    // =============================================================================
    // resolution
    // =============================================================================

    auto resolve_sources(std::span<source const> sources) -> result<resolved_files>
    {
        resolved_files resolved;
        resolved.paths.reserve(sources.size());

        for (auto const &src : sources)
        {
            if (auto const *path = std::get_if<path_source>(&src))
            {
                resolved.paths.push_back(path->path);
                continue;
            }

            auto const &stream = std::get<stream_source>(src);
            if (!resolved.temp_dir.has_value())
            {
                auto dir = scoped_temp_dir::create();
                if (!dir)
                {
                    return std::unexpected{dir.error()};
                }
                resolved.temp_dir.emplace(std::move(*dir));
            }

            // on failure `resolved` goes out of scope and takes the temp dir with it
            auto file = materialize(stream, resolved.temp_dir->path());
            if (!file)
            {
                return std::unexpected{file.error()};
            }
            resolved.paths.push_back(std::move(*file));
        }

        return resolved;
    }

} // namespace sshwrap
