// transfer_source.hpp - what can be handed to connection::copy
// either a path that already exists on disk, or bytes that have to land on disk first

#pragma once

#include "sshwrap/common.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace sshwrap
{

    // =============================================================================
    // source variant
    // =============================================================================

    struct path_source
    {
        std::string path; // handed to scp verbatim
    };

    using byte_producer = std::function<result<std::string>()>;

    struct stream_source
    {
        byte_producer read;
        std::optional<std::string> name; // only the basename is used
    };

    using source = std::variant<path_source, stream_source>;

    [[nodiscard]] auto from_path(std::filesystem::path const &path) -> source;

    [[nodiscard]] auto from_bytes(std::string bytes, std::optional<std::string> name = std::nullopt) -> source;

    /// @brief Stream source reading the whole stream when the transfer starts
    /// @note The stream is shared, so it stays alive until the copy call is done with it
    [[nodiscard]] auto from_stream(std::shared_ptr<std::istream> stream,
                                   std::optional<std::string> name = std::nullopt) -> source;

    // =============================================================================
    // scoped temporary directory
    // =============================================================================

    class scoped_temp_dir
    {
    public:
        ~scoped_temp_dir() noexcept;

        scoped_temp_dir(scoped_temp_dir const &) = delete;
        auto operator=(scoped_temp_dir const &) -> scoped_temp_dir & = delete;
        scoped_temp_dir(scoped_temp_dir &&other) noexcept;
        auto operator=(scoped_temp_dir &&other) noexcept -> scoped_temp_dir &;

        /// @brief mkdtemp(3) under the system temp directory
        [[nodiscard]] static auto create() -> result<scoped_temp_dir>;

        [[nodiscard]] auto path() const noexcept -> std::filesystem::path const & { return path_; }

        // removes the tree once; later calls and the destructor are no-ops
        void remove() noexcept;

    private:
        explicit scoped_temp_dir(std::filesystem::path path) noexcept;

        std::filesystem::path path_;
    };

    // =============================================================================
    // resolution
    // =============================================================================

    struct resolved_files
    {
        std::vector<std::string> paths;
        std::optional<scoped_temp_dir> temp_dir; // engaged only if a stream source was present
    };

    /// @brief Turn sources into local file names, materializing stream sources
    /// @note Failures are transfer errors; a temp dir created on the way is removed before returning
    [[nodiscard]] auto resolve_sources(std::span<source const> sources) -> result<resolved_files>;

} // namespace sshwrap
