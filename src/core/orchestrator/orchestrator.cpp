#include "orchestrator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <system_error>
#include "core/counter/counter.hpp"

namespace antig::core {

auto resolve_destination(const std::vector<std::filesystem::path>& sources,
                         const std::filesystem::path& destination)
    -> infra::Result<std::filesystem::path>
{
    if (destination != "." || sources.size() != 1) {
        return destination;
    }

    std::error_code ec;
    auto cwd = std::filesystem::canonical(".", ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(ec, "cannot get the canonicalize directory path."));
    }

    auto name = source_basename(sources.front());
    if (!name) {
        return std::unexpected(std::move(name.error()));
    }
    return cwd / *name;
}

Orchestrator::Orchestrator(const infra::Config& config, infra::ProgressMonitor& monitor)
    : config_(config), monitor_(monitor) {}

auto Orchestrator::run(const std::vector<std::filesystem::path>& sources,
                       const std::filesystem::path& destination)
    -> infra::Result<CopyStatsSnapshot>
{
    auto resolved = resolve_destination(sources, destination);
    if (!resolved) {
        return std::unexpected(std::move(resolved.error()));
    }
    const auto& dest = *resolved;
    spdlog::debug("Destination resolved to {}", dest.string());

    // Все проверки до первой записи на диск
    if (auto res = validate_(sources, dest); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = ensure_destination_(dest); !res) {
        return std::unexpected(std::move(res.error()));
    }

    auto counter = make_shared_counter();
    if (config_.progress) {
        start_counters_(sources, dest, counter);
    }

    CopyEngine engine{monitor_, counter, CopyOptions{
        .noise = config_.noise,
        .progress = config_.progress,
        .verify = config_.verify,
    }};

    std::error_code ec;
    const auto canonical_dest = std::filesystem::canonical(dest, ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot get the metadata for `{}`", dest.string())));
    }
    const bool dest_is_dir = std::filesystem::is_directory(canonical_dest, ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot get the metadata for `{}`", dest.string())));
    }

    for (const auto& source : sources) {
        const auto canonical_src = std::filesystem::canonical(source, ec);
        if (ec) {
            return std::unexpected(infra::error_from_code(
                ec, fmt::format("Cannot get the metadata for `{}`", source.string())));
        }
        if (canonical_src == canonical_dest) {
            spdlog::debug("Skipping {}: it is the destination itself", source.string());
            continue;
        }

        const bool is_dir = std::filesystem::is_directory(canonical_src, ec);
        if (ec) {
            return std::unexpected(infra::error_from_code(
                ec, fmt::format("Cannot get the metadata for `{}`", source.string())));
        }
        if (is_dir) {
            if (auto res = engine.copy_directory(source, dest); !res) {
                return std::unexpected(std::move(res.error()));
            }
            continue;
        }

        // Одиночный файл перезаписывается всегда, без сравнения размеров
        const auto target = dest_is_dir ? dest / source.filename() : dest;
        if (config_.noise) {
            monitor_.println(fmt::format("cp: {} => {}", source.string(), target.string()));
        }
        if (auto res = engine.replace_file(source, target); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    return engine.stats();
}

auto Orchestrator::validate_(const std::vector<std::filesystem::path>& sources,
                             const std::filesystem::path& destination) const -> infra::VoidResult
{
    auto metadata_error = [](const std::error_code& ec, const std::filesystem::path& path) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot get the metadata for `{}`", path.string())));
    };

    std::error_code ec;
    const bool dest_exists = std::filesystem::exists(destination, ec);
    if (ec) {
        return metadata_error(ec, destination);
    }
    bool dest_is_dir = false;
    std::filesystem::path canonical_dest;
    if (dest_exists) {
        dest_is_dir = std::filesystem::is_directory(destination, ec);
        if (ec) {
            return metadata_error(ec, destination);
        }
        canonical_dest = std::filesystem::canonical(destination, ec);
        if (ec) {
            return metadata_error(ec, destination);
        }
    }

    for (const auto& source : sources) {
        if (!std::filesystem::exists(source, ec)) {
            if (ec) {
                return metadata_error(ec, source);
            }
            return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                fmt::format("`{}` does not exist.", source.string())));
        }

        // Копия каталога в самого себя пропускается до остальных проверок
        if (dest_exists) {
            const auto canonical_src = std::filesystem::canonical(source, ec);
            if (ec) {
                return metadata_error(ec, source);
            }
            if (canonical_src == canonical_dest) {
                continue;
            }
        }

        const bool is_dir = std::filesystem::is_directory(source, ec);
        if (ec) {
            return metadata_error(ec, source);
        }
        if (!is_dir) {
            continue;
        }
        if (!config_.recursive) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                "cannot copy a directory without recursive process."));
        }
        if (dest_exists && !dest_is_dir) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotADirectory,
                fmt::format("`{}` is not a directory.", destination.string())));
        }
    }
    return {};
}

auto Orchestrator::ensure_destination_(const std::filesystem::path& destination) const
    -> infra::VoidResult
{
    std::error_code ec;
    if (std::filesystem::exists(destination, ec)) {
        return {};
    }
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("cannot create a directory `{}`.", destination.string())));
    }
    spdlog::debug("Created destination directory {}", destination.string());
    return {};
}

void Orchestrator::start_counters_(const std::vector<std::filesystem::path>& sources,
                                   const std::filesystem::path& destination,
                                   const std::shared_ptr<SharedCounter>& counter) const
{
    for (const auto& source : sources) {
        std::error_code ec;
        if (std::filesystem::equivalent(source, destination, ec)) {
            continue;
        }
        if (std::filesystem::is_directory(source, ec)) {
            spdlog::debug("Counting files under {}", source.string());
            spawn_file_counter(source, destination, counter);
        }
    }
}

} // namespace antig::core
