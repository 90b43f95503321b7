#include "copy_engine.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <system_error>
#include "adapters/fs.hpp"
#include "core/tree_walker/tree_walker.hpp"
#include "infra/hash/xxhash_verifier.hpp"

namespace antig::core {

namespace {

// "a/" и "a/." дают "a", иначе lexically_relative споткнётся о пустой элемент
auto normalize_source(const std::filesystem::path& source) -> std::filesystem::path {
    auto normal = source.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

auto copy_error(const infra::Error& cause,
                const std::filesystem::path& source,
                const std::filesystem::path& target) -> infra::Error {
    return infra::make_error(cause.code,
        fmt::format("Error occurs to copy from `{}` into `{}`.\n{}",
                    source.string(), target.string(), cause.message));
}

} // namespace

auto source_basename(const std::filesystem::path& source) -> infra::Result<std::filesystem::path> {
    const auto normal = normalize_source(source);
    auto name = normal.filename();
    // У ".", ".." и "/" своего имени нет, берём его из канонического пути
    if (name.empty() || name == "." || name == "..") {
        std::error_code ec;
        const auto canonical = std::filesystem::canonical(normal, ec);
        if (ec) {
            return std::unexpected(infra::error_from_code(
                ec, fmt::format("Cannot get the metadata for `{}`", normal.string())));
        }
        name = canonical.filename();
    }
    return name;
}

CopyEngine::CopyEngine(infra::ProgressMonitor& monitor,
                       std::shared_ptr<SharedCounter> counter,
                       CopyOptions options)
    : monitor_(monitor), counter_(std::move(counter)), options_(options) {}

auto CopyEngine::copy_directory(const std::filesystem::path& source,
                                const std::filesystem::path& destination)
    -> infra::VoidResult
{
    const auto src = normalize_source(source);

    auto name = source_basename(src);
    if (!name) {
        return std::unexpected(std::move(name.error()));
    }
    const auto mirror_root = destination / *name;

    if (auto res = create_directory_(mirror_root); !res) {
        return res;
    }

    auto mirror = [&](const std::filesystem::path& path) {
        return mirror_root / path.lexically_relative(src);
    };

    return walk_tree(
        src,
        destination,
        [&](const DirectoryEntry& entry) -> infra::VoidResult {
            const auto target = mirror(entry.path);

            if (options_.noise) {
                monitor_.println(fmt::format("cp: {} => {}", entry.path.string(), target.string()));
            }

            if (options_.progress && counter_) {
                monitor_.set_length(counter_->load(std::memory_order_relaxed));
            }

            auto res = copy_file(entry.path, target);
            if (!res) {
                return std::unexpected(std::move(res.error()));
            }

            if (options_.progress) {
                monitor_.inc(1);
            }
            return {};
        },
        [&](const DirectoryEntry& entry) -> infra::VoidResult {
            return create_directory_(mirror(entry.path));
        });
}

auto CopyEngine::copy_file(const std::filesystem::path& source,
                           const std::filesystem::path& target)
    -> infra::Result<CopyOutcome>
{
    auto res = write_new_(source, target);
    if (res) {
        ++stats_.files_copied;
        return CopyOutcome::Copied;
    }
    if (res.error().code != infra::ErrorCode::AlreadyExists) {
        return std::unexpected(std::move(res.error()));
    }

    std::error_code ec;
    const auto source_len = std::filesystem::file_size(source, ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot get the metadata for `{}`.", source.string())));
    }
    const auto target_len = std::filesystem::file_size(target, ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot get the metadata for `{}`.", target.string())));
    }

    if (source_len == target_len) {
        spdlog::debug("Skipping {}: {} already has the same size", source.string(), target.string());
        ++stats_.files_skipped;
        return CopyOutcome::Skipped;
    }

    return rewrite_(source, target);
}

auto CopyEngine::replace_file(const std::filesystem::path& source,
                              const std::filesystem::path& target)
    -> infra::Result<CopyOutcome>
{
    auto res = write_new_(source, target);
    if (res) {
        ++stats_.files_copied;
        return CopyOutcome::Copied;
    }
    if (res.error().code != infra::ErrorCode::AlreadyExists) {
        return std::unexpected(std::move(res.error()));
    }

    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Io,
            fmt::format("Error occurs to copy from `{}` into `{}`.\n`{}` is a directory.",
                        source.string(), target.string(), target.string())));
    }
    return rewrite_(source, target);
}

auto CopyEngine::rewrite_(const std::filesystem::path& source,
                          const std::filesystem::path& target)
    -> infra::Result<CopyOutcome>
{
    std::error_code ec;
    std::filesystem::remove(target, ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("cannot remove `{}`.", target.string())));
    }

    if (auto res = write_new_(source, target); !res) {
        return std::unexpected(std::move(res.error()));
    }
    ++stats_.files_replaced;
    return CopyOutcome::Replaced;
}

auto CopyEngine::create_directory_(const std::filesystem::path& dir) -> infra::VoidResult {
    std::error_code ec;
    // false без ошибки: каталог уже есть
    if (std::filesystem::create_directory(dir, ec)) {
        ++stats_.directories_created;
    }
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Error occurs to create a directory `{}`.", dir.string())));
    }
    return {};
}

auto CopyEngine::write_new_(const std::filesystem::path& source,
                            const std::filesystem::path& target) -> infra::VoidResult
{
    auto written = adapters::fs::copy_file(source, target);
    if (!written) {
        if (written.error().code == infra::ErrorCode::AlreadyExists) {
            return std::unexpected(std::move(written.error()));
        }
        return std::unexpected(copy_error(written.error(), source, target));
    }
    stats_.bytes_copied += *written;

    if (options_.verify) {
        auto match = infra::XXHashVerifier::verify_files(source, target);
        if (!match) {
            return std::unexpected(copy_error(match.error(), source, target));
        }
        if (!*match) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
                fmt::format("Verification failed for `{}` => `{}`", source.string(), target.string())));
        }
    }
    return {};
}

} // namespace antig::core
