#include "tree_walker.hpp"
#include <fmt/core.h>
#include <system_error>

namespace antig::core {

namespace {

auto visit_dir(const std::filesystem::path& dir,
               const std::filesystem::path& canonical_exclude,
               const FileVisitor& on_file,
               const std::optional<DirVisitor>& on_directory)
    -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::directory_iterator it{dir, ec};
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot read the directory `{}`", dir.string())));
    }

    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        const auto& path = it->path();

        auto canonical = std::filesystem::canonical(path, ec);
        if (ec) {
            return std::unexpected(infra::error_from_code(
                ec, fmt::format("Cannot get the metadata for `{}`", path.string())));
        }
        if (canonical == canonical_exclude) {
            continue;
        }

        const bool is_dir = it->is_directory(ec);
        if (ec) {
            return std::unexpected(infra::error_from_code(
                ec, fmt::format("Cannot get the metadata for `{}`", path.string())));
        }

        if (is_dir) {
            if (on_directory) {
                auto res = (*on_directory)(DirectoryEntry{path, EntryKind::Directory, 0});
                if (!res) return res;
            }
            auto res = visit_dir(path, canonical_exclude, on_file, on_directory);
            if (!res) return res;
        } else {
            std::uintmax_t size = 0;
            if (it->is_regular_file(ec)) {
                size = it->file_size(ec);
            }
            if (ec) {
                return std::unexpected(infra::error_from_code(
                    ec, fmt::format("Cannot get the metadata for `{}`", path.string())));
            }
            auto res = on_file(DirectoryEntry{path, EntryKind::File, size});
            if (!res) return res;
        }
    }

    // increment() сообщает об ошибке чтения через ec и ставит итератор в end
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot read the directory `{}`", dir.string())));
    }
    return {};
}

} // namespace

auto walk(const std::filesystem::path& root,
          const std::filesystem::path& exclude,
          const FileVisitor& on_file,
          const std::optional<DirVisitor>& on_directory)
    -> infra::VoidResult
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return {};
    }

    auto canonical_exclude = std::filesystem::canonical(exclude, ec);
    if (ec) {
        return std::unexpected(infra::error_from_code(
            ec, fmt::format("Cannot get the metadata for `{}`", exclude.string())));
    }

    return visit_dir(root, canonical_exclude, on_file, on_directory);
}

auto walk_files(const std::filesystem::path& root,
                const std::filesystem::path& exclude,
                const FileVisitor& on_file)
    -> infra::VoidResult
{
    return walk(root, exclude, on_file);
}

auto walk_tree(const std::filesystem::path& root,
               const std::filesystem::path& exclude,
               const FileVisitor& on_file,
               const DirVisitor& on_directory)
    -> infra::VoidResult
{
    return walk(root, exclude, on_file, on_directory);
}

} // namespace antig::core
