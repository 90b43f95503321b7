#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include "infra/error_handler/error.hpp"

namespace antig::core {

enum class EntryKind {
    File,
    Directory,
};

/// Элемент обхода. Живёт только на время вызова посетителя.
struct DirectoryEntry {
    std::filesystem::path path;
    EntryKind kind = EntryKind::File;
    std::uintmax_t size = 0; // только для обычных файлов, иначе 0
};

using FileVisitor = std::function<infra::VoidResult(const DirectoryEntry&)>;
using DirVisitor = std::function<infra::VoidResult(const DirectoryEntry&)>;

/// Рекурсивный обход root в глубину, в порядке выдачи каталога.
///
/// Элемент, канонический путь которого совпадает с каноническим путём exclude,
/// пропускается целиком. Для каталога сначала вызывается on_directory (если
/// задан), затем обход спускается внутрь. Всё, что не каталог, уходит в on_file.
///
/// Если root не каталог, обход ничего не делает. Первая ошибка (чтение каталога,
/// canonical(), stat, ошибка посетителя) прерывает обход.
[[nodiscard]] auto walk(const std::filesystem::path& root,
                        const std::filesystem::path& exclude,
                        const FileVisitor& on_file,
                        const std::optional<DirVisitor>& on_directory = std::nullopt)
    -> infra::VoidResult;

/// Обход только с файлами (режим подсчёта).
[[nodiscard]] auto walk_files(const std::filesystem::path& root,
                              const std::filesystem::path& exclude,
                              const FileVisitor& on_file)
    -> infra::VoidResult;

/// Обход с созданием каталогов (режим копирования).
[[nodiscard]] auto walk_tree(const std::filesystem::path& root,
                             const std::filesystem::path& exclude,
                             const FileVisitor& on_file,
                             const DirVisitor& on_directory)
    -> infra::VoidResult;

} // namespace antig::core
