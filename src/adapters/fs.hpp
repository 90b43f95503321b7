#pragma once

#include <cstdint>
#include <filesystem>
#include <expected>
#include "infra/error_handler/error.hpp"

namespace antig::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // >= 1 MB
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

/// Копирует содержимое src в новый файл dst.
/// dst создаётся эксклюзивно (O_EXCL): если он уже существует, возвращается
/// ошибка с кодом ErrorCode::AlreadyExists и ничего не записывается.
/// Возвращает число записанных байт.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy
) -> infra::Result<std::uint64_t>;

/// То же, стратегия выбирается по размеру src.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t>;

[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t>;

[[nodiscard]] auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t>;

} // namespace antig::adapters::fs
