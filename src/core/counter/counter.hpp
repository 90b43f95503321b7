#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include "infra/error_handler/error.hpp"

namespace antig::core {

/// Сколько файлов найдено во всех исходных деревьях на данный момент.
/// Пишут потоки подсчёта, читает CopyEngine. Достаточно relaxed.
using SharedCounter = std::atomic<std::uint64_t>;

[[nodiscard]] inline auto make_shared_counter() -> std::shared_ptr<SharedCounter> {
    return std::make_shared<SharedCounter>(0);
}

/// Синхронно считает файлы в source, не заходя в destination.
[[nodiscard]] auto count_files(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               SharedCounter& counter) -> infra::VoidResult;

/// Запускает count_files в отдельном detached-потоке.
/// Ошибки подсчёта пишутся в debug-лог и никуда не передаются.
void spawn_file_counter(std::filesystem::path source,
                        std::filesystem::path destination,
                        std::shared_ptr<SharedCounter> counter);

} // namespace antig::core
