#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include "core/counter/counter.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace antig::core {

enum class CopyOutcome {
    Copied,    // файла не было, скопирован
    Skipped,   // файл уже есть и совпадает по размеру
    Replaced,  // файл был другого размера, удалён и скопирован заново
};

struct CopyStatsSnapshot {
    std::uint64_t files_copied = 0;
    std::uint64_t files_skipped = 0;
    std::uint64_t files_replaced = 0;
    std::uint64_t bytes_copied = 0;
    std::uint64_t directories_created = 0;
};

struct CopyOptions {
    bool noise = false;     // печатать "cp: src => dst" на каждый файл
    bool progress = true;   // обновлять прогресс-бар
    bool verify = false;    // сверять xxHash64 после записи
};

/// Последний элемент пути источника: "a/b/" даёт "b", "." даёт имя текущего каталога.
[[nodiscard]] auto source_basename(const std::filesystem::path& source)
    -> infra::Result<std::filesystem::path>;

class CopyEngine {
public:
    /// counter может быть nullptr, если прогресс выключен.
    CopyEngine(infra::ProgressMonitor& monitor,
               std::shared_ptr<SharedCounter> counter,
               CopyOptions options);

    /// Копирует каталог source внутрь каталога destination:
    /// /a/b в /dst даёт /dst/b/... Каталоги создаются заранее, включая пустые.
    /// destination должен существовать; сам он при обходе пропускается.
    [[nodiscard]] auto copy_directory(const std::filesystem::path& source,
                                      const std::filesystem::path& destination)
        -> infra::VoidResult;

    /// Копирует один файл в target. Если target есть и того же размера,
    /// ничего не пишет; если другого размера, удаляет и копирует заново.
    [[nodiscard]] auto copy_file(const std::filesystem::path& source,
                                 const std::filesystem::path& target)
        -> infra::Result<CopyOutcome>;

    /// Копирует один файл в target без сравнения размеров:
    /// существующий target удаляется и пишется заново.
    [[nodiscard]] auto replace_file(const std::filesystem::path& source,
                                    const std::filesystem::path& target)
        -> infra::Result<CopyOutcome>;

    [[nodiscard]] auto stats() const -> CopyStatsSnapshot { return stats_; }

private:
    auto create_directory_(const std::filesystem::path& dir) -> infra::VoidResult;
    auto rewrite_(const std::filesystem::path& source,
                  const std::filesystem::path& target) -> infra::Result<CopyOutcome>;
    auto write_new_(const std::filesystem::path& source,
                    const std::filesystem::path& target) -> infra::VoidResult;

    infra::ProgressMonitor& monitor_;
    std::shared_ptr<SharedCounter> counter_;
    CopyOptions options_;
    CopyStatsSnapshot stats_{};
};

} // namespace antig::core
