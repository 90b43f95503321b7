#pragma once

#include <filesystem>
#include <vector>
#include "core/copy_engine/copy_engine.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace antig::core {

/// "." с единственным источником означает <cwd>/<имя источника>.
[[nodiscard]] auto resolve_destination(const std::vector<std::filesystem::path>& sources,
                                       const std::filesystem::path& destination)
    -> infra::Result<std::filesystem::path>;

class Orchestrator {
public:
    Orchestrator(const infra::Config& config, infra::ProgressMonitor& monitor);

    /// Проверяет аргументы, создаёт destination и копирует каждый источник.
    /// Первая ошибка прерывает работу.
    [[nodiscard]] auto run(const std::vector<std::filesystem::path>& sources,
                           const std::filesystem::path& destination)
        -> infra::Result<CopyStatsSnapshot>;

private:
    auto validate_(const std::vector<std::filesystem::path>& sources,
                   const std::filesystem::path& destination) const -> infra::VoidResult;
    auto ensure_destination_(const std::filesystem::path& destination) const -> infra::VoidResult;
    void start_counters_(const std::vector<std::filesystem::path>& sources,
                         const std::filesystem::path& destination,
                         const std::shared_ptr<SharedCounter>& counter) const;

    const infra::Config& config_;
    infra::ProgressMonitor& monitor_;
};

} // namespace antig::core
