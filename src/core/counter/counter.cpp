#include "counter.hpp"
#include "core/tree_walker/tree_walker.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <system_error>
#include <thread>

namespace antig::core {

auto count_files(const std::filesystem::path& source,
                 const std::filesystem::path& destination,
                 SharedCounter& counter) -> infra::VoidResult
{
    return walk_files(source, destination, [&counter](const DirectoryEntry&) -> infra::VoidResult {
        counter.fetch_add(1, std::memory_order_relaxed);
        return {};
    });
}

void spawn_file_counter(std::filesystem::path source,
                        std::filesystem::path destination,
                        std::shared_ptr<SharedCounter> counter)
{
    // Логгер держим сами: поток может пережить main()
    auto logger = spdlog::default_logger();

    const auto root = source.string();
    try {
        std::thread([source = std::move(source),
                     destination = std::move(destination),
                     counter = std::move(counter),
                     logger]() {
            try {
                auto res = count_files(source, destination, *counter);
                if (!res) {
                    logger->debug("File counting for {} stopped: {}", source.string(), res.error().message);
                }
            } catch (const std::exception& e) {
                logger->debug("File counting for {} failed: {}", source.string(), e.what());
            }
        }).detach();
    } catch (const std::system_error& e) {
        // Копирование идёт дальше, прогресс остаётся без длины
        logger->debug("Cannot start file counting for {}: {}", root, e.what());
    }
}

} // namespace antig::core
