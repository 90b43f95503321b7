#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include "cli/args_parser/args_parser.hpp"
#include "core/orchestrator/orchestrator.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"
#include <git_info.hpp>

using GIT = antig::build_info::GitInfo;

constexpr auto load_from_cli = antig::infra::config_from_cli;
constexpr auto load_config_file = antig::infra::load_config_from_file;
constexpr auto args_parser = antig::args_parser::parse_args;
constexpr auto git = antig::build_info::get_git_info();

constexpr int usage_exit_code = 2;

static void out_git_verse(const GIT& info) {
    fmt::print("antig {}\n", info.version);
    fmt::print("Git branch: {}\n", info.branch);
    fmt::print("Git commit: {}\n", info.commit);
    fmt::print("Git dirty: {}\n", info.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", info.timestamp);
}

static auto apply_log_level(const std::optional<std::string>& name) -> bool {
    if (!name) return true;
    const auto level = spdlog::level::from_str(*name);
    // from_str() возвращает off для неизвестных имён
    if (level == spdlog::level::off && *name != "off") {
        spdlog::error("Unknown log level: {}", *name);
        return false;
    }
    spdlog::set_level(level);
    return true;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return usage_exit_code;
        }
        const auto& args = *args_opt;
        if (args.help) {
            return 0;
        }
        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            return antig::infra::log_and_return(std::move(config_res.error())).to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (!apply_log_level(config.log_level)) {
            return usage_exit_code;
        }

        std::vector<std::filesystem::path> source_paths(args.sources.begin(), args.sources.end());
        const std::filesystem::path destination_path(args.destination);

        auto start_time = std::chrono::steady_clock::now();
        antig::infra::Result<antig::core::CopyStatsSnapshot> result = antig::core::CopyStatsSnapshot{};
        {
            // Монитор должен дорисовать бар до итогового лога
            antig::infra::ProgressMonitor monitor(config.progress, config.quiet);
            antig::core::Orchestrator orchestrator(config, monitor);
            result = orchestrator.run(source_paths, destination_path);
        }
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            return antig::infra::log_and_return(std::move(result.error())).to_exit_code();
        }

        const auto& stats = *result;
        if (!config.quiet) {
            spdlog::info("Files copied: {}, replaced: {}, skipped: {}",
                         stats.files_copied, stats.files_replaced, stats.files_skipped);
            spdlog::info("Directories created: {}", stats.directories_created);
            spdlog::info("Bytes copied: {} ({:.2f} MB) in {:.2f} seconds",
                         stats.bytes_copied,
                         stats.bytes_copied / 1024.0 / 1024.0,
                         duration.count() / 1000.0);
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
