#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace antig::infra {
    void Config::merge_with(const Config& other) {
        if (other.recursive) recursive = true;
        if (other.noise) noise = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.verify) verify = true;
        if (other.quiet) quiet = true;
        if (other.log_level) log_level = other.log_level;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".antig.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "antig" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "antig" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config(const std::filesystem::path& path) -> Result<Config> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["recursive"]) cfg.recursive = config["recursive"].as<bool>();
            if (config["noise"]) cfg.noise = config["noise"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::ConfigParse,
                fmt::format("Failed to parse {}: {}", path.string(), e.what())));
        }
    }

    auto load_config_from_file() -> Result<Config> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config(path);
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    auto config_from_cli(const antig::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.recursive = args.recursive;
        cfg.noise = args.noise;
        cfg.progress = !args.no_progress;
        cfg.verify = args.verify;
        cfg.quiet = args.quiet;
        cfg.log_level = args.log_level;
        return cfg;
    }

} // namespace antig::infra
