#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace antig::args_parser {
    struct CLIArgs;
}

namespace antig::infra {

struct Config {
    // Behavior
    bool recursive = false;
    bool noise = false;
    bool progress = true;
    bool verify = false;
    bool quiet = false;

    // Logging
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.antig.yaml
///   2. $XDG_CONFIG_HOME/antig/config.yaml
///   3. ~/.config/antig/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

/// Читает конкретный файл. Битый YAML даёт ErrorCode::ConfigParse.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const antig::args_parser::CLIArgs& args) -> Config;

} // namespace antig::infra
