#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace cupload::args_parser{
    struct CLIArgs;
}

namespace cupload::core {
    struct UploadOptions;
}

namespace cupload::infra {

    
struct Config {
    // Загрузка
    std::optional<std::size_t> parallelism;
    std::optional<std::size_t> blocks_per_request;
    std::optional<int> retry_count;
    std::optional<std::uint32_t> initial_backoff_ms;
    std::optional<std::uint32_t> max_backoff_ms;

    // Пути
    std::optional<std::string> store_root;
    std::optional<std::string> resume_file;

    // Поведение
    bool verify = false;
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI): заданные там поля побеждают
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.cupload.yaml
///   2. $XDG_CONFIG_HOME/cupload/config.yaml или ~/.config/cupload/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

// Разбор конкретного файла
[[nodiscard]] auto load_config_from(const std::filesystem::path& path) -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const struct cupload::args_parser::CLIArgs& args) -> Config;

// Незаданные поля берутся из значений UploadOptions по умолчанию
[[nodiscard]] auto to_upload_options(const Config& config) -> core::UploadOptions;

} // namespace cupload::infra
