#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"
#include "../../core/upload_session/upload_session.hpp"

namespace cupload::infra {
    void Config::merge_with(const Config& other) {
        if (other.parallelism) parallelism = other.parallelism;
        if (other.blocks_per_request) blocks_per_request = other.blocks_per_request;
        if (other.retry_count) retry_count = other.retry_count;
        if (other.initial_backoff_ms) initial_backoff_ms = other.initial_backoff_ms;
        if (other.max_backoff_ms) max_backoff_ms = other.max_backoff_ms;
        if (other.store_root) store_root = other.store_root;
        if (other.resume_file) resume_file = other.resume_file;
        if (other.verify) verify = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.log_level) log_level = other.log_level;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".cupload.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "cupload" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "cupload" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["parallelism"]) cfg.parallelism = config["parallelism"].as<std::size_t>();
            if (config["blocks_per_request"]) cfg.blocks_per_request = config["blocks_per_request"].as<std::size_t>();
            if (config["retry_count"]) cfg.retry_count = config["retry_count"].as<int>();
            if (config["initial_backoff_ms"]) cfg.initial_backoff_ms = config["initial_backoff_ms"].as<std::uint32_t>();
            if (config["max_backoff_ms"]) cfg.max_backoff_ms = config["max_backoff_ms"].as<std::uint32_t>();

            if (config["store_root"]) cfg.store_root = config["store_root"].as<std::string>();
            if (config["resume_file"]) cfg.resume_file = config["resume_file"].as<std::string>();

            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config_from(path);
        }

        // Файл не найден: пустой конфиг, не ошибка
        return Config{};
    }

  
    [[nodiscard]]
    auto config_from_cli(const __CLI& args) -> Config {
        Config cfg{};
        cfg.parallelism = args.parallelism;
        cfg.blocks_per_request = args.blocks_per_request;
        cfg.retry_count = args.retry_count;
        cfg.store_root = args.store_root;
        cfg.resume_file = args.resume_file;
        cfg.verify = args.verify;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        cfg.log_level = args.log_level;
        return cfg;
    }

    auto to_upload_options(const Config& config) -> core::UploadOptions {
        core::UploadOptions options;
        if (config.parallelism) options.parallelism = *config.parallelism;
        if (config.blocks_per_request) options.blocks_per_request = *config.blocks_per_request;
        if (config.retry_count) options.retry_count = *config.retry_count;
        if (config.initial_backoff_ms) options.initial_backoff = std::chrono::milliseconds(*config.initial_backoff_ms);
        if (config.max_backoff_ms) options.max_backoff = std::chrono::milliseconds(*config.max_backoff_ms);
        return options;
    }

} // namespace cupload::infra
