#include <iostream>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/hash/fingerprint.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/local_store.hpp"
#include "core/content_hash/content_hash.hpp"
#include "core/remote/remote_ops.hpp"
#include "core/upload_session/upload_session.hpp"
#include "extensions/resumer.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = cupload::build_info::GitInfo;
using ARGS = cupload::args_parser::CLIArgs;

namespace infra = cupload::infra;
namespace core = cupload::core;
namespace remote = cupload::remote;
namespace ext = cupload::extensions;

constexpr auto load_from_cli = cupload::infra::config_from_cli;
constexpr auto load_config_file = cupload::infra::load_config_from_file;
constexpr auto args_parser = cupload::args_parser::parse_args;
constexpr auto git =  cupload::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    spdlog::debug("cupload {} ({} {}{}), built {}", cupload::build_info::version,
                  git.branch, git.commit_short, git.dirty ? "-dirty" : "", git.timestamp);
}

// Назначение: существующая папка -> дописываем имя файла, существующий файл -> отказ,
// не найдено -> как есть
[[nodiscard]]
static auto
resolve_destination(remote::RemoteStore& store, const std::string& dest, const std::string& file_name)
-> infra::Result<std::string> {
    if (dest.empty() || dest.front() != '/') {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("destination path needs to be absolute (start with a '/'): {}", dest)));
    }

    auto meta = remote::get_metadata_with_retry(store, dest);
    if (!meta) {
        if (meta.error().code == infra::ErrorCode::NotFound) {
            return dest;
        }
        return std::unexpected(std::move(meta.error()));
    }
    if (meta->kind == remote::EntryKind::Folder) {
        auto path = dest.back() == '/' ? dest + file_name : dest + "/" + file_name;
        spdlog::info("Destination is a folder, uploading to {}", path);
        return path;
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::Conflict,
        fmt::format("destination {} already exists", dest)));
}

[[nodiscard]]
static auto
verify_upload(std::shared_ptr<remote::RemoteStore> store, const std::filesystem::path& source,
              const remote::Metadata& meta)
-> infra::VoidResult {
    auto file = cupload::adapters::FileSource::open(source);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    core::ContentHash local;
    if (auto res = local.read_stream(**file); !res) {
        return std::unexpected(std::move(res.error()));
    }
    const auto local_hash = std::move(local).finish_hex();

    auto download = remote::DownloadSession::open(store, infra::RetryPolicy{}, meta.path_display);
    if (!download) {
        return std::unexpected(std::move(download.error()));
    }
    core::ContentHash downloaded;
    if (auto res = downloaded.read_stream(**download); !res) {
        return std::unexpected(std::move(res.error()));
    }
    const auto remote_hash = std::move(downloaded).finish_hex();

    if (remote_hash != local_hash || (!meta.content_hash.empty() && meta.content_hash != local_hash)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
            fmt::format("content hash mismatch: local {}, downloaded {}, reported {}",
                        local_hash, remote_hash, meta.content_hash)));
    }
    spdlog::info("Verified {} ({} bytes, {})", meta.path_display, (*download)->bytes_read(), local_hash);
    return {};
}

static auto
save_resume_state(const core::UploadSession& session, const std::filesystem::path& resume_file,
                  const std::filesystem::path& source, const std::string& destination,
                  std::uint64_t total_bytes)
-> void {
    const auto token = session.get_resume();
    fmt::print(stderr, "To resume: --resume {}\n", ext::format_resume_token(token));

    auto fingerprint = infra::SourceFingerprint::of_file(source);
    if (!fingerprint) {
        spdlog::warn("Not saving resume file: {}", fingerprint.error().message);
        return;
    }
    auto saved = ext::save_resume_info(ext::ResumeInfo{
        .token = token,
        .source = std::filesystem::absolute(source),
        .destination = destination,
        .total_bytes = total_bytes,
        .fingerprint = infra::SourceFingerprint::to_hex(*fingerprint),
    }, resume_file);
    if (!saved) {
        (void)infra::log_and_return(std::move(saved.error()));
    }
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        int parse_exit = 0;
        auto args_opt = args_parser(argc, argv, parse_exit);
        if (!args_opt) {
            return parse_exit; // --help или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error().message);
            return config_res.error().to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет

        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }
        __out_git_verse(git);

        auto store = std::make_shared<cupload::adapters::LocalStore>(
            config.store_root.value_or("./cupload-store"));
        const std::filesystem::path resume_file = config.resume_file.value_or(".cupload.resume");
        const std::filesystem::path source_path(args.source);

        auto source = cupload::adapters::FileSource::open(source_path);
        if (!source) {
            spdlog::error("{}", source.error().message);
            return source.error().to_exit_code();
        }
        auto total = (*source)->size();
        auto mtime = (*source)->modified_time();
        if (!total || !mtime) {
            const auto& err = !total ? total.error() : mtime.error();
            spdlog::error("{}", err.message);
            return err.to_exit_code();
        }

        // Токен: явный --resume или сохранённый файл, если источник не менялся
        std::optional<core::UploadResume> token;
        if (args.resume) {
            auto parsed = ext::parse_resume_token(*args.resume);
            if (!parsed) {
                spdlog::error("{}", parsed.error().message);
                return parsed.error().to_exit_code();
            }
            token = std::move(*parsed);
        } else if (auto info = ext::load_resume_info(resume_file)) {
            if (ext::should_resume(*info, source_path, args.destination)) {
                spdlog::info("Resuming from {}", resume_file.string());
                token = info->token;
            } else {
                spdlog::info("Ignoring stale resume file {}", resume_file.string());
            }
        }

        // Разрешение повторяемо: файла назначения до commit ещё нет
        auto resolved = resolve_destination(*store, args.destination, source_path.filename().string());
        if (!resolved) {
            spdlog::error("{}", resolved.error().message);
            return resolved.error().to_exit_code();
        }
        const std::string destination = std::move(*resolved);

        infra::Result<core::UploadSession> session = token
            ? core::UploadSession::resume_verified(store, *token)
            : core::UploadSession::create(store);
        if (!session && token && session.error().code == infra::ErrorCode::UnsupportedFeature) {
            session = core::UploadSession::resume(store, *token);
        }
        if (!session) {
            spdlog::error("Cannot start upload session: {}", session.error().message);
            return session.error().to_exit_code();
        }

        if (auto res = (*source)->seek(session->start_offset()); !res) {
            spdlog::error("{}", res.error().message);
            return res.error().to_exit_code();
        }

        auto options = infra::to_upload_options(config);
        auto start_time = std::chrono::steady_clock::now();
        {
            auto monitor = std::make_shared<infra::ProgressMonitor>(config.progress, config.quiet);
            monitor->set_total(*total, session->start_offset());
            options.progress_handler = monitor;

            auto uploaded = session->upload(**source, options);
            options.progress_handler.reset();
            if (!uploaded) {
                monitor.reset();
                spdlog::error("Upload failed: {}", uploaded.error().message);
                save_resume_state(*session, resume_file, source_path, args.destination, *total);
                return uploaded.error().to_exit_code();
            }
        }

        auto meta = session->commit(remote::CommitInfo{
            .path = destination,
            .client_modified = *mtime,
            .autorename = false,
        });
        if (!meta) {
            save_resume_state(*session, resume_file, source_path, args.destination, *total);
            return meta.error().to_exit_code();
        }
        ext::clear_resume_info(resume_file);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        const auto sent = session->bytes_transferred();
        spdlog::info("{} bytes sent in {:.2f} seconds ({})", sent, duration.count() / 1000.0,
                     infra::format_rate(duration.count() > 0 ? sent * 1000.0 / duration.count() : 0.0));
        spdlog::info("Content hash: {}", meta->content_hash);

        if (config.verify) {
            if (auto res = verify_upload(store, source_path, *meta); !res) {
                const auto err = infra::log_and_return(std::move(res.error()));
                return err.to_exit_code();
            }
        }

        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
