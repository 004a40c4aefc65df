#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "../../adapters/source.hpp"
#include "../../infra/error_handler/error.hpp"

namespace cupload::remote {

enum class EntryKind {
    File,
    Folder,
    Deleted,
};

struct Metadata {
    EntryKind kind = EntryKind::File;
    std::string name;
    std::string path_display;
    std::string id;
    std::uint64_t size = 0;
    std::string content_hash;                // пусто для папок
    std::optional<std::string> client_modified; // ISO 8601, UTC
    std::optional<std::string> server_modified;
};

struct CommitInfo {
    std::string path;
    std::optional<std::chrono::system_clock::time_point> client_modified;
    bool autorename = false;
};

struct AppendRequest {
    std::string session_id;
    std::uint64_t offset = 0;
    std::span<const std::byte> data;
    std::string content_hash;
    bool close = false;
};

struct FinishRequest {
    std::string session_id;
    std::uint64_t total_length = 0;
    CommitInfo commit;
};

struct ListFolderPage {
    std::vector<Metadata> entries;
    std::string cursor;
    bool has_more = false;
};

struct DownloadResponse {
    Metadata metadata;
    std::uint64_t content_length = 0;
    std::unique_ptr<adapters::ByteSource> body;
};

/// Граница с удалённым хранилищем. Реализации обязаны быть потокобезопасными:
/// append() вызывается одновременно из нескольких рабочих потоков, в любом порядке смещений.
///
/// RateLimited должен нести retry_after; Transient повторяется с backoff;
/// прочие коды считаются постоянными.
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    [[nodiscard]] virtual auto start_session() -> infra::Result<std::string> = 0;
    [[nodiscard]] virtual auto append(const AppendRequest& request) -> infra::VoidResult = 0;
    [[nodiscard]] virtual auto finish(const FinishRequest& request) -> infra::Result<Metadata> = 0;

    // Непрерывно подтверждённая длина сессии (для проверки перед resume)
    [[nodiscard]] virtual auto session_offset(const std::string& session_id)
        -> infra::Result<std::uint64_t>;

    [[nodiscard]] virtual auto get_metadata(const std::string& path) -> infra::Result<Metadata>;
    [[nodiscard]] virtual auto list_folder(const std::string& path, bool recursive)
        -> infra::Result<ListFolderPage>;
    [[nodiscard]] virtual auto list_folder_continue(const std::string& cursor)
        -> infra::Result<ListFolderPage>;
    [[nodiscard]] virtual auto download(const std::string& path,
                                        std::optional<std::uint64_t> range_start,
                                        std::optional<std::uint64_t> range_end)
        -> infra::Result<DownloadResponse>;
};

// ISO 8601 "YYYY-MM-DDTHH:MM:SSZ"
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point t) -> std::string;

} // namespace cupload::remote
