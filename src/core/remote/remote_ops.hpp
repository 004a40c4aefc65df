#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include "../../adapters/source.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/retry.hpp"
#include "remote_store.hpp"

namespace cupload::remote {

// Вызовы RemoteStore с повторами: 3 попытки, rate limit соблюдается

[[nodiscard]] auto get_metadata_with_retry(RemoteStore& store, const std::string& path,
                                           const infra::RetryContext& ctx = {})
    -> infra::Result<Metadata>;

/// Постраничный обход list_folder / list_folder_continue.
/// next() отдаёт записи по одной; nullopt означает конец листинга.
/// После ошибки обход прекращается.
class DirectoryIterator {
public:
    [[nodiscard]] auto next() -> std::optional<infra::Result<Metadata>>;

private:
    friend auto list_directory(std::shared_ptr<RemoteStore>, const std::string&, bool,
                               infra::RetryContext) -> infra::Result<DirectoryIterator>;

    DirectoryIterator(std::shared_ptr<RemoteStore> store, infra::RetryContext ctx, ListFolderPage first);

    std::shared_ptr<RemoteStore> store_;
    infra::RetryContext ctx_;
    std::deque<Metadata> buffer_;
    std::string cursor_;
    bool has_more_ = false;
};

// path должен быть абсолютным; "/" запрашивается как ""
[[nodiscard]] auto list_directory(std::shared_ptr<RemoteStore> store, const std::string& path,
                                  bool recursive, infra::RetryContext ctx = {})
    -> infra::Result<DirectoryIterator>;

/// Скачивание как ByteSource. Помнит позицию; если чтение тела обрывается,
/// переоткрывает запрос с range_start + bytes_read() по политике повторов.
class DownloadSession final : public adapters::ByteSource {
    struct Private { explicit Private() = default; };

public:
    // Создаётся только через open()
    DownloadSession(Private, std::shared_ptr<RemoteStore> store, infra::RetryPolicy policy,
                    std::string path, std::optional<std::uint64_t> range_start,
                    std::optional<std::uint64_t> range_end, infra::RetryContext ctx);

    [[nodiscard]] static auto open(std::shared_ptr<RemoteStore> store,
                                   infra::RetryPolicy policy,
                                   std::string path,
                                   std::optional<std::uint64_t> range_start = std::nullopt,
                                   std::optional<std::uint64_t> range_end = std::nullopt,
                                   infra::RetryContext ctx = {})
        -> infra::Result<std::unique_ptr<DownloadSession>>;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> override;

    [[nodiscard]] auto metadata() const -> const Metadata& { return metadata_; }
    [[nodiscard]] auto content_length() const -> std::uint64_t { return content_length_; }
    [[nodiscard]] auto bytes_read() const -> std::uint64_t { return cursor_; }

private:
    [[nodiscard]] auto request(std::optional<std::uint64_t> start) -> infra::Result<DownloadResponse>;

    std::shared_ptr<RemoteStore> store_;
    infra::RetryPolicy policy_;
    infra::RetryContext ctx_;
    std::string path_;
    std::optional<std::uint64_t> range_start_;
    std::optional<std::uint64_t> range_end_;

    Metadata metadata_;
    std::uint64_t content_length_ = 0;
    std::uint64_t cursor_ = 0;
    std::unique_ptr<adapters::ByteSource> body_;
};

} // namespace cupload::remote
