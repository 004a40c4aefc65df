#include "remote_ops.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace cupload::remote {

auto get_metadata_with_retry(RemoteStore& store, const std::string& path,
                             const infra::RetryContext& ctx) -> infra::Result<Metadata>
{
    infra::RetryContext named = ctx;
    named.operation = "get_metadata";
    return infra::with_retry([&]() { return store.get_metadata(path); }, infra::RetryPolicy{}, named);
}

// ===== Листинг =====

DirectoryIterator::DirectoryIterator(std::shared_ptr<RemoteStore> store,
                                     infra::RetryContext ctx,
                                     ListFolderPage first)
    : store_(std::move(store))
    , ctx_(std::move(ctx))
    , buffer_(std::make_move_iterator(first.entries.begin()), std::make_move_iterator(first.entries.end()))
    , cursor_(std::move(first.cursor))
    , has_more_(first.has_more)
{}

auto DirectoryIterator::next() -> std::optional<infra::Result<Metadata>> {
    while (buffer_.empty()) {
        if (!has_more_) {
            return std::nullopt;
        }
        auto page = infra::with_retry([&]() {
            return store_->list_folder_continue(cursor_);
        }, infra::RetryPolicy{}, ctx_);
        if (!page) {
            has_more_ = false;
            return infra::Result<Metadata>(std::unexpected(std::move(page.error())));
        }
        for (auto& entry : page->entries) {
            buffer_.push_back(std::move(entry));
        }
        cursor_ = std::move(page->cursor);
        has_more_ = page->has_more;
    }

    auto entry = std::move(buffer_.front());
    buffer_.pop_front();
    return infra::Result<Metadata>(std::move(entry));
}

auto list_directory(std::shared_ptr<RemoteStore> store, const std::string& path,
                    bool recursive, infra::RetryContext ctx) -> infra::Result<DirectoryIterator>
{
    if (path.empty() || path.front() != '/') {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("path needs to be absolute (start with a '/'): {}", path)));
    }
    const std::string requested = path == "/" ? std::string() : path;

    ctx.operation = "list_folder";
    auto first = infra::with_retry([&]() {
        return store->list_folder(requested, recursive);
    }, infra::RetryPolicy{}, ctx);
    if (!first) {
        return std::unexpected(std::move(first.error()));
    }
    return DirectoryIterator(std::move(store), std::move(ctx), std::move(*first));
}

// ===== Скачивание =====

DownloadSession::DownloadSession(Private, std::shared_ptr<RemoteStore> store, infra::RetryPolicy policy,
                                 std::string path, std::optional<std::uint64_t> range_start,
                                 std::optional<std::uint64_t> range_end, infra::RetryContext ctx)
    : store_(std::move(store))
    , policy_(policy)
    , ctx_(std::move(ctx))
    , path_(std::move(path))
    , range_start_(range_start)
    , range_end_(range_end)
{
    ctx_.operation = "download";
}

auto DownloadSession::open(std::shared_ptr<RemoteStore> store,
                           infra::RetryPolicy policy,
                           std::string path,
                           std::optional<std::uint64_t> range_start,
                           std::optional<std::uint64_t> range_end,
                           infra::RetryContext ctx) -> infra::Result<std::unique_ptr<DownloadSession>>
{
    auto session = std::make_unique<DownloadSession>(
        Private{}, std::move(store), policy, std::move(path), range_start, range_end, std::move(ctx));

    auto response = session->request(range_start);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    session->metadata_ = std::move(response->metadata);
    session->content_length_ = response->content_length;
    session->body_ = std::move(response->body);
    return session;
}

auto DownloadSession::request(std::optional<std::uint64_t> start) -> infra::Result<DownloadResponse> {
    return infra::with_retry([&]() {
        return store_->download(path_, start, range_end_);
    }, policy_, ctx_);
}

auto DownloadSession::read(std::span<std::byte> buffer) -> infra::Result<std::size_t> {
    auto backoff = std::min(policy_.initial_backoff, policy_.max_backoff);
    int failures = 0;

    for (;;) {
        auto n = body_->read(buffer);
        if (n) {
            cursor_ += *n;
            return n;
        }
        if (n.error().code == infra::ErrorCode::Interrupted) {
            return n;
        }

        if (++failures >= policy_.max_attempts) {
            spdlog::error("Error reading {} at {}: {}, failing.", path_, cursor_, n.error().message);
            return n;
        }
        spdlog::warn("Error reading {} at {}: {}, re-requesting.", path_, cursor_, n.error().message);
        ctx_.sleep(ctx_.jitter(backoff));
        backoff = infra::next_backoff(backoff, policy_.max_backoff);

        auto response = request(range_start_.value_or(0) + cursor_);
        if (!response) {
            return std::unexpected(std::move(response.error()));
        }
        body_ = std::move(response->body);
    }
}

} // namespace cupload::remote
