#include "upload_session.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../chunk_dispatcher/chunk_dispatcher.hpp"
#include "../content_hash/content_hash.hpp"

namespace cupload::core {

namespace {

auto validate(const UploadOptions& options) -> infra::VoidResult {
    if (options.parallelism == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "parallelism must be at least 1"));
    }
    if (options.blocks_per_request == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "blocks_per_request must be at least 1"));
    }
    if (options.retry_count <= 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "retry_count must be at least 1"));
    }
    return {};
}

auto seconds_since(std::chrono::steady_clock::time_point from,
                   std::chrono::steady_clock::time_point to) -> double {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

auto to_string(SessionState state) -> std::string_view {
    switch (state) {
        case SessionState::Started:      return "started";
        case SessionState::Resumed:      return "resumed";
        case SessionState::Transferring: return "transferring";
        case SessionState::Closed:       return "closed";
        case SessionState::Committed:    return "committed";
        case SessionState::Failed:       return "failed";
    }
    return "unknown";
}

UploadSession::UploadSession(std::shared_ptr<remote::RemoteStore> remote,
                             std::unique_ptr<Inner> inner,
                             infra::RetryContext retry)
    : remote_(std::move(remote))
    , inner_(std::move(inner))
    , retry_(std::move(retry))
{}

auto UploadSession::create(std::shared_ptr<remote::RemoteStore> remote,
                           infra::RetryContext retry) -> infra::Result<UploadSession>
{
    auto session_id = remote->start_session();
    if (!session_id) {
        return std::unexpected(std::move(session_id.error()));
    }
    spdlog::debug("Started upload session {}", *session_id);

    auto inner = std::make_unique<Inner>();
    inner->session_id = std::move(*session_id);
    inner->state = SessionState::Started;
    return UploadSession(std::move(remote), std::move(inner), std::move(retry));
}

auto UploadSession::resume(std::shared_ptr<remote::RemoteStore> remote,
                           UploadResume token,
                           infra::RetryContext retry) -> UploadSession
{
    spdlog::debug("Resuming upload session {} at offset {}", token.session_id, token.start_offset);

    auto inner = std::make_unique<Inner>();
    inner->session_id = std::move(token.session_id);
    inner->start_offset = token.start_offset;
    inner->completion = CompletionTracker::resume_from(token.start_offset);
    inner->state = SessionState::Resumed;
    return UploadSession(std::move(remote), std::move(inner), std::move(retry));
}

auto UploadSession::resume_verified(std::shared_ptr<remote::RemoteStore> remote,
                                    UploadResume token,
                                    infra::RetryContext retry) -> infra::Result<UploadSession>
{
    infra::RetryContext ctx = retry;
    ctx.operation = "upload_session_offset";
    auto remote_offset = infra::with_retry([&]() {
        return remote->session_offset(token.session_id);
    }, infra::RetryPolicy{}, ctx);
    if (!remote_offset) {
        return std::unexpected(std::move(remote_offset.error()));
    }

    if (*remote_offset != token.start_offset) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IncorrectOffset,
            fmt::format("session {} holds {} contiguous bytes, resume token says {}",
                        token.session_id, *remote_offset, token.start_offset)));
    }
    return resume(std::move(remote), std::move(token), std::move(retry));
}

auto UploadSession::upload(adapters::ByteSource& source, const UploadOptions& options)
    -> infra::Result<std::uint64_t>
{
    if (auto valid = validate(options); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    const auto state = inner_->state.load();
    if (state != SessionState::Started && state != SessionState::Resumed) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("upload() may only be called once per session (state: {})", to_string(state))));
    }
    inner_->state = SessionState::Transferring;

    const std::size_t chunk_size = BLOCK_SIZE * options.blocks_per_request;
    const auto start_time = std::chrono::steady_clock::now();
    std::atomic<bool> closed{false};

    ChunkDispatcher dispatcher{chunk_size, options.parallelism};
    auto result = dispatcher.run(source,
        [&](std::uint64_t chunk_offset, std::span<const std::byte> data) -> infra::VoidResult {
            remote::AppendRequest request{
                .session_id = inner_->session_id,
                .offset = inner_->start_offset + chunk_offset,
                .data = data,
                .content_hash = ContentHash::of(data).finish_hex(),
            };
            if (data.size() != chunk_size) {
                // Только последний чанк может быть короче
                request.close = true;
                closed.store(true);
            }

            auto res = append_block(request, options, start_time);
            if (res) {
                mark_block_uploaded(request.offset, data.size());
            }
            return res;
        });

    if (!result) {
        inner_->state = SessionState::Failed;
        auto& err = result.error();
        const auto offset = inner_->start_offset + err.chunk_offset;
        if (err.kind == DispatchError::Kind::Read) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
                fmt::format("reading source at offset {}: {}", offset, err.cause.message)));
        }
        infra::Error cause = std::move(err.cause);
        cause.message = fmt::format("chunk at offset {}: {}", offset, cause.message);
        return std::unexpected(std::move(cause));
    }

    const auto final_len = complete_up_to();
    if (final_len != inner_->start_offset + *result) {
        inner_->state = SessionState::Failed;
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("read {} bytes but only {} are acknowledged contiguously in session {}",
                        inner_->start_offset + *result, final_len, inner_->session_id)));
    }

    // Длина источника кратна размеру чанка: закрываем сессию пустым append
    if (!closed.load()) {
        const remote::AppendRequest close_request{
            .session_id = inner_->session_id,
            .offset = final_len,
            .content_hash = ContentHash{}.finish_hex(),
            .close = true,
        };
        if (auto res = append_block(close_request, options, start_time); !res) {
            // Не фатально: сессия могла быть закрыта прошлой попыткой, пробуем commit
            spdlog::warn("failed to close session: {}", res.error().message);
        }
    }

    inner_->transfer_done = true;
    inner_->state = SessionState::Closed;
    return final_len;
}

auto UploadSession::commit(const remote::CommitInfo& info) -> infra::Result<remote::Metadata> {
    if (!inner_->transfer_done) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("commit() requires a finished upload (state: {})", to_string(state()))));
    }
    if (state() == SessionState::Committed) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("session {} is already committed", inner_->session_id)));
    }

    const remote::FinishRequest request{
        .session_id = inner_->session_id,
        .total_length = complete_up_to(),
        .commit = info,
    };

    // Быстрые повторы с фиксированной задержкой
    infra::RetryContext ctx = retry_;
    ctx.operation = "upload_session_finish";
    ctx.jitter = infra::no_jitter;
    const infra::RetryPolicy policy{
        .max_attempts = 3,
        .initial_backoff = std::chrono::seconds(1),
        .max_backoff = std::chrono::seconds(1),
    };

    auto result = infra::with_retry([&]() {
        return remote_->finish(request);
    }, policy, ctx);

    if (!result) {
        inner_->state = SessionState::Failed;
        spdlog::error("Error committing upload: {}", result.error().message);
        return result;
    }

    spdlog::info("Upload succeeded: {}",
                 result->path_display.empty() ? std::string("?") : result->path_display);
    inner_->state = SessionState::Committed;
    return result;
}

auto UploadSession::get_resume() const -> UploadResume {
    return UploadResume{
        .session_id = inner_->session_id,
        .start_offset = complete_up_to(),
    };
}

auto UploadSession::complete_up_to() const -> std::uint64_t {
    std::lock_guard lock(inner_->completion_mutex);
    return inner_->completion.complete_up_to();
}

auto UploadSession::append_block(const remote::AppendRequest& request,
                                 const UploadOptions& options,
                                 std::chrono::steady_clock::time_point start_time)
    -> infra::VoidResult
{
    const auto block_start = std::chrono::steady_clock::now();

    infra::RetryContext ctx = retry_;
    ctx.operation = "upload_session_append";
    const infra::RetryPolicy policy{
        .max_attempts = options.retry_count,
        .initial_backoff = options.initial_backoff,
        .max_backoff = options.max_backoff,
    };

    auto result = infra::with_retry([&]() {
        return remote_->append(request);
    }, policy, ctx);
    if (!result) {
        return result;
    }

    const auto now = std::chrono::steady_clock::now();
    const auto block_bytes = static_cast<std::uint64_t>(request.data.size());
    const auto bytes_sofar = inner_->bytes_transferred.fetch_add(block_bytes) + block_bytes;

    if (options.progress_handler) {
        // Предполагаем, что parallelism чанков идут одновременно с примерно равной скоростью
        const double block_secs = seconds_since(block_start, now);
        const double overall_secs = seconds_since(start_time, now);
        const double block_rate = block_secs > 0
            ? static_cast<double>(block_bytes) / block_secs * static_cast<double>(options.parallelism)
            : 0.0;
        const double overall_rate = overall_secs > 0
            ? static_cast<double>(bytes_sofar) / overall_secs
            : 0.0;
        options.progress_handler->update(bytes_sofar, block_rate, overall_rate);
    }

    return {};
}

void UploadSession::mark_block_uploaded(std::uint64_t offset, std::uint64_t length) {
    std::lock_guard lock(inner_->completion_mutex);
    inner_->completion.complete_block(offset, length);
}

} // namespace cupload::core
