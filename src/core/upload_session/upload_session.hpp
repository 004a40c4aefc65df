#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include "../../adapters/source.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/retry.hpp"
#include "../completion_tracker/completion_tracker.hpp"
#include "../remote/remote_store.hpp"

namespace cupload::core {

/// Получает периодические обновления прогресса.
/// Вызывается прямо из рабочих потоков, поэтому реализация обязана быть
/// потокобезопасной и не блокировать надолго.
class ProgressHandler {
public:
    virtual ~ProgressHandler() = default;

    // bytes_uploaded: всего байт за этот upload(); instant_rate: скорость последнего чанка
    // (байт/с, умноженная на parallelism); overall_rate: средняя скорость с начала
    virtual void update(std::uint64_t bytes_uploaded, double instant_rate, double overall_rate) = 0;
};

struct UploadOptions {
    // Сколько чанков загружается параллельно
    std::size_t parallelism = 20;
    // Сколько блоков по BLOCK_SIZE в одном запросе append
    std::size_t blocks_per_request = 2;
    // Сколько подряд неудачных попыток до отказа от чанка
    int retry_count = 3;
    // 0.5 + 1 + 2 = 3.5 с максимум (+/- jitter)
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{2000};
    std::shared_ptr<ProgressHandler> progress_handler;
};

// Всё, что нужно для продолжения прерванной загрузки. Сохранять его — забота вызывающего.
struct UploadResume {
    std::string session_id;
    std::uint64_t start_offset = 0;
};

enum class SessionState {
    Started,
    Resumed,
    Transferring,
    Closed,
    Committed,
    Failed,
};

[[nodiscard]] auto to_string(SessionState state) -> std::string_view;

class UploadSession {
public:
    // Один вызов start_session без повторов: при ошибке продолжать нечего
    [[nodiscard]] static auto create(std::shared_ptr<remote::RemoteStore> remote,
                                     infra::RetryContext retry = {})
        -> infra::Result<UploadSession>;

    /// Продолжение прерванной сессии. Удалённая сторона не опрашивается:
    /// вызывающий гарантирует, что первые token.start_offset байт уже приняты,
    /// и что источник спозиционирован на это смещение.
    [[nodiscard]] static auto resume(std::shared_ptr<remote::RemoteStore> remote,
                                     UploadResume token,
                                     infra::RetryContext retry = {})
        -> UploadSession;

    // То же, но сначала сверяет смещение с удалённой стороной
    [[nodiscard]] static auto resume_verified(std::shared_ptr<remote::RemoteStore> remote,
                                              UploadResume token,
                                              infra::RetryContext retry = {})
        -> infra::Result<UploadSession>;

    UploadSession(UploadSession&&) noexcept = default;
    UploadSession& operator=(UploadSession&&) noexcept = default;
    ~UploadSession() = default;

    /// Загружает источник. Можно вызвать один раз. Блокирует до конца загрузки.
    /// Возвращает длину непрерывно подтверждённого префикса сессии.
    /// При ошибке get_resume() даёт параметры для повторной попытки.
    [[nodiscard]] auto upload(adapters::ByteSource& source, const UploadOptions& options)
        -> infra::Result<std::uint64_t>;

    // После upload(): превращает сессию в файл. Повторный commit после ошибки безопасен.
    [[nodiscard]] auto commit(const remote::CommitInfo& info) -> infra::Result<remote::Metadata>;

    [[nodiscard]] auto get_resume() const -> UploadResume;

    [[nodiscard]] auto session_id() const -> const std::string& { return inner_->session_id; }
    [[nodiscard]] auto start_offset() const -> std::uint64_t { return inner_->start_offset; }
    [[nodiscard]] auto state() const -> SessionState { return inner_->state.load(); }
    [[nodiscard]] auto complete_up_to() const -> std::uint64_t;
    [[nodiscard]] auto bytes_transferred() const -> std::uint64_t {
        return inner_->bytes_transferred.load();
    }

private:
    struct Inner {
        std::string session_id;
        std::uint64_t start_offset = 0;
        std::atomic<std::uint64_t> bytes_transferred{0};
        std::atomic<SessionState> state{SessionState::Started};
        bool transfer_done = false;

        mutable std::mutex completion_mutex;
        CompletionTracker completion;
    };

    UploadSession(std::shared_ptr<remote::RemoteStore> remote,
                  std::unique_ptr<Inner> inner,
                  infra::RetryContext retry);

    [[nodiscard]] auto append_block(const remote::AppendRequest& request,
                                    const UploadOptions& options,
                                    std::chrono::steady_clock::time_point start_time)
        -> infra::VoidResult;

    void mark_block_uploaded(std::uint64_t offset, std::uint64_t length);

    std::shared_ptr<remote::RemoteStore> remote_;
    std::unique_ptr<Inner> inner_;
    infra::RetryContext retry_;
};

} // namespace cupload::core
