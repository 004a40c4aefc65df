#include "chunk_dispatcher.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>
#include "../../infra/thread_pool/thread_pool.hpp"

namespace cupload::core {

namespace {

// Единственный канал ошибок: побеждает первая записанная
struct ErrorSlot {
    std::mutex mutex;
    std::optional<DispatchError> error;
    std::atomic<bool> failed{false};

    void record(DispatchError err) {
        std::lock_guard lock(mutex);
        if (!error) {
            error = std::move(err);
            failed.store(true, std::memory_order_release);
        }
    }

    [[nodiscard]] auto has_failed() const -> bool {
        return failed.load(std::memory_order_acquire);
    }
};

} // namespace

ChunkDispatcher::ChunkDispatcher(std::size_t chunk_size, std::size_t parallelism)
    : chunk_size_(chunk_size)
    , parallelism_(parallelism == 0 ? 1 : parallelism)
{
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk_size must be > 0");
    }
}

auto ChunkDispatcher::run(adapters::ByteSource& source, const ChunkProcessor& process)
    -> std::expected<std::uint64_t, DispatchError>
{
    ErrorSlot slot;
    std::uint64_t offset = 0;

    {
        // Один слот очереди: читатель блокируется, когда все заняты и слот полон
        infra::ThreadPool pool{parallelism_, 1};

        while (!slot.has_failed()) {
            std::vector<std::byte> buffer(chunk_size_);
            auto nread = adapters::read_full(source, buffer);
            if (!nread) {
                spdlog::error("Source read failed at offset {}: {}", offset, nread.error().message);
                slot.record(DispatchError{
                    .kind = DispatchError::Kind::Read,
                    .chunk_offset = offset,
                    .cause = std::move(nread.error()),
                });
                break;
            }
            if (*nread == 0) {
                break;
            }

            buffer.resize(*nread);
            const bool last = *nread < chunk_size_;

            pool.enqueue([&slot, &process, chunk_offset = offset, data = std::move(buffer)]() {
                // Ошибка уже есть — новый чанк не начинаем
                if (slot.has_failed()) {
                    return;
                }
                // Future задачи пула никто не ждёт, исключение иначе потеряется
                try {
                    auto res = process(chunk_offset, data);
                    if (!res) {
                        slot.record(DispatchError{
                            .kind = DispatchError::Kind::Process,
                            .chunk_offset = chunk_offset,
                            .cause = std::move(res.error()),
                        });
                    }
                } catch (const std::exception& e) {
                    spdlog::error("Chunk at offset {} threw: {}", chunk_offset, e.what());
                    slot.record(DispatchError{
                        .kind = DispatchError::Kind::Process,
                        .chunk_offset = chunk_offset,
                        .cause = infra::make_error(infra::ErrorCode::Unknown, e.what()),
                    });
                }
            });

            offset += *nread;
            if (last) {
                break;
            }
        }

        pool.wait();
    }

    if (slot.error) {
        return std::unexpected(std::move(*slot.error));
    }
    return offset;
}

} // namespace cupload::core
