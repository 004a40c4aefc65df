#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include "../../adapters/source.hpp"
#include "../../infra/error_handler/error.hpp"

namespace cupload::core {

struct DispatchError {
    enum class Kind {
        Read,    // не удалось прочитать источник
        Process, // обработчик чанка вернул ошибку или бросил исключение
    };

    Kind kind;
    std::uint64_t chunk_offset; // для Read: смещение чанка, который читали
    infra::Error cause;
};

// Вызывается из рабочих потоков; offset отсчитывается от начала источника
using ChunkProcessor =
    std::function<infra::VoidResult(std::uint64_t offset, std::span<const std::byte> data)>;

/// Читает источник строго последовательно и раздаёт чанки по chunk_size байт
/// не более чем parallelism одновременным обработчикам. Чанк k покрывает
/// [k * chunk_size, (k + 1) * chunk_size); короче может быть только последний.
///
/// Первая ошибка обработчика останавливает выдачу новых чанков, уже запущенные
/// дорабатывают. Ошибка чтения прерывает работу сразу.
class ChunkDispatcher {
public:
    ChunkDispatcher(std::size_t chunk_size, std::size_t parallelism);

    // Возвращает число прочитанных байт
    [[nodiscard]] auto run(adapters::ByteSource& source, const ChunkProcessor& process)
        -> std::expected<std::uint64_t, DispatchError>;

    [[nodiscard]] auto chunk_size() const -> std::size_t { return chunk_size_; }
    [[nodiscard]] auto parallelism() const -> std::size_t { return parallelism_; }

private:
    std::size_t chunk_size_;
    std::size_t parallelism_;
};

} // namespace cupload::core
