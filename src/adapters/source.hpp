#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include "infra/error_handler/error.hpp"

namespace cupload::adapters {

// Последовательный источник байтов. read() возвращает 0 в конце потока.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> = 0;
};

// POSIX-файл. EINTR повторяется внутри read().
class FileSource final : public ByteSource {
public:
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> infra::Result<std::unique_ptr<FileSource>>;

    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> override;

    [[nodiscard]] auto seek(std::uint64_t offset) -> infra::VoidResult;
    [[nodiscard]] auto size() const -> infra::Result<std::uint64_t>;
    [[nodiscard]] auto modified_time() const -> infra::Result<std::chrono::system_clock::time_point>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    FileSource(int fd, std::filesystem::path path);

    int fd_;
    std::filesystem::path path_;
};

class MemorySource final : public ByteSource {
public:
    explicit MemorySource(std::span<const std::byte> data) : data_(data) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> override;

    [[nodiscard]] auto position() const -> std::size_t { return pos_; }

private:
    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
};

// Отдаёт не более limit байтов из вложенного источника
class LimitedSource final : public ByteSource {
public:
    LimitedSource(std::unique_ptr<ByteSource> inner, std::uint64_t limit)
        : inner_(std::move(inner)), remaining_(limit) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> override;

private:
    std::unique_ptr<ByteSource> inner_;
    std::uint64_t remaining_;
};

// Читает, пока буфер не заполнен или поток не кончился.
// Interrupted повторяется, остальные ошибки возвращаются как есть.
[[nodiscard]] auto read_full(ByteSource& source, std::span<std::byte> buffer)
    -> infra::Result<std::size_t>;

} // namespace cupload::adapters
