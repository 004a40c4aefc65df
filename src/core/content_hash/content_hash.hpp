#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include "../../adapters/source.hpp"
#include "../../infra/error_handler/error.hpp"

struct evp_md_ctx_st;

namespace cupload::core {

// Размер блока протокола. Константа удалённой стороны, не настраивается.
inline constexpr std::size_t BLOCK_SIZE = 4 * 1024 * 1024;

/// Content hash удалённого хранилища:
///   SHA256( SHA256(block_1) || SHA256(block_2) || ... || SHA256(block_n) ),
/// блоки по BLOCK_SIZE, короче может быть только последний.
/// update() ассоциативен: результат не зависит от того, как вход разбит на вызовы.
class ContentHash {
public:
    static constexpr std::size_t OUTPUT_SIZE = 256 / 8;
    using Digest = std::array<std::uint8_t, OUTPUT_SIZE>;

    ContentHash();
    ~ContentHash();

    ContentHash(const ContentHash& other);
    ContentHash& operator=(const ContentHash& other);
    ContentHash(ContentHash&&) noexcept = default;
    ContentHash& operator=(ContentHash&&) noexcept = default;

    void update(std::span<const std::byte> bytes);
    void update(std::string_view bytes);

    // Хеширует источник до конца. Interrupted -> повтор чтения.
    // При ошибке состояние содержит ровно байты успешных чтений.
    [[nodiscard]] auto read_stream(adapters::ByteSource& source) -> infra::VoidResult;

    // Хешер после finish() использовать нельзя
    [[nodiscard]] auto finish() && -> Digest;
    [[nodiscard]] auto finish_hex() && -> std::string;

    // Байт в текущем незавершённом блоке
    [[nodiscard]] auto partial() const -> std::size_t { return partial_; }

    [[nodiscard]] static auto of(std::span<const std::byte> bytes) -> ContentHash;

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    using Ctx = std::unique_ptr<evp_md_ctx_st, CtxDeleter>;

    void finish_block();

    Ctx ctx_;
    Ctx block_ctx_;
    std::size_t partial_ = 0;
};

[[nodiscard]] auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

} // namespace cupload::core
