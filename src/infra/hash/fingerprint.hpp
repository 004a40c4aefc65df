#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace cupload::infra {

/// Быстрый отпечаток источника для файла возобновления: xxHash64 первых
/// head_bytes байт, смешанный с размером файла. Не криптографический,
/// нужен только чтобы заметить подмену источника между запусками.
class SourceFingerprint {
public:
    static constexpr std::size_t DEFAULT_HEAD = 1024 * 1024; // 1MB

    [[nodiscard]] static auto of_file(const std::filesystem::path& path,
                                      std::size_t head_bytes = DEFAULT_HEAD)
        -> Result<XXH64_hash_t>;

    // 16 шестнадцатеричных символов
    [[nodiscard]] static auto to_hex(XXH64_hash_t hash) -> std::string;

private:
    static constexpr std::size_t BUFFER_SIZE = 256 * 1024;
};

} // namespace cupload::infra
