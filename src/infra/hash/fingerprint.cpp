#include "fingerprint.hpp"

#include <algorithm>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include "../../adapters/source.hpp"

namespace cupload::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

} // namespace

auto SourceFingerprint::of_file(const std::filesystem::path& path, std::size_t head_bytes)
    -> Result<XXH64_hash_t>
{
    auto file = adapters::FileSource::open(path);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    auto size = (*file)->size();
    if (!size) {
        return std::unexpected(std::move(size.error()));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state(XXH64_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }
    // seed = размер: одинаковое начало при разной длине даёт разный отпечаток
    XXH64_reset(state.get(), *size);

    std::vector<std::byte> buffer(std::min(BUFFER_SIZE, std::max<std::size_t>(head_bytes, 1)));
    std::size_t remaining = head_bytes;
    while (remaining > 0) {
        const auto want = std::min(remaining, buffer.size());
        auto n = adapters::read_full(**file, std::span(buffer.data(), want));
        if (!n) {
            return std::unexpected(make_error(ErrorCode::ReadError,
                fmt::format("Error reading file: {}: {}", path.string(), n.error().message)));
        }
        if (*n == 0) break;
        XXH64_update(state.get(), buffer.data(), *n);
        remaining -= *n;
    }

    return XXH64_digest(state.get());
}

auto SourceFingerprint::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", hash);
}

} // namespace cupload::infra
