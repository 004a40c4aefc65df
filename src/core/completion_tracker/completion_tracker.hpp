#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace cupload::core {

/// Блоки подтверждаются удалённой стороной в произвольном порядке, поэтому
/// смещение упавшего блока не годится как точка возобновления: перед ним могут быть дыры.
/// CompletionTracker хранит длину непрерывного подтверждённого префикса.
///
/// Не потокобезопасен; UploadSession держит его под мьютексом.
class CompletionTracker {
public:
    CompletionTracker() = default;

    // Считаем, что всё до offset уже подтверждено (контракт вызывающего, не проверяется)
    [[nodiscard]] static auto resume_from(std::uint64_t offset) -> CompletionTracker;

    void complete_block(std::uint64_t offset, std::uint64_t length);

    [[nodiscard]] auto complete_up_to() const -> std::uint64_t { return complete_up_to_; }

    // Блоки, завершённые раньше предшественника
    [[nodiscard]] auto pending_blocks() const -> std::size_t { return pending_.size(); }

private:
    std::uint64_t complete_up_to_ = 0;
    std::unordered_map<std::uint64_t, std::uint64_t> pending_;
};

} // namespace cupload::core
