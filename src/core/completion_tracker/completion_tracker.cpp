#include "completion_tracker.hpp"

namespace cupload::core {

auto CompletionTracker::resume_from(std::uint64_t offset) -> CompletionTracker {
    CompletionTracker tracker;
    tracker.complete_up_to_ = offset;
    return tracker;
}

void CompletionTracker::complete_block(std::uint64_t offset, std::uint64_t length) {
    if (length == 0) {
        return;
    }
    if (offset != complete_up_to_) {
        // Позади блока дыра, учтём его позже
        pending_.emplace(offset, length);
        return;
    }

    complete_up_to_ += length;
    for (auto it = pending_.find(complete_up_to_); it != pending_.end();
         it = pending_.find(complete_up_to_)) {
        complete_up_to_ += it->second;
        pending_.erase(it);
    }
}

} // namespace cupload::core
