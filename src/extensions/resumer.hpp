#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "../core/upload_session/upload_session.hpp"
#include "../infra/error_handler/error.hpp"

namespace cupload::extensions {

// "<session_id>,<offset>"
[[nodiscard]] auto format_resume_token(const core::UploadResume& resume) -> std::string;

// Делит по последней запятой: id может содержать запятые, смещение нет
[[nodiscard]] auto parse_resume_token(std::string_view text) -> infra::Result<core::UploadResume>;

struct ResumeInfo {
    core::UploadResume token;
    std::filesystem::path source;
    std::string destination;
    std::uint64_t total_bytes = 0;
    std::string fingerprint; // SourceFingerprint::to_hex
};

[[nodiscard]] auto load_resume_info(const std::filesystem::path& resume_file)
    -> std::optional<ResumeInfo>;

[[nodiscard]] auto save_resume_info(const ResumeInfo& info,
                                    const std::filesystem::path& resume_file = ".cupload.resume")
    -> infra::VoidResult;

void clear_resume_info(const std::filesystem::path& resume_file);

// Продолжать можно, если источник и назначение те же, а отпечаток не изменился
[[nodiscard]] auto should_resume(const ResumeInfo& info,
                                 const std::filesystem::path& source,
                                 std::string_view destination) -> bool;

} // namespace cupload::extensions
