#include "resumer.hpp"

#include <charconv>
#include <fstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include "../infra/hash/fingerprint.hpp"

namespace cupload::extensions {

auto format_resume_token(const core::UploadResume& resume) -> std::string {
    return fmt::format("{},{}", resume.session_id, resume.start_offset);
}

auto parse_resume_token(std::string_view text) -> infra::Result<core::UploadResume> {
    const auto comma = text.rfind(',');
    if (comma == std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("invalid resume token '{}': expected <session_id>,<offset>", text)));
    }

    const auto digits = text.substr(comma + 1);
    std::uint64_t offset = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), offset);
    if (digits.empty() || ec != std::errc{} || end != digits.data() + digits.size()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("invalid resume offset '{}'", digits)));
    }

    return core::UploadResume{
        .session_id = std::string(text.substr(0, comma)),
        .start_offset = offset,
    };
}

auto load_resume_info(const std::filesystem::path& resume_file)
    -> std::optional<ResumeInfo>
{
    std::error_code ec;
    if (!std::filesystem::exists(resume_file, ec)) {
        if (ec) {
            spdlog::warn("Ignoring {}: {}", resume_file.string(), ec.message());
        }
        return std::nullopt;
    }

    try {
        YAML::Node node = YAML::LoadFile(resume_file.string());

        auto token = parse_resume_token(node["resume"].as<std::string>());
        if (!token) {
            spdlog::warn("Ignoring {}: {}", resume_file.string(), token.error().message);
            return std::nullopt;
        }

        ResumeInfo info;
        info.token = std::move(*token);
        info.source = node["source"].as<std::string>();
        info.destination = node["destination"].as<std::string>();
        info.total_bytes = node["total_bytes"].as<std::uint64_t>();
        info.fingerprint = node["fingerprint"].as<std::string>();
        return info;
    } catch (const YAML::Exception& e) {
        spdlog::warn("Ignoring {}: {}", resume_file.string(), e.what());
        return std::nullopt;
    }
}

auto save_resume_info(const ResumeInfo& info, const std::filesystem::path& resume_file)
    -> infra::VoidResult
{
    YAML::Node node;
    node["resume"] = format_resume_token(info.token);
    node["source"] = info.source.string();
    node["destination"] = info.destination;
    node["total_bytes"] = info.total_bytes;
    node["fingerprint"] = info.fingerprint;

    std::ofstream ofs(resume_file);
    ofs << node << '\n';
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot write resume file {}", resume_file.string())));
    }
    return {};
}

void clear_resume_info(const std::filesystem::path& resume_file) {
    std::error_code ec;
    std::filesystem::remove(resume_file, ec);
    if (ec) {
        spdlog::warn("Cannot remove {}: {}", resume_file.string(), ec.message());
    }
}

auto should_resume(const ResumeInfo& info,
                   const std::filesystem::path& source,
                   std::string_view destination) -> bool
{
    std::error_code ec;
    if (!std::filesystem::equivalent(info.source, source, ec) || ec) {
        return false;
    }
    if (info.destination != destination) {
        return false;
    }

    const auto size = std::filesystem::file_size(source, ec);
    if (ec || size != info.total_bytes || info.token.start_offset > size) {
        return false;
    }

    auto fingerprint = infra::SourceFingerprint::of_file(source);
    if (!fingerprint) {
        return false;
    }
    return infra::SourceFingerprint::to_hex(*fingerprint) == info.fingerprint;
}

} // namespace cupload::extensions
