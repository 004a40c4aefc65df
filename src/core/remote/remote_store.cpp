#include "remote_store.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <fmt/core.h>

namespace cupload::remote {

namespace {

auto unsupported(std::string_view what) -> infra::Error {
    return infra::make_error(infra::ErrorCode::UnsupportedFeature,
                             fmt::format("{} is not supported by this store", what));
}

} // namespace

auto RemoteStore::session_offset(const std::string&) -> infra::Result<std::uint64_t> {
    return std::unexpected(unsupported("session_offset"));
}

auto RemoteStore::get_metadata(const std::string&) -> infra::Result<Metadata> {
    return std::unexpected(unsupported("get_metadata"));
}

auto RemoteStore::list_folder(const std::string&, bool) -> infra::Result<ListFolderPage> {
    return std::unexpected(unsupported("list_folder"));
}

auto RemoteStore::list_folder_continue(const std::string&) -> infra::Result<ListFolderPage> {
    return std::unexpected(unsupported("list_folder_continue"));
}

auto RemoteStore::download(const std::string&, std::optional<std::uint64_t>,
                           std::optional<std::uint64_t>) -> infra::Result<DownloadResponse> {
    return std::unexpected(unsupported("download"));
}

auto format_timestamp(std::chrono::system_clock::time_point t) -> std::string {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(t);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(seconds));
}

} // namespace cupload::remote
