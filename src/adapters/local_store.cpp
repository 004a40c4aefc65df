#include "local_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <random>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/completion_tracker/completion_tracker.hpp"
#include "core/content_hash/content_hash.hpp"

namespace cupload::adapters {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view SESSIONS_DIR = ".sessions";

auto is_session_id(const std::string& id) -> bool {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

auto write_at(int fd, std::span<const std::byte> data, std::uint64_t offset) -> bool {
    while (!data.empty()) {
        const ssize_t n = ::pwrite(fd, data.data(), data.size(), static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data = data.subspan(static_cast<std::size_t>(n));
        offset += static_cast<std::uint64_t>(n);
    }
    return true;
}

auto path_exists(const fs::path& path) -> infra::Result<bool> {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
    }
    return exists;
}

// "name.ext" -> "name (1).ext", "name (2).ext", ...
auto autorename(const fs::path& dest) -> infra::Result<fs::path> {
    const auto stem = dest.stem().string();
    const auto ext = dest.extension().string();
    for (int i = 1;; ++i) {
        auto candidate = dest.parent_path() / fmt::format("{} ({}){}", stem, i, ext);
        auto exists = path_exists(candidate);
        if (!exists) {
            return std::unexpected(std::move(exists.error()));
        }
        if (!*exists) {
            return candidate;
        }
    }
}

} // namespace

LocalStore::LocalStore(fs::path root, std::size_t page_size)
    : root_(std::move(root))
    , sessions_dir_(root_ / SESSIONS_DIR)
    , page_size_(page_size == 0 ? 1 : page_size)
{}

// =============== Сессии ===============

auto LocalStore::start_session() -> infra::Result<std::string> {
    std::error_code ec;
    fs::create_directories(sessions_dir_, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot create {}: {}", sessions_dir_.string(), ec.message())));
    }

    std::random_device rd;
    std::uniform_int_distribution<std::uint64_t> dist;
    std::mt19937_64 rng{(static_cast<std::uint64_t>(rd()) << 32) ^ rd()};
    const auto id = fmt::format("{:016x}{:016x}", dist(rng), dist(rng));

    std::ofstream part(sessions_dir_ / (id + ".part"), std::ios::binary);
    std::ofstream journal(sessions_dir_ / (id + ".journal"));
    if (!part || !journal) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot create session files for {}", id)));
    }

    spdlog::debug("LocalStore: new session {}", id);
    return id;
}

auto LocalStore::append(const remote::AppendRequest& request) -> infra::VoidResult {
    auto part = session_file(request.session_id, ".part");
    if (!part) {
        return std::unexpected(std::move(part.error()));
    }
    const std::uint64_t end = request.offset + request.data.size();
    {
        // Закрытие фиксирует конец данных; блоки до него ещё могут прийти
        std::lock_guard lock(mutex_);
        auto closed_at = closed_end(request.session_id);
        if (!closed_at) {
            return std::unexpected(std::move(closed_at.error()));
        }
        if (*closed_at && (end > **closed_at || (request.close && end != **closed_at))) {
            return std::unexpected(infra::make_error(infra::ErrorCode::SessionClosed,
                fmt::format("session {} is closed at {}, append [{}, {}) rejected",
                            request.session_id, **closed_at, request.offset, end)));
        }
    }

    // Удалённая сторона сама проверяет целостность
    const auto actual = core::ContentHash::of(request.data).finish_hex();
    if (actual != request.content_hash) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
            fmt::format("content hash mismatch at offset {}: got {}, expected {}",
                        request.offset, actual, request.content_hash)));
    }

    const int fd = ::open(part->c_str(), O_WRONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Cannot open {}: {}", part->string(), std::strerror(errno))));
    }
    const bool written = write_at(fd, request.data, request.offset);
    ::close(fd);
    if (!written) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Write failed at offset {} in session {}", request.offset, request.session_id)));
    }

    std::lock_guard lock(mutex_);
    std::ofstream journal(sessions_dir_ / (request.session_id + ".journal"), std::ios::app);
    journal << request.offset << ' ' << request.data.size() << '\n';
    if (!journal) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Cannot update journal of session {}", request.session_id)));
    }
    if (request.close) {
        std::ofstream closed(sessions_dir_ / (request.session_id + ".closed"), std::ios::trunc);
        closed << end << '\n';
        if (!closed) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                fmt::format("Cannot close session {}", request.session_id)));
        }
    }
    return {};
}

auto LocalStore::session_offset(const std::string& session_id) -> infra::Result<std::uint64_t> {
    auto journal_path = session_file(session_id, ".journal");
    if (!journal_path) {
        return std::unexpected(std::move(journal_path.error()));
    }

    std::lock_guard lock(mutex_);
    std::ifstream journal(*journal_path);
    core::CompletionTracker tracker;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    while (journal >> offset >> length) {
        tracker.complete_block(offset, length);
    }
    return tracker.complete_up_to();
}

auto LocalStore::finish(const remote::FinishRequest& request) -> infra::Result<remote::Metadata> {
    auto part = session_file(request.session_id, ".part");
    if (!part) {
        return std::unexpected(std::move(part.error()));
    }

    auto contiguous = session_offset(request.session_id);
    if (!contiguous) {
        return std::unexpected(std::move(contiguous.error()));
    }
    if (*contiguous != request.total_length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IncorrectOffset,
            fmt::format("declared length {} but session {} holds {} contiguous bytes",
                        request.total_length, request.session_id, *contiguous)));
    }

    auto dest = resolve(request.commit.path);
    if (!dest) {
        return std::unexpected(std::move(dest.error()));
    }
    auto taken = path_exists(*dest);
    if (!taken) {
        return std::unexpected(std::move(taken.error()));
    }
    if (*taken) {
        if (!request.commit.autorename) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Conflict,
                fmt::format("{} already exists", request.commit.path)));
        }
        auto renamed = autorename(*dest);
        if (!renamed) {
            return std::unexpected(std::move(renamed.error()));
        }
        *dest = std::move(*renamed);
    }

    std::error_code ec;
    fs::create_directories(dest->parent_path(), ec);
    if (!ec) fs::resize_file(*part, request.total_length, ec);
    if (!ec) fs::rename(*part, *dest, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Cannot commit session {} to {}: {}", request.session_id, dest->string(), ec.message())));
    }
    fs::remove(sessions_dir_ / (request.session_id + ".journal"), ec);
    fs::remove(sessions_dir_ / (request.session_id + ".closed"), ec);

    auto metadata = describe(*dest, true);
    if (metadata && request.commit.client_modified) {
        metadata->client_modified = remote::format_timestamp(*request.commit.client_modified);
    }
    return metadata;
}

// =============== Метаданные, листинг, скачивание ===============

auto LocalStore::get_metadata(const std::string& path) -> infra::Result<remote::Metadata> {
    auto local = resolve(path);
    if (!local) {
        return std::unexpected(std::move(local.error()));
    }
    return describe(*local, true);
}

auto LocalStore::list_folder(const std::string& path, bool recursive)
    -> infra::Result<remote::ListFolderPage>
{
    // Корень запрашивается пустой строкой
    auto dir = path.empty() ? infra::Result<fs::path>(root_) : resolve(path);
    if (!dir) {
        return std::unexpected(std::move(dir.error()));
    }
    std::error_code ec;
    if (!fs::is_directory(*dir, ec)) {
        return std::unexpected(infra::make_error(fs::exists(*dir, ec) ? infra::ErrorCode::ApiError
                                                                      : infra::ErrorCode::NotFound,
            fmt::format("{} is not a folder", path)));
    }

    std::vector<remote::Metadata> entries;
    auto collect = [&](const fs::directory_entry& entry) -> infra::VoidResult {
        auto meta = describe(entry.path(), false);
        if (!meta) {
            return std::unexpected(std::move(meta.error()));
        }
        entries.push_back(std::move(*meta));
        return {};
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(*dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->path() == sessions_dir_) {
                it.disable_recursion_pending();
                continue;
            }
            if (auto res = collect(*it); !res) return std::unexpected(std::move(res.error()));
        }
    } else {
        for (auto it = fs::directory_iterator(*dir, ec);
             !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (it->path() == sessions_dir_) continue;
            if (auto res = collect(*it); !res) return std::unexpected(std::move(res.error()));
        }
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Cannot list {}: {}", path, ec.message())));
    }

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.path_display < b.path_display;
    });

    std::deque<remote::Metadata> pending(std::make_move_iterator(entries.begin()),
                                         std::make_move_iterator(entries.end()));
    std::lock_guard lock(mutex_);
    return take_page(pending);
}

auto LocalStore::list_folder_continue(const std::string& cursor)
    -> infra::Result<remote::ListFolderPage>
{
    std::lock_guard lock(mutex_);
    auto it = cursors_.find(cursor);
    if (it == cursors_.end()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ApiError,
            fmt::format("invalid cursor {}", cursor)));
    }
    auto pending = std::move(it->second);
    cursors_.erase(it);
    return take_page(pending);
}

auto LocalStore::download(const std::string& path,
                          std::optional<std::uint64_t> range_start,
                          std::optional<std::uint64_t> range_end)
    -> infra::Result<remote::DownloadResponse>
{
    auto local = resolve(path);
    if (!local) {
        return std::unexpected(std::move(local.error()));
    }
    auto metadata = describe(*local, false);
    if (!metadata) {
        return std::unexpected(std::move(metadata.error()));
    }
    if (metadata->kind != remote::EntryKind::File) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ApiError,
            fmt::format("{} is not a file", path)));
    }

    auto file = FileSource::open(*local);
    if (!file) {
        return std::unexpected(std::move(file.error()));
    }
    const std::uint64_t start = range_start.value_or(0);
    const std::uint64_t end = std::min(range_end.value_or(metadata->size), metadata->size);
    if (start > end) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("invalid range {}-{} for {} ({} bytes)", start, end, path, metadata->size)));
    }
    if (auto res = (*file)->seek(start); !res) {
        return std::unexpected(std::move(res.error()));
    }

    remote::DownloadResponse response;
    response.metadata = std::move(*metadata);
    response.content_length = end - start;
    response.body = std::make_unique<LimitedSource>(std::move(*file), end - start);
    return response;
}

// =============== Вспомогательное ===============

auto LocalStore::session_file(const std::string& session_id, std::string_view ext) const
    -> infra::Result<fs::path>
{
    if (!is_session_id(session_id)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("no such upload session: {}", session_id)));
    }
    auto path = sessions_dir_ / (session_id + std::string(ext));
    auto exists = path_exists(path);
    if (!exists) {
        return std::unexpected(std::move(exists.error()));
    }
    if (!*exists) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("no such upload session: {}", session_id)));
    }
    return path;
}

auto LocalStore::closed_end(const std::string& session_id) const
    -> infra::Result<std::optional<std::uint64_t>>
{
    const auto path = sessions_dir_ / (session_id + ".closed");
    auto exists = path_exists(path);
    if (!exists) {
        return std::unexpected(std::move(exists.error()));
    }
    if (!*exists) {
        return std::optional<std::uint64_t>{};
    }
    std::ifstream in(path);
    std::uint64_t end = 0;
    if (!(in >> end)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("corrupt close marker of session {}", session_id)));
    }
    return std::optional<std::uint64_t>{end};
}

auto LocalStore::resolve(const std::string& path) const -> infra::Result<fs::path> {
    if (path.empty() || path.front() != '/') {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("path needs to be absolute (start with a '/'): {}", path)));
    }
    const auto relative = fs::path(path.substr(1)).lexically_normal();
    for (const auto& part : relative) {
        if (part == ".." || part == SESSIONS_DIR) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("invalid path: {}", path)));
        }
    }
    return root_ / relative;
}

auto LocalStore::describe(const fs::path& local, bool with_hash) const
    -> infra::Result<remote::Metadata>
{
    struct stat sb;
    if (::stat(local.c_str(), &sb) == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("not found: {}", local.lexically_relative(root_).generic_string())));
    }

    remote::Metadata meta;
    const auto relative = local.lexically_relative(root_).generic_string();
    meta.name = local.filename().string();
    meta.path_display = relative == "." ? "/" : "/" + relative;
    meta.id = fmt::format("id:{:016x}", std::hash<std::string>{}(meta.path_display));

    if (S_ISDIR(sb.st_mode)) {
        meta.kind = remote::EntryKind::Folder;
        return meta;
    }

    meta.kind = remote::EntryKind::File;
    meta.size = static_cast<std::uint64_t>(sb.st_size);
    meta.server_modified = remote::format_timestamp(
        std::chrono::system_clock::time_point{std::chrono::seconds{sb.st_mtim.tv_sec}});

    if (with_hash) {
        auto file = FileSource::open(local);
        if (!file) {
            return std::unexpected(std::move(file.error()));
        }
        core::ContentHash hash;
        if (auto res = hash.read_stream(**file); !res) {
            return std::unexpected(std::move(res.error()));
        }
        meta.content_hash = std::move(hash).finish_hex();
    }
    return meta;
}

auto LocalStore::take_page(std::deque<remote::Metadata>& entries) -> remote::ListFolderPage {
    remote::ListFolderPage page;
    const std::size_t count = std::min(page_size_, entries.size());
    for (std::size_t i = 0; i < count; ++i) {
        page.entries.push_back(std::move(entries.front()));
        entries.pop_front();
    }
    if (!entries.empty()) {
        page.cursor = fmt::format("c{}", next_cursor_++);
        page.has_more = true;
        cursors_.emplace(page.cursor, std::move(entries));
    }
    return page;
}

} // namespace cupload::adapters
