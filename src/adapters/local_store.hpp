#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/remote/remote_store.hpp"

namespace cupload::adapters {

/// RemoteStore поверх локального каталога.
///
///   <root>/.sessions/<id>.part     данные сессии (append пишет по смещению)
///   <root>/.sessions/<id>.journal  строки "offset length" каждого принятого append
///   <root>/.sessions/<id>.closed   конец данных закрытой сессии; append за ним не принимается
///
/// Пути хранилища абсолютные, начинаются с '/', отсчитываются от root.
/// download(range_start, range_end): range_end не включается.
class LocalStore final : public remote::RemoteStore {
public:
    explicit LocalStore(std::filesystem::path root, std::size_t page_size = 1000);

    [[nodiscard]] auto start_session() -> infra::Result<std::string> override;
    [[nodiscard]] auto append(const remote::AppendRequest& request) -> infra::VoidResult override;
    [[nodiscard]] auto finish(const remote::FinishRequest& request)
        -> infra::Result<remote::Metadata> override;
    [[nodiscard]] auto session_offset(const std::string& session_id)
        -> infra::Result<std::uint64_t> override;

    [[nodiscard]] auto get_metadata(const std::string& path) -> infra::Result<remote::Metadata> override;
    [[nodiscard]] auto list_folder(const std::string& path, bool recursive)
        -> infra::Result<remote::ListFolderPage> override;
    [[nodiscard]] auto list_folder_continue(const std::string& cursor)
        -> infra::Result<remote::ListFolderPage> override;
    [[nodiscard]] auto download(const std::string& path,
                                std::optional<std::uint64_t> range_start,
                                std::optional<std::uint64_t> range_end)
        -> infra::Result<remote::DownloadResponse> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    [[nodiscard]] auto session_file(const std::string& session_id, std::string_view ext) const
        -> infra::Result<std::filesystem::path>;
    // Под mutex_: конец данных из .closed, nullopt пока сессия открыта
    [[nodiscard]] auto closed_end(const std::string& session_id) const
        -> infra::Result<std::optional<std::uint64_t>>;
    [[nodiscard]] auto resolve(const std::string& path) const -> infra::Result<std::filesystem::path>;
    [[nodiscard]] auto describe(const std::filesystem::path& local, bool with_hash) const
        -> infra::Result<remote::Metadata>;
    [[nodiscard]] auto take_page(std::deque<remote::Metadata>& entries) -> remote::ListFolderPage;

    std::filesystem::path root_;
    std::filesystem::path sessions_dir_;
    std::size_t page_size_;

    std::mutex mutex_; // журналы и курсоры листинга
    std::unordered_map<std::string, std::deque<remote::Metadata>> cursors_;
    std::uint64_t next_cursor_ = 0;
};

} // namespace cupload::adapters
