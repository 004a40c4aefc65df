#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <type_traits>
#include "adapters/local_store.hpp"
#include "core/remote/remote_ops.hpp"
#include "fake_remote.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using cupload::adapters::LocalStore;
using cupload::infra::ErrorCode;
using cupload::remote::DownloadSession;
using cupload::testing::RecordingSleeper;

namespace {

// Тело ответа, которое обрывается после limit байт
class BreakingBody : public cupload::adapters::ByteSource {
public:
    BreakingBody(std::unique_ptr<cupload::adapters::ByteSource> inner, std::size_t limit)
        : inner_(std::move(inner)), limit_(limit) {}

    auto read(std::span<std::byte> buffer) -> cupload::infra::Result<std::size_t> override {
        if (served_ >= limit_) {
            return std::unexpected(cupload::infra::make_error(ErrorCode::Transient, "connection reset"));
        }
        auto n = inner_->read(buffer.first(std::min(buffer.size(), limit_ - served_)));
        if (n) served_ += *n;
        return n;
    }

private:
    std::unique_ptr<cupload::adapters::ByteSource> inner_;
    std::size_t limit_;
    std::size_t served_ = 0;
};

// LocalStore с внедряемыми сбоями
class FlakyStore : public cupload::remote::RemoteStore {
public:
    explicit FlakyStore(fs::path root, std::size_t page_size) : inner_(std::move(root), page_size) {}

    auto start_session() -> cupload::infra::Result<std::string> override { return inner_.start_session(); }
    auto append(const cupload::remote::AppendRequest& r) -> cupload::infra::VoidResult override { return inner_.append(r); }
    auto finish(const cupload::remote::FinishRequest& r) -> cupload::infra::Result<cupload::remote::Metadata> override {
        return inner_.finish(r);
    }
    auto get_metadata(const std::string& path) -> cupload::infra::Result<cupload::remote::Metadata> override {
        ++metadata_calls;
        return inner_.get_metadata(path);
    }

    auto list_folder(const std::string& path, bool recursive)
        -> cupload::infra::Result<cupload::remote::ListFolderPage> override
    {
        listed_paths.push_back(path);
        if (list_failures > 0) {
            --list_failures;
            return std::unexpected(cupload::infra::make_error(ErrorCode::Transient, "503"));
        }
        return inner_.list_folder(path, recursive);
    }

    auto list_folder_continue(const std::string& cursor)
        -> cupload::infra::Result<cupload::remote::ListFolderPage> override
    {
        return inner_.list_folder_continue(cursor);
    }

    auto download(const std::string& path, std::optional<std::uint64_t> start, std::optional<std::uint64_t> end)
        -> cupload::infra::Result<cupload::remote::DownloadResponse> override
    {
        download_starts.push_back(start.value_or(0));
        auto res = inner_.download(path, start, end);
        if (res && body_failures > 0) {
            --body_failures;
            res->body = std::make_unique<BreakingBody>(std::move(res->body), break_after);
        }
        return res;
    }

    int list_failures = 0;
    int body_failures = 0;
    std::size_t break_after = 0;
    int metadata_calls = 0;
    std::vector<std::string> listed_paths;
    std::vector<std::uint64_t> download_starts;

private:
    LocalStore inner_;
};

} // namespace

class RemoteOpsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / fmt::format("cupload-ops-{}", std::random_device{}());
        fs::create_directories(root_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_file(const std::string& rel, std::string_view content) {
        fs::create_directories((root_ / rel).parent_path());
        std::ofstream(root_ / rel, std::ios::binary) << content;
    }

    fs::path root_;
};

TEST_F(RemoteOpsTest, DirectoryIteratorWalksAllPages)
{
    auto store = std::make_shared<FlakyStore>(root_, 2);
    for (char c = 'a'; c <= 'e'; ++c) {
        write_file(std::string(1, c) + ".txt", "x");
    }
    store->list_failures = 1;
    RecordingSleeper sleeper;

    auto it = cupload::remote::list_directory(store, "/", false, sleeper.context());
    ASSERT_TRUE(it.has_value()) << it.error().message;

    std::vector<std::string> names;
    while (auto entry = it->next()) {
        ASSERT_TRUE(entry->has_value());
        names.push_back((*entry)->name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"a.txt", "b.txt", "c.txt", "d.txt", "e.txt"}));
    EXPECT_EQ(store->listed_paths, (std::vector<std::string>{"", ""}));
    EXPECT_EQ(*sleeper.delays, (std::vector{500ms}));
}

TEST_F(RemoteOpsTest, ListDirectoryNeedsAbsolutePath)
{
    auto store = std::make_shared<FlakyStore>(root_, 10);
    auto it = cupload::remote::list_directory(store, "docs", false);
    ASSERT_FALSE(it.has_value());
    EXPECT_EQ(it.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(store->listed_paths.empty());
}

TEST_F(RemoteOpsTest, MetadataNotFoundIsNotRetried)
{
    FlakyStore store(root_, 10);
    auto meta = cupload::remote::get_metadata_with_retry(store, "/nope");
    ASSERT_FALSE(meta.has_value());
    EXPECT_EQ(meta.error().code, ErrorCode::NotFound);
    EXPECT_EQ(store.metadata_calls, 1);
}

TEST(DownloadSessionTest, OnlyOpenCreatesSessions)
{
    static_assert(!std::is_constructible_v<DownloadSession,
        std::shared_ptr<cupload::remote::RemoteStore>, cupload::infra::RetryPolicy, std::string,
        std::optional<std::uint64_t>, std::optional<std::uint64_t>, cupload::infra::RetryContext>);
    static_assert(!std::is_copy_constructible_v<DownloadSession>);
}

TEST_F(RemoteOpsTest, DownloadResumesFromCursorAfterBrokenBody)
{
    std::string content;
    for (int i = 0; i < 100; ++i) content.push_back(static_cast<char>('A' + i % 26));
    write_file("f.txt", content);

    auto store = std::make_shared<FlakyStore>(root_, 10);
    store->body_failures = 1;
    store->break_after = 30;
    RecordingSleeper sleeper;

    auto download = DownloadSession::open(store, cupload::infra::RetryPolicy{}, "/f.txt", 10, std::nullopt,
                                          sleeper.context());
    ASSERT_TRUE(download.has_value()) << download.error().message;
    EXPECT_EQ((*download)->content_length(), 90u);
    EXPECT_EQ((*download)->metadata().size, 100u);

    std::vector<std::byte> buffer(200);
    auto n = cupload::adapters::read_full(**download, buffer);
    ASSERT_TRUE(n.has_value()) << n.error().message;
    ASSERT_EQ(*n, 90u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buffer.data()), *n), content.substr(10));
    EXPECT_EQ((*download)->bytes_read(), 90u);
    EXPECT_EQ(store->download_starts, (std::vector<std::uint64_t>{10, 40}));
}

TEST_F(RemoteOpsTest, DownloadGivesUpAfterRepeatedBreaks)
{
    write_file("f.txt", "0123456789");
    auto store = std::make_shared<FlakyStore>(root_, 10);
    store->body_failures = 100;
    store->break_after = 0;
    RecordingSleeper sleeper;

    auto download = DownloadSession::open(store, cupload::infra::RetryPolicy{.max_attempts = 3}, "/f.txt",
                                          std::nullopt, std::nullopt, sleeper.context());
    ASSERT_TRUE(download.has_value());

    std::vector<std::byte> buffer(16);
    auto n = (*download)->read(buffer);
    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error().code, ErrorCode::Transient);
    EXPECT_EQ(store->download_starts.size(), 3u);
}
