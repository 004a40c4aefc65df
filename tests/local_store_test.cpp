#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include "adapters/local_store.hpp"
#include "core/upload_session/upload_session.hpp"
#include "fake_remote.hpp"

namespace fs = std::filesystem;
using cupload::adapters::LocalStore;
using cupload::core::ContentHash;
using cupload::infra::ErrorCode;
using cupload::remote::AppendRequest;
using cupload::remote::EntryKind;
using cupload::remote::FinishRequest;

class LocalStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / fmt::format("cupload-store-{}", std::random_device{}());
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

    auto append(LocalStore& store, const std::string& id, std::uint64_t offset,
                std::span<const std::byte> data, bool close = false) {
        return store.append(AppendRequest{
            .session_id = id,
            .offset = offset,
            .data = data,
            .content_hash = ContentHash::of(data).finish_hex(),
            .close = close,
        });
    }

    fs::path root_;
};

TEST_F(LocalStoreTest, OutOfOrderAppendsAssembleFile)
{
    LocalStore store(root_);
    auto id = store.start_session();
    ASSERT_TRUE(id.has_value());

    const auto data = cupload::testing::make_pattern(3000);
    const std::span<const std::byte> all(data);

    ASSERT_TRUE(append(store, *id, 1000, all.subspan(1000, 1000)).has_value());
    EXPECT_EQ(store.session_offset(*id).value(), 0u);
    ASSERT_TRUE(append(store, *id, 0, all.first(1000)).has_value());
    EXPECT_EQ(store.session_offset(*id).value(), 2000u);
    ASSERT_TRUE(append(store, *id, 2000, all.subspan(2000), true).has_value());
    EXPECT_EQ(store.session_offset(*id).value(), 3000u);

    auto meta = store.finish(FinishRequest{.session_id = *id, .total_length = 3000, .commit = {.path = "/dir/file.bin"}});
    ASSERT_TRUE(meta.has_value()) << meta.error().message;
    EXPECT_EQ(meta->kind, EntryKind::File);
    EXPECT_EQ(meta->name, "file.bin");
    EXPECT_EQ(meta->path_display, "/dir/file.bin");
    EXPECT_EQ(meta->size, 3000u);
    EXPECT_EQ(meta->content_hash, ContentHash::of(data).finish_hex());
    EXPECT_TRUE(fs::exists(root_ / "dir" / "file.bin"));

    // Сессия удалена после commit
    EXPECT_EQ(store.session_offset(*id).error().code, ErrorCode::NotFound);
}

TEST_F(LocalStoreTest, AppendRejectsBadHash)
{
    LocalStore store(root_);
    auto id = store.start_session();
    ASSERT_TRUE(id.has_value());

    const auto data = cupload::testing::make_bytes(10, 1);
    auto res = store.append(AppendRequest{.session_id = *id, .offset = 0, .data = data, .content_hash = "00"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ChecksumMismatch);
}

TEST_F(LocalStoreTest, ClosedSessionRejectsAppends)
{
    LocalStore store(root_);
    auto id = store.start_session();
    ASSERT_TRUE(id.has_value());

    const auto data = cupload::testing::make_bytes(10, 1);
    ASSERT_TRUE(append(store, *id, 0, data, true).has_value());
    auto res = append(store, *id, 10, data);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SessionClosed);
}

TEST_F(LocalStoreTest, ClosingChunkMayArriveBeforeEarlierChunks)
{
    LocalStore store(root_);
    auto id = store.start_session();
    ASSERT_TRUE(id.has_value());

    const auto data = cupload::testing::make_pattern(2500);
    const std::span<const std::byte> all(data);

    // Короткий последний чанк пришёл первым
    ASSERT_TRUE(append(store, *id, 2000, all.subspan(2000), true).has_value());
    EXPECT_EQ(store.session_offset(*id).value(), 0u);

    auto head = append(store, *id, 0, all.first(1000));
    ASSERT_TRUE(head.has_value()) << head.error().message;
    ASSERT_TRUE(append(store, *id, 1000, all.subspan(1000, 1000)).has_value());
    EXPECT_EQ(store.session_offset(*id).value(), 2500u);

    // Повтор того же закрытия допустим, закрытие на другом конце нет
    EXPECT_TRUE(append(store, *id, 2000, all.subspan(2000), true).has_value());
    EXPECT_EQ(append(store, *id, 2500, all.first(0), true).error().code, ErrorCode::SessionClosed);
    EXPECT_EQ(append(store, *id, 2400, all.first(200)).error().code, ErrorCode::SessionClosed);

    auto meta = store.finish(FinishRequest{.session_id = *id, .total_length = 2500, .commit = {.path = "/late.bin"}});
    ASSERT_TRUE(meta.has_value()) << meta.error().message;
    EXPECT_EQ(meta->content_hash, ContentHash::of(data).finish_hex());
}

TEST_F(LocalStoreTest, UnknownSessionIsNotFound)
{
    LocalStore store(root_);
    const auto data = cupload::testing::make_bytes(1, 1);
    EXPECT_EQ(append(store, "deadbeef", 0, data).error().code, ErrorCode::NotFound);
    EXPECT_EQ(append(store, "../escape", 0, data).error().code, ErrorCode::NotFound);
}

TEST_F(LocalStoreTest, UnstatableSessionPathIsAnErrorNotAThrow)
{
    LocalStore store(root_);
    ASSERT_TRUE(store.start_session().has_value());

    // Имя файла сессии длиннее NAME_MAX: stat падает с ENAMETOOLONG
    const std::string id(300, 'a');
    const auto data = cupload::testing::make_bytes(1, 1);
    cupload::infra::VoidResult res;
    ASSERT_NO_THROW(res = append(store, id, 0, data));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Unknown);
}

TEST_F(LocalStoreTest, FinishChecksLengthAndConflicts)
{
    LocalStore store(root_);
    write_file("taken.txt", "x");

    auto id = store.start_session();
    ASSERT_TRUE(id.has_value());
    const auto data = cupload::testing::make_bytes(100, 7);
    ASSERT_TRUE(append(store, *id, 0, data, true).has_value());

    auto short_len = store.finish(FinishRequest{.session_id = *id, .total_length = 50, .commit = {.path = "/a"}});
    ASSERT_FALSE(short_len.has_value());
    EXPECT_EQ(short_len.error().code, ErrorCode::IncorrectOffset);

    auto conflict = store.finish(FinishRequest{.session_id = *id, .total_length = 100, .commit = {.path = "/taken.txt"}});
    ASSERT_FALSE(conflict.has_value());
    EXPECT_EQ(conflict.error().code, ErrorCode::Conflict);

    auto renamed = store.finish(FinishRequest{
        .session_id = *id, .total_length = 100, .commit = {.path = "/taken.txt", .autorename = true}});
    ASSERT_TRUE(renamed.has_value()) << renamed.error().message;
    EXPECT_EQ(renamed->path_display, "/taken (1).txt");
}

TEST_F(LocalStoreTest, RejectsRelativeAndEscapingPaths)
{
    LocalStore store(root_);
    EXPECT_EQ(store.get_metadata("relative").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.get_metadata("/../outside").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.get_metadata("/.sessions").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.get_metadata("/missing").error().code, ErrorCode::NotFound);
}

TEST_F(LocalStoreTest, MetadataForFilesAndFolders)
{
    LocalStore store(root_);
    write_file("docs/hello.txt", "hello");

    auto folder = store.get_metadata("/docs");
    ASSERT_TRUE(folder.has_value());
    EXPECT_EQ(folder->kind, EntryKind::Folder);
    EXPECT_TRUE(folder->content_hash.empty());

    auto file = store.get_metadata("/docs/hello.txt");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->kind, EntryKind::File);
    EXPECT_EQ(file->size, 5u);
    EXPECT_EQ(file->content_hash, "9595c9df90075148eb06860365df33584b75bff782a510c6cd4883a419833d50");
    EXPECT_TRUE(file->server_modified.has_value());
}

TEST_F(LocalStoreTest, ListingIsPagedAndSkipsSessions)
{
    LocalStore store(root_, 2);
    ASSERT_TRUE(store.start_session().has_value()); // создаёт .sessions
    write_file("a.txt", "a");
    write_file("b.txt", "b");
    write_file("c/d.txt", "d");

    auto page = store.list_folder("", false);
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->entries.size(), 2u);
    EXPECT_TRUE(page->has_more);
    EXPECT_EQ(page->entries[0].path_display, "/a.txt");
    EXPECT_EQ(page->entries[1].path_display, "/b.txt");

    auto rest = store.list_folder_continue(page->cursor);
    ASSERT_TRUE(rest.has_value());
    ASSERT_EQ(rest->entries.size(), 1u);
    EXPECT_FALSE(rest->has_more);
    EXPECT_EQ(rest->entries[0].path_display, "/c");
    EXPECT_EQ(rest->entries[0].kind, EntryKind::Folder);

    EXPECT_EQ(store.list_folder_continue(page->cursor).error().code, ErrorCode::ApiError);
}

TEST_F(LocalStoreTest, RecursiveListing)
{
    LocalStore store(root_);
    write_file("c/d.txt", "d");
    write_file("c/e/f.txt", "f");

    auto page = store.list_folder("/c", true);
    ASSERT_TRUE(page.has_value());
    std::vector<std::string> paths;
    for (const auto& e : page->entries) paths.push_back(e.path_display);
    EXPECT_EQ(paths, (std::vector<std::string>{"/c/d.txt", "/c/e", "/c/e/f.txt"}));
}

TEST_F(LocalStoreTest, RangedDownload)
{
    LocalStore store(root_);
    write_file("data.txt", "0123456789");

    auto res = store.download("/data.txt", 2, 6);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->content_length, 4u);
    EXPECT_EQ(res->metadata.size, 10u);

    std::vector<std::byte> buffer(16);
    auto n = cupload::adapters::read_full(*res->body, buffer);
    ASSERT_TRUE(n.has_value());
    ASSERT_EQ(*n, 4u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buffer.data()), *n), "2345");

    EXPECT_EQ(store.download("/data.txt", 8, 4).error().code, ErrorCode::InvalidArgument);
}

TEST_F(LocalStoreTest, FullSessionRoundTripThroughUploadSession)
{
    auto store = std::make_shared<LocalStore>(root_);
    const auto data = cupload::testing::make_pattern(5 * 1024 * 1024 + 17);

    auto session = cupload::core::UploadSession::create(store);
    ASSERT_TRUE(session.has_value());
    cupload::adapters::MemorySource source(data);
    cupload::core::UploadOptions options;
    options.blocks_per_request = 1;
    options.parallelism = 3;
    ASSERT_TRUE(session->upload(source, options).has_value());

    auto meta = session->commit({.path = "/big.bin"});
    ASSERT_TRUE(meta.has_value()) << meta.error().message;
    EXPECT_EQ(meta->content_hash, ContentHash::of(data).finish_hex());
    EXPECT_EQ(fs::file_size(root_ / "big.bin"), data.size());
}
