#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include "extensions/resumer.hpp"
#include "infra/hash/fingerprint.hpp"

namespace fs = std::filesystem;
using cupload::extensions::ResumeInfo;
using cupload::infra::SourceFingerprint;

TEST(ResumeTokenTest, FormatAndParse)
{
    const cupload::core::UploadResume token{.session_id = "AAHq2x", .start_offset = 8388608};
    EXPECT_EQ(cupload::extensions::format_resume_token(token), "AAHq2x,8388608");

    auto parsed = cupload::extensions::parse_resume_token("AAHq2x,8388608");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->session_id, "AAHq2x");
    EXPECT_EQ(parsed->start_offset, 8388608u);
}

TEST(ResumeTokenTest, SplitsAtLastComma)
{
    auto parsed = cupload::extensions::parse_resume_token("a,b,c,42");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->session_id, "a,b,c");
    EXPECT_EQ(parsed->start_offset, 42u);
}

TEST(ResumeTokenTest, RejectsMalformedTokens)
{
    using cupload::extensions::parse_resume_token;
    EXPECT_EQ(parse_resume_token("no-comma").error().code, cupload::infra::ErrorCode::InvalidArgument);
    EXPECT_FALSE(parse_resume_token("id,").has_value());
    EXPECT_FALSE(parse_resume_token("id,12x").has_value());
    EXPECT_FALSE(parse_resume_token("id,-1").has_value());
    EXPECT_FALSE(parse_resume_token("id,99999999999999999999999").has_value());
}

class ResumeFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / fmt::format("cupload-resume-{}", std::random_device{}());
        fs::create_directories(dir_);
        source_ = dir_ / "source.bin";
        std::ofstream(source_, std::ios::binary) << std::string(5000, 'z');
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto make_info() -> ResumeInfo {
        return ResumeInfo{
            .token = {.session_id = "abc123", .start_offset = 4096},
            .source = source_,
            .destination = "/backup/source.bin",
            .total_bytes = 5000,
            .fingerprint = SourceFingerprint::to_hex(SourceFingerprint::of_file(source_).value()),
        };
    }

    fs::path dir_;
    fs::path source_;
};

TEST_F(ResumeFileTest, SaveLoadAndMatch)
{
    const auto file = dir_ / "state.yaml";
    ASSERT_TRUE(cupload::extensions::save_resume_info(make_info(), file).has_value());

    auto loaded = cupload::extensions::load_resume_info(file);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token.session_id, "abc123");
    EXPECT_EQ(loaded->token.start_offset, 4096u);
    EXPECT_EQ(loaded->destination, "/backup/source.bin");
    EXPECT_EQ(loaded->total_bytes, 5000u);
    EXPECT_TRUE(cupload::extensions::should_resume(*loaded, source_, "/backup/source.bin"));
    EXPECT_FALSE(cupload::extensions::should_resume(*loaded, source_, "/elsewhere.bin"));

    cupload::extensions::clear_resume_info(file);
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(ResumeFileTest, ChangedSourceIsNotResumed)
{
    const auto info = make_info();
    {
        std::fstream f(source_, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(10);
        f << 'Q';
    }
    EXPECT_FALSE(cupload::extensions::should_resume(info, source_, info.destination));

    std::ofstream(source_, std::ios::binary | std::ios::app) << "more";
    EXPECT_FALSE(cupload::extensions::should_resume(make_info(), source_, info.destination));
}

TEST_F(ResumeFileTest, MissingOrBrokenFileIsIgnored)
{
    EXPECT_FALSE(cupload::extensions::load_resume_info(dir_ / "absent.yaml").has_value());

    const auto broken = dir_ / "broken.yaml";
    std::ofstream(broken) << "resume: [unterminated\n";
    EXPECT_FALSE(cupload::extensions::load_resume_info(broken).has_value());

    const auto bad_token = dir_ / "bad_token.yaml";
    std::ofstream(bad_token) << "resume: nocomma\nsource: x\ndestination: /y\ntotal_bytes: 1\nfingerprint: 0\n";
    EXPECT_FALSE(cupload::extensions::load_resume_info(bad_token).has_value());
}

TEST_F(ResumeFileTest, UnstatablePathIsIgnored)
{
    std::optional<cupload::extensions::ResumeInfo> loaded;
    ASSERT_NO_THROW(loaded = cupload::extensions::load_resume_info(dir_ / std::string(300, 'r')));
    EXPECT_FALSE(loaded.has_value());
}

TEST_F(ResumeFileTest, FingerprintDependsOnHeadAndSize)
{
    auto a = SourceFingerprint::of_file(source_);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(SourceFingerprint::to_hex(*a).size(), 16u);
    EXPECT_EQ(*a, SourceFingerprint::of_file(source_).value());

    // Байт за пределами головы не влияет
    auto head_only = SourceFingerprint::of_file(source_, 100).value();
    {
        std::fstream f(source_, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(4000);
        f << 'Q';
    }
    EXPECT_EQ(SourceFingerprint::of_file(source_, 100).value(), head_only);

    EXPECT_EQ(SourceFingerprint::of_file(dir_ / "missing").error().code, cupload::infra::ErrorCode::NotFound);
}
