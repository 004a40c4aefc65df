#include "content_hash.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>

namespace cupload::core {

namespace {

auto new_sha256_ctx() -> EVP_MD_CTX* {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
    return ctx;
}

auto copy_ctx(const EVP_MD_CTX* src) -> EVP_MD_CTX* {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx || EVP_MD_CTX_copy_ex(ctx, src) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
    }
    return ctx;
}

} // namespace

void ContentHash::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

ContentHash::ContentHash()
    : ctx_(new_sha256_ctx())
    , block_ctx_(new_sha256_ctx())
{}

ContentHash::~ContentHash() = default;

ContentHash::ContentHash(const ContentHash& other)
    : ctx_(copy_ctx(other.ctx_.get()))
    , block_ctx_(copy_ctx(other.block_ctx_.get()))
    , partial_(other.partial_)
{}

ContentHash& ContentHash::operator=(const ContentHash& other) {
    if (this != &other) {
        ContentHash tmp(other);
        *this = std::move(tmp);
    }
    return *this;
}

void ContentHash::update(std::span<const std::byte> bytes) {
    if (partial_ != 0) {
        const std::size_t take = std::min(BLOCK_SIZE - partial_, bytes.size());
        EVP_DigestUpdate(block_ctx_.get(), bytes.data(), take);
        partial_ += take;
        bytes = bytes.subspan(take);
        if (partial_ < BLOCK_SIZE) {
            return;
        }
        finish_block();
    }

    while (!bytes.empty()) {
        const std::size_t take = std::min(BLOCK_SIZE, bytes.size());
        EVP_DigestUpdate(block_ctx_.get(), bytes.data(), take);
        if (take == BLOCK_SIZE) {
            finish_block();
        } else {
            partial_ = take;
        }
        bytes = bytes.subspan(take);
    }
}

void ContentHash::update(std::string_view bytes) {
    update(std::as_bytes(std::span<const char>(bytes.data(), bytes.size())));
}

auto ContentHash::read_stream(adapters::ByteSource& source) -> infra::VoidResult {
    std::vector<std::byte> buffer(BLOCK_SIZE);
    for (;;) {
        auto n = source.read(buffer);
        if (!n) {
            if (n.error().code == infra::ErrorCode::Interrupted) {
                continue;
            }
            return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) {
            return {};
        }
        update(std::span<const std::byte>(buffer.data(), *n));
    }
}

auto ContentHash::finish() && -> Digest {
    if (partial_ != 0) {
        finish_block();
    }
    Digest out{};
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_.get(), out.data(), &len);
    return out;
}

auto ContentHash::finish_hex() && -> std::string {
    const auto digest = std::move(*this).finish();
    return to_hex(digest);
}

auto ContentHash::of(std::span<const std::byte> bytes) -> ContentHash {
    ContentHash hash;
    hash.update(bytes);
    return hash;
}

void ContentHash::finish_block() {
    unsigned char block_digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(block_ctx_.get(), block_digest, &len);
    EVP_DigestUpdate(ctx_.get(), block_digest, len);
    EVP_DigestInit_ex(block_ctx_.get(), EVP_sha256(), nullptr);
    partial_ = 0;
}

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    std::string result(bytes.size() * 2, '\0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        result[2 * i] = hex[bytes[i] >> 4];
        result[2 * i + 1] = hex[bytes[i] & 0xf];
    }
    return result;
}

} // namespace cupload::core
