#include "driftwatch/hashing.hpp"
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace driftwatch {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext new_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const char* data, size_t size) {
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 digest update failed");
    }
}

std::string finish(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        throw std::runtime_error("SHA-256 digest finalization failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace

std::string sha256_hex(const std::string& data) {
    auto ctx = new_sha256_context();
    update(ctx.get(), data.data(), data.size());
    return finish(ctx.get());
}

std::string sha256_hex(const std::vector<std::string>& parts) {
    auto ctx = new_sha256_context();
    for (const auto& part : parts) {
        // Length prefix keeps ("ab","c") and ("a","bc") apart
        std::string prefix = std::to_string(part.size()) + ":";
        update(ctx.get(), prefix.data(), prefix.size());
        update(ctx.get(), part.data(), part.size());
    }
    return finish(ctx.get());
}

std::string file_sha256_hex(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for hashing: " + path);
    }

    auto ctx = new_sha256_context();
    std::array<char, 8192> buffer{};
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize got = file.gcount();
        if (got > 0) {
            update(ctx.get(), buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing: " + path);
    }
    return finish(ctx.get());
}

} // namespace driftwatch
