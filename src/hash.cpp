#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

namespace {

EvpMdCtxPtr new_sha256_context() {
    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw PipkinException(get_string("error.openssl_ctx_failed"));
    }
    if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw PipkinException(get_string("error.openssl_init_failed"));
    }
    return md_ctx;
}

std::string finish_digest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        throw PipkinException(get_string("error.openssl_final_failed"));
    }
    return std::string(reinterpret_cast<const char*>(hash), hash_len);
}

} // anonymous namespace

std::string calculate_sha256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw PipkinException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx = new_sha256_context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(md_ctx.get(), buffer, file.gcount()) != 1) {
            throw PipkinException(get_string("error.openssl_update_failed"));
        }
    }

    const std::string digest = finish_digest(md_ctx.get());
    std::stringstream ss;
    for (unsigned char c : digest) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }

    return ss.str();
}

std::string sha256_digest(std::string_view data) {
    EvpMdCtxPtr md_ctx = new_sha256_context();
    if (EVP_DigestUpdate(md_ctx.get(), data.data(), data.size()) != 1) {
        throw PipkinException(get_string("error.openssl_update_failed"));
    }
    return finish_digest(md_ctx.get());
}

std::string record_hash(std::string_view data) {
    std::string encoded;
    try {
        encoded = base64_encode(sha256_digest(data));
    } catch (const PipkinException& e) {
        throw MalformedMetadata(string_format("error.hash_failed", e.what()));
    }
    for (char& c : encoded) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!encoded.empty() && encoded.back() == '=') encoded.pop_back();
    return "sha256=" + encoded;
}

std::string base64_encode(std::string_view data) {
    if (data.empty()) return {};
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                    static_cast<int>(data.size()));
    if (len < 0) {
        throw PipkinException(get_string("error.base64_failed"));
    }
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::string base64_decode(std::string_view data) {
    if (data.empty()) return {};
    if (data.size() % 4 != 0) {
        throw PipkinException(get_string("error.base64_failed"));
    }
    std::vector<unsigned char> out(3 * (data.size() / 4) + 1);
    const int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                    static_cast<int>(data.size()));
    if (len < 0) {
        throw PipkinException(get_string("error.base64_failed"));
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (data.back() == '=') ++padding;
    if (data.size() > 1 && data[data.size() - 2] == '=') ++padding;
    return std::string(reinterpret_cast<const char*>(out.data()), len - padding);
}
