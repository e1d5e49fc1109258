/**
 * Segue Engine - Content Hash Implementation
 *
 * Uses OpenSSL's EVP digest interface.
 */

#include "content_hash.h"

#include <openssl/evp.h>

#include <fstream>
#include <vector>
#include <memory>

namespace segue {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

Result<std::string> hash_file_prefix(const std::string& path, size_t prefix_bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ResultError("Cannot open file for hashing: " + path);
    }

    std::vector<char> data(prefix_bytes);
    file.read(data.data(), static_cast<std::streamsize>(prefix_bytes));
    size_t length = static_cast<size_t>(file.gcount());
    if (file.bad()) {
        return ResultError("Read failed while hashing: " + path);
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return ResultError("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), length) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return ResultError("SHA-256 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

} // namespace segue
