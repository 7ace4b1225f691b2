#include "core/digest.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace redactguard::digest {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string sha256_parts(std::string_view a, std::string_view b) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), a.data(), a.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), b.data(), b.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return utils::bytes_to_hex(hash, hash_len);
}

} // anonymous namespace

std::string sha256_hex(std::string_view input) {
    return sha256_parts(input, {});
}

std::string sha256_hex(std::string_view a, std::string_view b) {
    return sha256_parts(a, b);
}

} // namespace redactguard::digest
