#include "digest.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string sha256_hex(const std::string& data) {
    EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!context) throw std::runtime_error("Failed to create digest context");

    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256 digest");
    }
    if (EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256 digest");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("Failed to finalize SHA256 digest");
    }

    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; i++) {
        out += HEX[hash[i] >> 4];
        out += HEX[hash[i] & 0x0F];
    }
    return out;
}
