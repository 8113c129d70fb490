#include "snapbucket/core/digest.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/net/http.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace snapbucket {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::vector<uint8_t> md5(std::span<const uint8_t> data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw Error("OpenSSL MD5 digest failed");
    }
    return std::vector<uint8_t>(digest, digest + len);
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

}  // namespace

std::string md5_base64(std::span<const uint8_t> data) {
    auto digest = md5(data);
    return net::base64_encode(std::span<const uint8_t>(digest.data(), digest.size()));
}

std::string md5_hex(std::span<const uint8_t> data) {
    return to_hex(md5(data));
}

std::string random_hex(size_t len) {
    std::vector<uint8_t> bytes(len);
    if (RAND_bytes(bytes.data(), static_cast<int>(len)) != 1) {
        throw Error("OpenSSL RAND_bytes failed");
    }
    return to_hex(bytes);
}

}  // namespace snapbucket
