#include "DigestUtils.h"
#include "ObscuraExceptions.h"

#include <openssl/evp.h>

#include <memory>

namespace {
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

const EVP_MD* digestFor(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA512: return EVP_sha512();
        case HashAlgorithm::MD5: return EVP_md5();
    }
    return EVP_sha256();
}

unsigned int rawDigest(const std::string& input, HashAlgorithm algorithm, unsigned char* out) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    unsigned int len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), digestFor(algorithm), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &len) != 1) {
        throw Obscura::ObscuraException(std::string("OpenSSL ") + RuleModel::hashAlgorithmName(algorithm) +
                                        " digest failed");
    }
    return len;
}
} // namespace

namespace DigestUtils {

std::string hexDigest(const std::string& input, HashAlgorithm algorithm) {
    static const char* kHex = "0123456789abcdef";
    unsigned char md[EVP_MAX_MD_SIZE];
    const unsigned int len = rawDigest(input, algorithm, md);

    std::string out;
    out.reserve(static_cast<size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[(md[i] >> 4) & 0x0F]);
        out.push_back(kHex[md[i] & 0x0F]);
    }
    return out;
}

uint64_t digest64(const std::string& input) {
    unsigned char md[EVP_MAX_MD_SIZE];
    rawDigest(input, HashAlgorithm::SHA256, md);
    uint64_t key = 0;
    for (int i = 0; i < 8; ++i) {
        key = (key << 8) | static_cast<uint64_t>(md[i]);
    }
    return key;
}

} // namespace DigestUtils
