#pragma once

#include "RuleModel.h"

#include <string>

namespace DigestUtils {

/**
 * @brief Lower-case hex digest of `input` (64 chars for sha256, 128 for sha512, 32 for md5).
 * @throws Obscura::ObscuraException when the OpenSSL digest context fails.
 */
std::string hexDigest(const std::string& input, HashAlgorithm algorithm);

// First 8 bytes of SHA-256(input), big-endian.
uint64_t digest64(const std::string& input);

} // namespace DigestUtils
