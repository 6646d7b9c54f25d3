#pragma once

#include <string>

#include "core/Result.hpp"
#include "utils/cancel_token.hpp"

namespace swiftget {

enum class HashAlgorithm { MD5, SHA256 };

// 32 hex chars => MD5, 64 => SHA-256, anything else falls back to SHA-256.
HashAlgorithm detectHashAlgorithm(const std::string& hexDigest);

const char* hashAlgorithmName(HashAlgorithm algorithm);

// Lower-case hex digest of a file's full contents.
Result<std::string> computeFileDigest(const std::string& path, HashAlgorithm algorithm,
                                      const CancelToken& token = CancelToken{});

bool digestsEqual(const std::string& expected, const std::string& actual);

// ChecksumMismatch unless the file hashes to expectedHex (algorithm picked from its length).
Status verifyFileDigest(const std::string& path, const std::string& expectedHex,
                        const CancelToken& token = CancelToken{});

}  // namespace swiftget
