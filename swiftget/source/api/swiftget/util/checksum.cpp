#include "swiftget/util/checksum.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cstdio>
#include <memory>
#include <fmt/format.h>
#include <borealis/core/logger.hpp>

namespace swiftget {

HashAlgorithm detectHashAlgorithm(const std::string& hexDigest) {
    if (hexDigest.size() == 32) return HashAlgorithm::MD5;
    return HashAlgorithm::SHA256;
}

const char* hashAlgorithmName(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::MD5 ? "MD5" : "SHA-256";
}

Result<std::string> computeFileDigest(const std::string& path, HashAlgorithm algorithm, const CancelToken& token) {
    std::unique_ptr<std::FILE, int (*)(std::FILE*)> file(std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!file) {
        return Error{ErrorKind::Resource, fmt::format("cannot open {} for hashing", path)};
    }

    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    const EVP_MD* md = algorithm == HashAlgorithm::MD5 ? EVP_md5() : EVP_sha256();
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return Error{ErrorKind::Resource, "failed to initialise digest context"};
    }

    constexpr size_t BUFFER_SIZE = 64 * 1024;
    std::unique_ptr<unsigned char[]> buffer(new unsigned char[BUFFER_SIZE]);
    size_t bytesRead = 0;
    while ((bytesRead = std::fread(buffer.get(), 1, BUFFER_SIZE, file.get())) > 0) {
        if (token.isCancelled()) return Error{ErrorKind::Cancelled, "hashing cancelled"};
        if (EVP_DigestUpdate(ctx.get(), buffer.get(), bytesRead) != 1) {
            return Error{ErrorKind::Resource, "digest update failed"};
        }
    }
    if (std::ferror(file.get())) {
        return Error{ErrorKind::Resource, fmt::format("read error while hashing {}", path)};
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLength) != 1) {
        return Error{ErrorKind::Resource, "digest finalisation failed"};
    }

    std::string hex;
    hex.reserve(hashLength * 2);
    for (unsigned int i = 0; i < hashLength; i++) {
        hex += fmt::format("{:02x}", hash[i]);
    }
    return hex;
}

bool digestsEqual(const std::string& expected, const std::string& actual) {
    if (expected.size() != actual.size()) return false;
    for (size_t i = 0; i < expected.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(expected[i])) !=
            std::tolower(static_cast<unsigned char>(actual[i])))
            return false;
    }
    return true;
}

Status verifyFileDigest(const std::string& path, const std::string& expectedHex, const CancelToken& token) {
    HashAlgorithm algorithm = detectHashAlgorithm(expectedHex);
    brls::Logger::info("Checksum: Verifying {} of {}", hashAlgorithmName(algorithm), path);

    auto actual = computeFileDigest(path, algorithm, token);
    if (!actual) return actual.error();
    if (!digestsEqual(expectedHex, actual.value())) {
        brls::Logger::error("Checksum: Mismatch for {}: expected {}, got {}", path, expectedHex, actual.value());
        return Error{ErrorKind::ChecksumMismatch,
                     fmt::format("{} mismatch: expected {}, got {}", hashAlgorithmName(algorithm), expectedHex,
                                 actual.value())};
    }
    brls::Logger::debug("Checksum: {} verified", path);
    return {};
}

}  // namespace swiftget
