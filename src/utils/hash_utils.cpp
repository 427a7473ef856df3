/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 hashing via the OpenSSL EVP interface
 *
 * Files are streamed through a digest context so large classifier blobs are
 * never loaded twice.
 *
 * **Error Handling**:
 * - File not found / read errors: throws std::runtime_error
 * - OpenSSL errors: throws std::runtime_error
 * - VerifyFileHash(): logs and returns false instead of throwing
 *
 * @date 2025
 */

#include "attributor/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace attributor {
namespace utils {

namespace {

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

/**
 * @brief Convert binary data to hexadecimal string
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

DigestContext NewSha256Context() {
    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    return context;
}

std::string FinalizeDigest(EVP_MD_CTX* context) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context, hash, &length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return BinaryToHex(hash, length);
}

std::string ToLowerHex(std::string hex) {
    std::transform(hex.begin(), hex.end(), hex.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return hex;
}

} // anonymous namespace

// Compute SHA256 hash (file)
std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    auto context = NewSha256Context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(context.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("Failed to hash file: " + file_path.string());
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    return FinalizeDigest(context.get());
}

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto context = NewSha256Context();
    if (EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to hash data");
    }
    return FinalizeDigest(context.get());
}

// Verify file hash
bool HashUtils::VerifyFileHash(const std::filesystem::path& file_path,
                               const std::string& expected_hash,
                               const std::shared_ptr<spdlog::logger>& logger) {
    try {
        return ToLowerHex(ComputeSHA256(file_path)) == ToLowerHex(expected_hash);
    }
    catch (const std::exception& e) {
        logger->error("Hash verification failed: {}", e.what());
        return false;
    }
}

} // namespace utils
} // namespace attributor
