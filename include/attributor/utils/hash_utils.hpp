/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests for model artifact integrity checks
 *
 * The trainer records the digest of the serialized classifier in the model
 * metadata; the attribution server recomputes it on load and rejects blobs
 * that do not match.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace attributor {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed hashing helpers
 *
 * Digests are returned as lowercase hexadecimal strings.
 *
 * **Usage Example**:
 * @code
 * auto digest = HashUtils::ComputeSHA256(blob_text);
 * if (!HashUtils::VerifyFileHash("data/model.json", digest)) {
 *     // treat blob as corrupted
 * }
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a file, streamed in 8KB chunks
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief SHA-256 of in-memory data
     * @throws std::runtime_error on OpenSSL failure
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Compare file digest against an expected hex digest
     *
     * Comparison is case-insensitive. Read failures are logged and reported
     * as a mismatch through @p logger.
     */
    static bool VerifyFileHash(const std::filesystem::path& file_path,
                               const std::string& expected_hash,
                               const std::shared_ptr<spdlog::logger>& logger = spdlog::default_logger());
};

} // namespace utils
} // namespace attributor
