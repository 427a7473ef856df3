/**
 * @file version_utils.hpp
 * @brief Database/model version triple handling
 *
 * Model artifacts carry a "(major, minor, micro)" version string. This header
 * provides parsing, formatting, ordering and the micro increment used when a
 * training run is handed a newer database version.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace attributor {
namespace utils {

/// Version written into artifacts produced by this code base
inline constexpr const char* kBaselineDatabaseVersion = "(0, 0, 1)";

/**
 * @struct DatabaseVersion
 * @brief (major, minor, micro) triple
 */
struct DatabaseVersion {
    int major_version{0};
    int minor_version{0};
    int micro_version{0};

    /**
     * @brief Parse "(1, 2, 3)"; parentheses and spaces are optional
     * @throws std::invalid_argument unless exactly three non-negative integers are present
     */
    static DatabaseVersion Parse(const std::string& text);

    /**
     * @brief Format as "(major, minor, micro)"
     */
    std::string ToString() const;

    /**
     * @brief Copy with micro incremented by one
     */
    DatabaseVersion NextMicro() const;

    bool operator==(const DatabaseVersion& other) const;
    bool operator!=(const DatabaseVersion& other) const;
    bool operator<(const DatabaseVersion& other) const;
    bool operator>(const DatabaseVersion& other) const;
};

/**
 * @brief Increment only the micro field of a version string
 *
 * @code
 * IncrementDatabaseVersion("(1, 2, 2)");  // "(1, 2, 3)"
 * @endcode
 *
 * @throws std::invalid_argument on malformed input
 */
std::string IncrementDatabaseVersion(const std::string& database_version);

} // namespace utils
} // namespace attributor
