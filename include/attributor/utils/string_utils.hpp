/**
 * @file string_utils.hpp
 * @brief String helpers for semantic-id derivation and incident tokenization
 *
 * Small set of splitting, joining and normalization helpers shared by the
 * STIX parser, the incident synthesizer and the text classifier.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace attributor {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // "T1003.001" -> "T1003"
 * auto technique = StringUtils::FirstSegment("T1003.001", '.');
 *
 * // "Cobalt Strike" -> "CobaltStrike"
 * auto compact = StringUtils::RemoveChar("Cobalt Strike", ' ');
 *
 * auto tokens = StringUtils::Split("malware-X tool-Y", ' ');
 * auto incident = StringUtils::Join(tokens, " ");
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Manipulation
     ***************************************************************************/

    /**
     * @brief Trim leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Remove every occurrence of a character
     * @param str Input string
     * @param ch Character to drop
     * @return Copy of str without ch
     */
    static std::string RemoveChar(const std::string& str, char ch);

    /**
     * @brief Split string by delimiter
     *
     * Empty tokens (from leading, trailing or doubled delimiters) are skipped
     * unless keep_empty is set.
     *
     * @param str String to split
     * @param delimiter Delimiter character
     * @param keep_empty Keep empty tokens between delimiters
     * @return Vector of tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter,
                                          bool keep_empty = false);

    /**
     * @brief Text before the first delimiter (whole string if absent)
     *
     * Matches splitting on the delimiter and keeping the first field, so
     * ".001" yields an empty string.
     */
    static std::string FirstSegment(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Check if string starts with prefix
     */
    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief True when the string is empty or whitespace only
     */
    static bool IsBlank(const std::string& str);
};

} // namespace utils
} // namespace attributor
