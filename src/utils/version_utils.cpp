/**
 * @file version_utils.cpp
 * @brief Implementation of database version parsing and ordering
 *
 * @date 2025
 */

#include "attributor/utils/version_utils.hpp"
#include "attributor/utils/string_utils.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace attributor {
namespace utils {

namespace {

int ParseComponent(const std::string& field, const std::string& text) {
    auto trimmed = StringUtils::Trim(field);
    if (trimmed.empty()) {
        throw std::invalid_argument("Empty component in database version: '" + text + "'");
    }
    for (unsigned char c : trimmed) {
        if (!std::isdigit(c)) {
            throw std::invalid_argument("Non-numeric component in database version: '" + text + "'");
        }
    }
    try {
        return std::stoi(trimmed);
    }
    catch (const std::out_of_range&) {
        throw std::invalid_argument("Component out of range in database version: '" + text + "'");
    }
}

} // anonymous namespace

DatabaseVersion DatabaseVersion::Parse(const std::string& text) {
    auto body = StringUtils::Trim(text);
    if (!body.empty() && body.front() == '(') {
        body.erase(body.begin());
    }
    if (!body.empty() && body.back() == ')') {
        body.pop_back();
    }

    auto fields = StringUtils::Split(body, ',', true);
    if (fields.size() != 3) {
        throw std::invalid_argument("Database version must have three components: '" + text + "'");
    }

    DatabaseVersion version;
    version.major_version = ParseComponent(fields[0], text);
    version.minor_version = ParseComponent(fields[1], text);
    version.micro_version = ParseComponent(fields[2], text);
    return version;
}

std::string DatabaseVersion::ToString() const {
    std::ostringstream oss;
    oss << "(" << major_version << ", " << minor_version << ", " << micro_version << ")";
    return oss.str();
}

DatabaseVersion DatabaseVersion::NextMicro() const {
    DatabaseVersion next = *this;
    ++next.micro_version;
    return next;
}

bool DatabaseVersion::operator==(const DatabaseVersion& other) const {
    return std::tie(major_version, minor_version, micro_version) ==
           std::tie(other.major_version, other.minor_version, other.micro_version);
}

bool DatabaseVersion::operator!=(const DatabaseVersion& other) const {
    return !(*this == other);
}

bool DatabaseVersion::operator<(const DatabaseVersion& other) const {
    return std::tie(major_version, minor_version, micro_version) <
           std::tie(other.major_version, other.minor_version, other.micro_version);
}

bool DatabaseVersion::operator>(const DatabaseVersion& other) const {
    return other < *this;
}

std::string IncrementDatabaseVersion(const std::string& database_version) {
    return DatabaseVersion::Parse(database_version).NextMicro().ToString();
}

} // namespace utils
} // namespace attributor
