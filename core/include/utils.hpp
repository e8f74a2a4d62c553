#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // Timestamp -> "YYYY-MM-DDTHH:MM:SSZ" (UTC)
    std::string timestampToString(const Timestamp& ts);

    // Parses ISO 8601 with 'Z' or +HH:MM offset; throws std::runtime_error
    Timestamp stringToTimestamp(const std::string& iso_string);

    // "YYYY-MM-DD" <-> midnight UTC
    Timestamp dateToTimestamp(const std::string& date);
    std::string timestampToDate(const Timestamp& ts);

    // Whole calendar days between two instants (b - a)
    long long daysBetween(const Timestamp& a, const Timestamp& b);

    // Random RFC 4122 version 4 identifier
    std::string generateId();

    std::string toLower(std::string s);
    std::string trim(const std::string& s);

    // 64-bit FNV-1a, stable across runs and platforms
    std::uint64_t fnv1a(const std::string& data);

} // namespace utils
} // namespace core
