#include "utils.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <cmath>
#include <chrono>
#include <ctime>
#include <cctype>
#include <random>
#include <algorithm>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, digits.length());
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration = std::chrono::seconds(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else if (sign_or_z != 'Z') {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
            throw std::runtime_error("Timestamp missing timezone offset/indicator: " + iso_string);
        }

        // 4. timegm interprets struct tm as UTC
        time_t tt = timegm(&tm);
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        gmtime_r(&tt, &time_tm);

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    Timestamp dateToTimestamp(const std::string& date) {
        std::tm tm = {};
        std::istringstream ss(trim(date));
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
            throw std::runtime_error("Expected a YYYY-MM-DD date, got: '" + date + "'");
        }
        time_t tt = timegm(&tm);
        if (tt == (time_t)-1) {
            throw std::runtime_error("Date out of range: " + date);
        }
        return std::chrono::system_clock::from_time_t(tt);
    }

    std::string timestampToDate(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        gmtime_r(&tt, &time_tm);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    long long daysBetween(const Timestamp& a, const Timestamp& b) {
        return std::chrono::duration_cast<std::chrono::hours>(b - a).count() / 24;
    }

    std::string generateId() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<std::uint64_t> dist;
        std::uint64_t hi = dist(rng);
        std::uint64_t lo = dist(rng);
        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 1

        std::ostringstream oss;
        oss << std::hex << std::setfill('0')
            << std::setw(8) << (hi >> 32) << '-'
            << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
            << std::setw(4) << (hi & 0xFFFF) << '-'
            << std::setw(4) << (lo >> 48) << '-'
            << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
        return oss.str();
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::uint64_t fnv1a(const std::string& data) {
        std::uint64_t hash = 14695981039346656037ULL;
        for (unsigned char c : data) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        return hash;
    }

} // namespace utils
} // namespace core
