#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace agentrun::utils {

using TimePoint = std::chrono::system_clock::time_point;

// Splits on '\n'; a trailing newline does not produce an empty last line.
inline std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

inline std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

inline TimePoint Now() {
    return std::chrono::system_clock::now();
}

inline std::string FormatIsoUtc(TimePoint point) {
    const auto time = std::chrono::system_clock::to_time_t(point);
    std::tm utc_time{};
    gmtime_r(&time, &utc_time);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        point.time_since_epoch()).count() % 1000000;
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

inline double SecondsBetween(TimePoint start, TimePoint end) {
    return std::chrono::duration<double>(end - start).count();
}

// Random RFC 4122 version 4 identifier.
inline std::string GenerateUuid() {
    static const char* kChars = "0123456789abcdef";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id.push_back('-');
        }
        int nibble = dist(gen);
        if (i == 12) {
            nibble = 4;
        } else if (i == 16) {
            nibble = 8 + (nibble & 0x3);
        }
        id.push_back(kChars[nibble]);
    }
    return id;
}

inline std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

}  // namespace agentrun::utils
