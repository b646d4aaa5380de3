// Orexa - Game Server Supervisor
// Common type helpers

#include "orexa/core/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace orexa {
namespace core {

const char* instanceStatusToString(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::Installing: return "Installing";
        case InstanceStatus::Stopped:    return "Stopped";
        case InstanceStatus::Booting:    return "Booting";
        case InstanceStatus::Running:    return "Running";
        case InstanceStatus::Crashed:    return "Crashed";
        case InstanceStatus::Error:      return "Error";
    }
    return "Unknown";
}

std::optional<InstanceStatus> parseInstanceStatus(const std::string& str) {
    if (str == "Installing") return InstanceStatus::Installing;
    if (str == "Stopped") return InstanceStatus::Stopped;
    if (str == "Booting") return InstanceStatus::Booting;
    if (str == "Running") return InstanceStatus::Running;
    if (str == "Crashed") return InstanceStatus::Crashed;
    if (str == "Error") return InstanceStatus::Error;
    return std::nullopt;
}

std::string formatFileSize(uint64_t bytes) {
    const uint64_t unit = 1024;
    char buf[64];
    if (bytes < unit) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
        return buf;
    }

    static const char suffixes[] = "KMGTPE";
    uint64_t div = unit;
    int exp = 0;
    for (uint64_t n = bytes / unit; n >= unit && exp < 5; n /= unit) {
        div *= unit;
        ++exp;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %cB",
                  static_cast<double>(bytes) / static_cast<double>(div), suffixes[exp]);
    return buf;
}

std::string sanitizeName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (c == ' ') {
            result += '_';
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '-' || c == '.') {
            result += c;
        }
    }
    if (result.empty()) {
        return "server";
    }
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return str.substr(start, end - start);
}

std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace core
} // namespace orexa
