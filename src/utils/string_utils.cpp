/**
 * @file string_utils.cpp
 * @brief Implementation of the shared string helpers
 *
 * **Quoting Rules**:
 * Backend command lines are executed through `/bin/sh -c`, so any argument
 * token carrying whitespace is wrapped in single quotes:
 * ```
 * echo hello world   ->  echo 'hello world'
 * ```
 *
 * **Environment Keys**:
 * Only `[A-Za-z0-9_.-]` survives filtering; other characters are removed
 * rather than rejected, which makes filtering idempotent.
 *
 * @date 2025
 */

#include "dockhand/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace dockhand {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================
// Basic string operations: trimming, splitting, joining, replacing

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter,
                                            bool keep_empty) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (keep_empty || !token.empty()) {
            tokens.push_back(token);
        }
    }

    // getline drops a trailing empty field ("a=" -> {"a"})
    if (keep_empty && !str.empty() && str.back() == delimiter) {
        tokens.emplace_back();
    }

    return tokens;
}

// Split string by separator string
std::vector<std::string> StringUtils::Split(const std::string& str, const std::string& separator) {
    std::vector<std::string> tokens;
    if (separator.empty()) {
        tokens.push_back(str);
        return tokens;
    }

    std::size_t start = 0;
    std::size_t pos = 0;
    while ((pos = str.find(separator, start)) != std::string::npos) {
        tokens.push_back(str.substr(start, pos - start));
        start = pos + separator.length();
    }
    tokens.push_back(str.substr(start));

    return tokens;
}

// Split by any whitespace
std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::HasWhitespace(const std::string& str) {
    return std::any_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

// ============================================================================
// SHELL AND IDENTIFIER HANDLING
// ============================================================================

std::string StringUtils::QuoteIfWhitespace(const std::string& token) {
    if (!HasWhitespace(token) && !Contains(token, "'")) {
        return token;
    }
    return "'" + ReplaceAll(token, "'", "'\\''") + "'";
}

std::string StringUtils::FilterEnvKey(const std::string& key) {
    std::string result;
    result.reserve(key.size());

    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '_' || c == '.' || c == '-') {
            result.push_back(static_cast<char>(c));
        }
    }

    return result;
}

// ============================================================================
// STRING ENCODING CONVERSIONS
// ============================================================================

// Convert to Base64
std::string StringUtils::ToBase64(const std::string& str) {
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    unsigned int val = 0;
    int valb = -6;

    for (unsigned char c : str) {
        val = (val << 8) + c;
        valb += 8;

        while (valb >= 0) {
            result.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

std::string StringUtils::UrlEncode(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return oss.str();
}

} // namespace utils
} // namespace dockhand
