/**
 * @file string_utils.hpp
 * @brief String helpers shared by the argument builders and response parsers
 *
 * Provides the small set of string operations the adapters need when turning
 * run specifications into backend invocations and backend output back into
 * domain objects: trimming, splitting, joining, shell quoting, character
 * filtering and the encodings used by the engine HTTP API.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace dockhand {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto parts = StringUtils::Split("env=prod,tier=web", ',');
 * auto word = StringUtils::QuoteIfWhitespace("hello world");  // 'hello world'
 * auto header = StringUtils::ToBase64(R"({"username":"ci"})");
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @param keep_empty Keep empty fields (e.g. "a=" yields {"a", ""})
     * @return Vector of fields
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter,
                                          bool keep_empty = false);

    /**
     * @brief Split string by a multi-character separator, keeping empty fields
     * @param str Input string
     * @param separator Separator string (must not be empty)
     * @return Vector of fields
     */
    static std::vector<std::string> Split(const std::string& str, const std::string& separator);

    /**
     * @brief Split by any whitespace
     * @param str Input string
     * @return Non-empty whitespace separated tokens
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /**
     * @brief Join strings with delimiter
     * @param strings Strings to join
     * @param delimiter Separator placed between elements
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace every occurrence of a substring
     * @param str Input string
     * @param from Substring to replace
     * @param to Replacement
     * @return Resulting string
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Check whether the string contains any whitespace character
     */
    static bool HasWhitespace(const std::string& str);

    /***************************************************************************
     * Shell and Identifier Handling
     ***************************************************************************/

    /**
     * @brief Wrap a token in single quotes when it contains whitespace
     *
     * Tokens without whitespace or single quotes are returned unchanged so
     * that the shell sees a single word either way. An embedded `'` is
     * written as `'\''` inside the quoted form.
     *
     * @param token Argument token
     * @return Token safe to place in a shell command line
     */
    static std::string QuoteIfWhitespace(const std::string& token);

    /**
     * @brief Keep only characters accepted in environment variable keys
     *
     * Retains [A-Za-z0-9_.-] and silently drops everything else.
     *
     * @param key Raw key
     * @return Filtered key (possibly empty)
     */
    static std::string FilterEnvKey(const std::string& key);

    /***************************************************************************
     * Encoding
     ***************************************************************************/

    /**
     * @brief Convert to Base64 (standard alphabet, padded)
     * @param str Input bytes
     * @return Base64 string
     */
    static std::string ToBase64(const std::string& str);

    /**
     * @brief Percent-encode a string for use in a URL query component
     * @param str Input string
     * @return Encoded string (unreserved characters kept as-is)
     */
    static std::string UrlEncode(const std::string& str);
};

} // namespace utils
} // namespace dockhand
