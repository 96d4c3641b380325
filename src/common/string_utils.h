#ifndef MENDER_STRING_UTILS_H
#define MENDER_STRING_UTILS_H

#include <string>
#include <vector>

namespace mender {
namespace utils {

/**
 * @brief String helpers shared by the selector parser, the healing strategies
 * and the error classifier
 */
class StringUtils {
public:
    /**
     * @brief Replace every character contained in @p chars with @p replacement
     * @param str Source string
     * @param chars Set of characters to replace
     * @param replacement Character written in their place
     * @return Modified string
     */
    static std::string replaceChars(const std::string& str, const std::string& chars, char replacement);

    /**
     * @brief Remove leading and trailing whitespace from string
     * @param str String to trim
     * @return Trimmed string
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Split on runs of whitespace, dropping empty tokens
     * @param str String to split
     * @return Tokens in order of appearance (empty for blank input)
     */
    static std::vector<std::string> splitWhitespace(const std::string& str);

    /**
     * @brief Convert string to lowercase (ASCII)
     */
    static std::string toLowerCase(const std::string& str);

    /**
     * @brief Convert string to uppercase (ASCII)
     */
    static std::string toUpperCase(const std::string& str);

    /**
     * @brief Case-insensitive substring test
     * @param haystack Text to search in
     * @param needle Text to look for
     * @return true if @p needle occurs in @p haystack ignoring ASCII case;
     *         an empty needle always matches
     */
    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

    /**
     * @brief Join vector of strings with delimiter
     * @param strings Strings to join (can be empty)
     * @param delimiter Delimiter to use between strings
     * @return Joined string
     */
    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace mender

#endif // MENDER_STRING_UTILS_H
