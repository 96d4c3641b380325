#include "string_utils.h"
#include <algorithm>
#include <cctype>

namespace mender {
namespace utils {

std::string StringUtils::replaceChars(const std::string& str, const std::string& chars, char replacement) {
    std::string result = str;
    for (char& c : result) {
        if (chars.find(c) != std::string::npos) {
            c = replacement;
        }
    }
    return result;
}

std::string StringUtils::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, (last - first + 1));
}

std::vector<std::string> StringUtils::splitWhitespace(const std::string& str) {
    std::vector<std::string> result;
    std::string current;

    for (char c : str) {
        if (isWhitespace(c)) {
            if (!current.empty()) {
                result.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        result.push_back(current);
    }
    return result;
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::toUpperCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool StringUtils::containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    return toLowerCase(haystack).find(toLowerCase(needle)) != std::string::npos;
}

std::string StringUtils::join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

bool StringUtils::isWhitespace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace utils
} // namespace mender
