#include "selector_hints.h"
#include "../common/string_utils.h"
#include <regex>
#include <algorithm>

namespace mender {

bool SelectorHints::empty() const {
    return !tag && !id && classes.empty() && !text && attributes.empty();
}

SelectorHints extractSelectorHints(const std::string& selector) {
    static const std::regex idPattern(R"(#([\w-]+))");
    static const std::regex classPattern(R"(\.([\w-]+))");
    static const std::regex tagPattern(R"(^(\w+))");
    static const std::regex attributePattern(R"(\[(\w[\w-]*)=['"](.*?)['"]\])");
    static const std::regex textPattern(R"(:(?:has-text|contains)\(['"](.*?)['"]\))");

    SelectorHints hints;
    std::smatch match;

    if (std::regex_search(selector, match, idPattern)) {
        hints.id = match[1].str();
    }

    for (auto it = std::sregex_iterator(selector.begin(), selector.end(), classPattern);
         it != std::sregex_iterator(); ++it) {
        std::string cls = (*it)[1].str();
        if (std::find(hints.classes.begin(), hints.classes.end(), cls) == hints.classes.end()) {
            hints.classes.push_back(cls);
        }
    }

    if (std::regex_search(selector, match, tagPattern)) {
        hints.tag = utils::StringUtils::toLowerCase(match[1].str());
    }

    for (auto it = std::sregex_iterator(selector.begin(), selector.end(), attributePattern);
         it != std::sregex_iterator(); ++it) {
        hints.attributes[(*it)[1].str()] = (*it)[2].str();
    }

    if (std::regex_search(selector, match, textPattern)) {
        hints.text = match[1].str();
    }

    return hints;
}

std::vector<std::string> generateSelectorVariations(const std::string& selector) {
    std::vector<std::string> variations;
    SelectorHints hints = extractSelectorHints(selector);

    if (hints.id) {
        const std::string& id = *hints.id;
        variations.push_back("[data-testid=\"" + id + "\"]");
        variations.push_back("[aria-label=\"" + id + "\"]");
        variations.push_back("[name=\"" + id + "\"]");
    }

    if (!hints.classes.empty()) {
        const std::string& cls = hints.classes.front();
        variations.push_back(hints.tag.value_or("*") + "." + cls);
        variations.push_back("[class*=\"" + cls + "\"]");
    }

    return variations;
}

} // namespace mender
