#ifndef MENDER_SELECTOR_HINTS_H
#define MENDER_SELECTOR_HINTS_H

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace mender {

// Structured pieces recovered from a CSS selector that stopped matching.
struct SelectorHints {
    std::optional<std::string> tag;          // lowercased
    std::optional<std::string> id;
    std::vector<std::string> classes;        // distinct, in selector order
    std::optional<std::string> text;         // from :has-text("...") / :contains("...")
    std::map<std::string, std::string> attributes;

    bool empty() const;
};

/**
 * @brief Parse a selector into hints
 *
 * Recognized pieces: a leading tag name, the first #id, every .class,
 * [name="value"] / [name='value'] attribute tests, and a :has-text() or
 * :contains() text hint. Anything else is ignored.
 */
SelectorHints extractSelectorHints(const std::string& selector);

/**
 * @brief Attribute-based rewrites of a broken selector to probe live
 *
 * For an id: [data-testid="id"], [aria-label="id"], [name="id"].
 * For the first class: tag.class and [class*="class"] (tag defaults to *).
 */
std::vector<std::string> generateSelectorVariations(const std::string& selector);

} // namespace mender

#endif // MENDER_SELECTOR_HINTS_H
