#ifndef MENDER_SELF_HEALING_H
#define MENDER_SELF_HEALING_H

#include <string>
#include <vector>
#include <optional>
#include "selector_hints.h"
#include "../dispatcher/page_session.h"
#include "../executor/action_executor.h"
#include "../common/types.h"

namespace mender {

// Snapshot strategies, in the order they are tried.
enum class HealingStrategy {
    ATTRIBUTE_FALLBACK,     // data-testid / aria-label / name / role
    STRUCTURAL_NAVIGATION,  // tag plus at least one exact class
    TEXT_CONTENT,           // visible text contains the hinted text
    PARTIAL_CLASS           // tag plus a class containing, or contained by, a hinted class
};

std::string healingStrategyToString(HealingStrategy strategy);

struct HealingMatch {
    std::string selector;
    HealingStrategy strategy;
};

/**
 * @class SelfHealingResolver
 * @brief Finds live replacements for selectors that stopped matching
 *
 * The snapshot strategies are pure functions of the broken selector and a DOM
 * snapshot. The live operations (detectUIChange, findElementWithHealing,
 * resolveAndRetry, typeWithHealing) probe the page through the dispatcher,
 * fall back to vision, and hold the session's healing lock for their whole
 * run; a concurrent resolution on the same session is refused immediately.
 */
class SelfHealingResolver {
public:
    SelfHealingResolver(IActionDispatcher& dispatcher,
                        ActionExecutor& executor,
                        HealingSettings settings = HealingSettings());
    ~SelfHealingResolver() = default;

    // Snapshot healing
    std::optional<HealingMatch> healSelectorWithStrategy(const std::string& failedSelector,
                                                         const DomSnapshot& snapshot) const;
    std::optional<std::string> healSelector(const std::string& failedSelector,
                                            const DomSnapshot& snapshot) const;

    /**
     * @brief Weighted fuzzy match over the whole snapshot
     *
     * Scores: tag 2, id 5, each shared class 1, text containment 3. The first
     * best-scoring element wins if its score reaches the similarity threshold.
     */
    std::optional<std::string> findSimilarElement(const std::string& brokenSelector,
                                                  const DomSnapshot& snapshot) const;

    // Live healing
    UIChangeReport detectUIChange(const std::string& expectedSelector);

    /**
     * @brief Live probe, selector variations, snapshot strategies, then vision
     * @throws MenderException HEALING_EXHAUSTED when every stage fails,
     *         CONTRACT_VIOLATION when another resolution holds the session
     */
    Target findElementWithHealing(const std::string& selector,
                                  const std::string& description,
                                  IVisionCollaborator& vision);

    // Click the target, healing and clicking again on failure. Never throws.
    ActionResult resolveAndRetry(const Target& target,
                                 const std::string& description,
                                 IVisionCollaborator& vision);

    // Type into the selector, healing and typing again on failure. Never throws.
    ActionResult typeWithHealing(const std::string& selector,
                                 const std::string& text,
                                 IVisionCollaborator& vision);

    const HealingSettings& settings() const { return m_settings; }

private:
    IActionDispatcher& m_dispatcher;
    ActionExecutor& m_executor;
    HealingSettings m_settings;

    Target locateWithHealing(const std::string& selector,
                             const std::string& description,
                             IVisionCollaborator& vision);
    ActionResult typeAtResolvedTarget(const Target& target, const std::string& text);
    ActionResult busyResult(const std::string& operation) const;

    // Strategies
    static std::optional<std::string> findByAttributes(const std::vector<VisibleElement>& elements,
                                                       const SelectorHints& hints);
    static std::optional<std::string> findByStructure(const std::vector<VisibleElement>& elements,
                                                      const SelectorHints& hints);
    static std::optional<std::string> findByTextContent(const std::vector<VisibleElement>& elements,
                                                        const SelectorHints& hints);
    static std::optional<std::string> findByPartialClass(const std::vector<VisibleElement>& elements,
                                                         const SelectorHints& hints);
};

} // namespace mender

#endif // MENDER_SELF_HEALING_H
