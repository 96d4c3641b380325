#include "self_healing.h"
#include "../vision/vision_fallback.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace mender {

namespace {

using utils::StringUtils;

const std::vector<std::string>& identifyingAttributes() {
    static const std::vector<std::string> keys = {"data-testid", "aria-label", "name", "role"};
    return keys;
}

bool tagMatches(const VisibleElement& element, const std::string& tag) {
    return StringUtils::toLowerCase(element.tag) == tag;
}

bool hasClass(const std::vector<std::string>& classes, const std::string& cls) {
    return std::find(classes.begin(), classes.end(), cls) != classes.end();
}

} // anonymous namespace

std::string healingStrategyToString(HealingStrategy strategy) {
    switch (strategy) {
        case HealingStrategy::ATTRIBUTE_FALLBACK: return "attribute_fallback";
        case HealingStrategy::STRUCTURAL_NAVIGATION: return "structural_navigation";
        case HealingStrategy::TEXT_CONTENT: return "text_content";
        case HealingStrategy::PARTIAL_CLASS: return "partial_class";
        default: return "unknown";
    }
}

SelfHealingResolver::SelfHealingResolver(IActionDispatcher& dispatcher,
                                         ActionExecutor& executor,
                                         HealingSettings settings)
    : m_dispatcher(dispatcher)
    , m_executor(executor)
    , m_settings(settings) {
}

// ---------------------------------------------------------------------------
// Snapshot healing
// ---------------------------------------------------------------------------

std::optional<HealingMatch> SelfHealingResolver::healSelectorWithStrategy(const std::string& failedSelector,
                                                                          const DomSnapshot& snapshot) const {
    SelectorHints hints = extractSelectorHints(failedSelector);
    const auto& elements = snapshot.visibleElements;

    using Matcher = std::optional<std::string> (*)(const std::vector<VisibleElement>&, const SelectorHints&);
    static const std::vector<std::pair<HealingStrategy, Matcher>> chain = {
        {HealingStrategy::ATTRIBUTE_FALLBACK, &SelfHealingResolver::findByAttributes},
        {HealingStrategy::STRUCTURAL_NAVIGATION, &SelfHealingResolver::findByStructure},
        {HealingStrategy::TEXT_CONTENT, &SelfHealingResolver::findByTextContent},
        {HealingStrategy::PARTIAL_CLASS, &SelfHealingResolver::findByPartialClass}
    };

    for (const auto& [strategy, matcher] : chain) {
        if (auto selector = matcher(elements, hints)) {
            SLOG_INFO().message("Selector healed")
                .context("session_id", m_dispatcher.session().id())
                .context("failed_selector", failedSelector)
                .context("healed_selector", *selector)
                .context("strategy", healingStrategyToString(strategy));
            return HealingMatch{*selector, strategy};
        }
    }

    SLOG_INFO().message("All healing strategies exhausted")
        .context("session_id", m_dispatcher.session().id())
        .context("failed_selector", failedSelector)
        .context("candidates", elements.size());
    return std::nullopt;
}

std::optional<std::string> SelfHealingResolver::healSelector(const std::string& failedSelector,
                                                             const DomSnapshot& snapshot) const {
    auto match = healSelectorWithStrategy(failedSelector, snapshot);
    if (!match) {
        return std::nullopt;
    }
    return match->selector;
}

std::optional<std::string> SelfHealingResolver::findSimilarElement(const std::string& brokenSelector,
                                                                   const DomSnapshot& snapshot) const {
    SelectorHints hints = extractSelectorHints(brokenSelector);

    int bestScore = 0;
    const VisibleElement* best = nullptr;

    for (const auto& element : snapshot.visibleElements) {
        int score = 0;

        if (hints.tag && tagMatches(element, *hints.tag)) score += 2;
        if (hints.id && element.hasAttribute("id", *hints.id)) score += 5;

        std::vector<std::string> classes = element.classes();
        for (const auto& cls : hints.classes) {
            if (hasClass(classes, cls)) score += 1;
        }

        if (hints.text && StringUtils::containsIgnoreCase(element.text, *hints.text)) score += 3;

        if (score > bestScore) {
            bestScore = score;
            best = &element;
        }
    }

    if (best == nullptr || bestScore < m_settings.similarityThreshold) {
        return std::nullopt;
    }
    return best->selector;
}

std::optional<std::string> SelfHealingResolver::findByAttributes(const std::vector<VisibleElement>& elements,
                                                                 const SelectorHints& hints) {
    for (const auto& element : elements) {
        for (const auto& key : identifyingAttributes()) {
            auto hinted = hints.attributes.find(key);
            if (hinted != hints.attributes.end() && element.hasAttribute(key, hinted->second)) {
                return element.selector;
            }
        }

        if (hints.id && (element.hasAttribute("data-testid", *hints.id) || element.hasAttribute("name", *hints.id))) {
            return element.selector;
        }
    }
    return std::nullopt;
}

std::optional<std::string> SelfHealingResolver::findByStructure(const std::vector<VisibleElement>& elements,
                                                                const SelectorHints& hints) {
    if (!hints.tag || hints.classes.empty()) {
        return std::nullopt;
    }

    for (const auto& element : elements) {
        if (!tagMatches(element, *hints.tag)) continue;

        std::vector<std::string> classes = element.classes();
        for (const auto& cls : hints.classes) {
            if (hasClass(classes, cls)) {
                return element.selector;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> SelfHealingResolver::findByTextContent(const std::vector<VisibleElement>& elements,
                                                                  const SelectorHints& hints) {
    std::string token;
    if (hints.text) {
        token = *hints.text;
    } else {
        std::string source = hints.id ? *hints.id : StringUtils::join(hints.classes, " ");
        token = StringUtils::replaceChars(source, "-_", ' ');
    }
    token = StringUtils::trim(token);
    if (token.empty()) {
        return std::nullopt;
    }

    for (const auto& element : elements) {
        if (!element.text.empty() && StringUtils::containsIgnoreCase(element.text, token)) {
            return element.selector;
        }
    }
    return std::nullopt;
}

std::optional<std::string> SelfHealingResolver::findByPartialClass(const std::vector<VisibleElement>& elements,
                                                                   const SelectorHints& hints) {
    if (!hints.tag || hints.classes.empty()) {
        return std::nullopt;
    }

    for (const auto& element : elements) {
        if (!tagMatches(element, *hints.tag)) continue;

        for (const auto& cls : element.classes()) {
            for (const auto& hinted : hints.classes) {
                if (cls.find(hinted) != std::string::npos || hinted.find(cls) != std::string::npos) {
                    return element.selector;
                }
            }
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Live healing
// ---------------------------------------------------------------------------

UIChangeReport SelfHealingResolver::detectUIChange(const std::string& expectedSelector) {
    UIChangeReport report;

    auto guard = m_dispatcher.session().tryAcquireHealing();
    if (!guard.owns_lock()) {
        report.changed = true;
        report.confidence = 0.0;
        report.description = "Error detecting UI change: another healing resolution is in progress";
        return report;
    }

    try {
        if (m_dispatcher.isElementVisible(expectedSelector)) {
            report.changed = false;
            report.confidence = 1.0;
            report.description = "Element is still present and visible";
            return report;
        }

        DomSnapshot snapshot = m_dispatcher.getDomSnapshot();
        auto healed = healSelector(expectedSelector, snapshot);

        report.changed = true;
        if (healed) {
            report.suggestedSelector = *healed;
            report.confidence = m_settings.uiChangeConfidence;
            report.description = "Original selector \"" + expectedSelector +
                                 "\" not found; suggested alternative: \"" + *healed + "\"";
        } else {
            report.confidence = 0.0;
            report.description = "Element \"" + expectedSelector + "\" not found and could not be healed";
        }
    } catch (const std::exception& e) {
        report.changed = true;
        report.suggestedSelector.reset();
        report.confidence = 0.0;
        report.description = std::string("Error detecting UI change: ") + e.what();
    }

    SLOG_DEBUG().message("UI change check finished")
        .context("session_id", m_dispatcher.session().id())
        .context("selector", expectedSelector)
        .context("changed", report.changed)
        .context("confidence", report.confidence);
    return report;
}

Target SelfHealingResolver::findElementWithHealing(const std::string& selector,
                                                   const std::string& description,
                                                   IVisionCollaborator& vision) {
    auto guard = m_dispatcher.session().tryAcquireHealing();
    if (!guard.owns_lock()) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Healing already in progress for this session",
                     selector, m_dispatcher.session().id());
    }
    return locateWithHealing(selector, description, vision);
}

Target SelfHealingResolver::locateWithHealing(const std::string& selector,
                                              const std::string& description,
                                              IVisionCollaborator& vision) {
    const std::string& sessionId = m_dispatcher.session().id();

    if (!selector.empty()) {
        if (m_dispatcher.isElementVisible(selector)) {
            return SelectorTarget{selector};
        }

        for (const auto& alternative : generateSelectorVariations(selector)) {
            if (m_dispatcher.isElementVisible(alternative)) {
                SLOG_INFO().message("Selector healed by variation")
                    .context("session_id", sessionId)
                    .context("failed_selector", selector)
                    .context("healed_selector", alternative);
                return SelectorTarget{alternative};
            }
        }

        try {
            DomSnapshot snapshot = m_dispatcher.getDomSnapshot();
            auto healed = healSelectorWithStrategy(selector, snapshot);
            if (healed && m_dispatcher.isElementVisible(healed->selector)) {
                return SelectorTarget{healed->selector};
            }
        } catch (const MenderException& e) {
            SLOG_WARNING().message("Snapshot healing unavailable")
                .context("session_id", sessionId)
                .context("selector", selector)
                .context("error", e.what());
        }
    }

    VisionFallback fallback(m_dispatcher, vision, m_settings);
    if (auto coordinates = fallback.locate(description.empty() ? selector : description)) {
        return *coordinates;
    }

    MENDER_THROW(ErrorKind::HEALING_EXHAUSTED,
                 "Element not found after healing: selector=\"" + selector + "\", description=\"" + description + "\"",
                 "", sessionId);
}

ActionResult SelfHealingResolver::resolveAndRetry(const Target& target,
                                                  const std::string& description,
                                                  IVisionCollaborator& vision) {
    SCOPED_TIMER("SelfHealingResolver::resolveAndRetry");

    auto guard = m_dispatcher.session().tryAcquireHealing();
    if (!guard.owns_lock()) {
        return busyResult("resolveAndRetry");
    }

    try {
        if (const auto* semantic = std::get_if<SemanticTarget>(&target)) {
            SLOG_INFO().message("Semantic target, resolving visually")
                .context("session_id", m_dispatcher.session().id())
                .context("description", semantic->description);
            Target resolved = locateWithHealing("", semantic->description, vision);
            return m_executor.executeWithRetry(Action::click(resolved));
        }

        ActionResult first = m_executor.executeWithRetry(Action::click(target));
        if (first.success) {
            return first;
        }

        // Coordinate targets have no selector to heal; only vision applies.
        const auto* sel = std::get_if<SelectorTarget>(&target);
        std::string selector = sel ? sel->selector : std::string();

        SLOG_INFO().message("Click failed, attempting healing")
            .context("session_id", m_dispatcher.session().id())
            .context("target", describeTarget(target))
            .context("error", first.error);

        Target resolved = locateWithHealing(selector, description, vision);
        return m_executor.executeWithRetry(Action::click(resolved));
    } catch (const MenderException& e) {
        reportError(e.getErrorInfo());
        return ActionResult::failure(e.what(), e.kind(), 0);
    }
}

ActionResult SelfHealingResolver::typeWithHealing(const std::string& selector,
                                                  const std::string& text,
                                                  IVisionCollaborator& vision) {
    auto guard = m_dispatcher.session().tryAcquireHealing();
    if (!guard.owns_lock()) {
        return busyResult("typeWithHealing");
    }

    try {
        ActionResult first = m_executor.executeWithRetry(Action::type(SelectorTarget{selector}, text));
        if (first.success) {
            return first;
        }

        SLOG_INFO().message("Type failed, attempting healing")
            .context("session_id", m_dispatcher.session().id())
            .context("selector", selector)
            .context("error", first.error);

        Target resolved = locateWithHealing(selector, "text input: " + selector, vision);
        return typeAtResolvedTarget(resolved, text);
    } catch (const MenderException& e) {
        reportError(e.getErrorInfo());
        return ActionResult::failure(e.what(), e.kind(), 0);
    }
}

ActionResult SelfHealingResolver::typeAtResolvedTarget(const Target& target, const std::string& text) {
    if (std::holds_alternative<CoordinateTarget>(target)) {
        ActionResult focused = m_executor.executeWithRetry(Action::click(target));
        if (!focused.success) {
            return focused;
        }
    }
    return m_executor.executeWithRetry(Action::type(target, text));
}

ActionResult SelfHealingResolver::busyResult(const std::string& operation) const {
    SLOG_WARNING().message("Healing already in progress, refusing concurrent resolution")
        .context("session_id", m_dispatcher.session().id())
        .context("operation", operation);
    return ActionResult::failure("Healing already in progress for session " + m_dispatcher.session().id(),
                                 ErrorKind::CONTRACT_VIOLATION, 0);
}

} // namespace mender
