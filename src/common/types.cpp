#include "types.h"
#include "string_utils.h"
#include <sstream>

namespace mender {

std::string describeTarget(const Target& target) {
    if (const auto* sel = std::get_if<SelectorTarget>(&target)) {
        return "selector \"" + sel->selector + "\"";
    }
    if (const auto* coords = std::get_if<CoordinateTarget>(&target)) {
        std::ostringstream oss;
        oss << "coordinates (" << coords->x << ", " << coords->y << ")";
        return oss.str();
    }
    return "description \"" + std::get<SemanticTarget>(target).description + "\"";
}

std::string actionKindToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::CLICK: return "click";
        case ActionKind::TYPE: return "type";
        case ActionKind::HOVER: return "hover";
        case ActionKind::WAIT: return "wait";
        case ActionKind::NAVIGATE: return "navigate";
        case ActionKind::SCREENSHOT: return "screenshot";
        case ActionKind::SCROLL: return "scroll";
        case ActionKind::PRESS_KEY: return "press_key";
        case ActionKind::UPLOAD: return "upload";
        case ActionKind::EVALUATE: return "evaluate";
        default: return "unknown";
    }
}

std::optional<ActionKind> parseActionKind(const std::string& name) {
    static const std::map<std::string, ActionKind> kinds = {
        {"click", ActionKind::CLICK},
        {"type", ActionKind::TYPE},
        {"hover", ActionKind::HOVER},
        {"wait", ActionKind::WAIT},
        {"navigate", ActionKind::NAVIGATE},
        {"screenshot", ActionKind::SCREENSHOT},
        {"scroll", ActionKind::SCROLL},
        {"press_key", ActionKind::PRESS_KEY},
        {"upload", ActionKind::UPLOAD},
        {"evaluate", ActionKind::EVALUATE}
    };

    auto it = kinds.find(utils::StringUtils::toLowerCase(name));
    if (it == kinds.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Action::requiresTarget() const {
    switch (kind()) {
        case ActionKind::CLICK:
        case ActionKind::TYPE:
        case ActionKind::HOVER:
        case ActionKind::UPLOAD:
            return true;
        default:
            return false;
    }
}

Action Action::click(Target target, ClickParams params, ActionOptions options) {
    Action action;
    action.target = std::move(target);
    action.params = std::move(params);
    action.options = std::move(options);
    return action;
}

Action Action::type(Target target, std::string text, ActionOptions options) {
    TypeParams params;
    params.text = std::move(text);
    return type(std::move(target), std::move(params), std::move(options));
}

Action Action::type(Target target, TypeParams params, ActionOptions options) {
    Action action;
    action.target = std::move(target);
    action.params = std::move(params);
    action.options = std::move(options);
    return action;
}

Action Action::hover(Target target, ActionOptions options) {
    Action action;
    action.target = std::move(target);
    action.params = HoverParams{};
    action.options = std::move(options);
    return action;
}

Action Action::wait(WaitCondition condition, ActionOptions options) {
    Action action;
    action.params = WaitParams{std::move(condition)};
    action.options = std::move(options);
    return action;
}

Action Action::navigate(std::string url, WaitUntil waitUntil) {
    Action action;
    action.params = NavigateParams{std::move(url), waitUntil};
    return action;
}

Action Action::screenshot(ScreenshotOptions options) {
    Action action;
    action.params = ScreenshotParams{options};
    return action;
}

Action Action::scroll(ScrollDirection direction, int amount) {
    Action action;
    action.params = ScrollParams{direction, amount};
    return action;
}

Action Action::scrollTo(std::string selector) {
    Action action;
    action.target = SelectorTarget{std::move(selector)};
    action.params = ScrollParams{ScrollDirection::TO_ELEMENT, 0};
    return action;
}

Action Action::pressKey(std::string key, std::vector<std::string> modifiers) {
    Action action;
    action.params = PressKeyParams{std::move(key), std::move(modifiers)};
    return action;
}

Action Action::upload(Target target, std::string filePath) {
    Action action;
    action.target = std::move(target);
    action.params = UploadParams{std::move(filePath)};
    return action;
}

Action Action::evaluate(std::string script) {
    Action action;
    action.params = EvaluateParams{std::move(script)};
    return action;
}

ActionResult ActionResult::ok(long long durationMs, nlohmann::json data) {
    ActionResult result;
    result.success = true;
    result.durationMs = durationMs;
    result.data = std::move(data);
    return result;
}

ActionResult ActionResult::failure(const std::string& error, ErrorKind kind, long long durationMs) {
    ActionResult result;
    result.success = false;
    result.error = error;
    result.errorKind = kind;
    result.durationMs = durationMs;
    return result;
}

std::string backoffStrategyToString(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::IMMEDIATE: return "immediate";
        case BackoffStrategy::LINEAR: return "linear";
        case BackoffStrategy::EXPONENTIAL: return "exponential";
        default: return "unknown";
    }
}

std::optional<BackoffStrategy> parseBackoffStrategy(const std::string& name) {
    std::string lower = utils::StringUtils::toLowerCase(utils::StringUtils::trim(name));
    if (lower == "immediate") return BackoffStrategy::IMMEDIATE;
    if (lower == "linear") return BackoffStrategy::LINEAR;
    if (lower == "exponential") return BackoffStrategy::EXPONENTIAL;
    return std::nullopt;
}

std::string VisibleElement::attribute(const std::string& name) const {
    auto it = attributes.find(name);
    return it != attributes.end() ? it->second : std::string();
}

bool VisibleElement::hasAttribute(const std::string& name, const std::string& value) const {
    auto it = attributes.find(name);
    return it != attributes.end() && it->second == value;
}

std::vector<std::string> VisibleElement::classes() const {
    return utils::StringUtils::splitWhitespace(attribute("class"));
}

std::string elementTypeToString(ElementType type) {
    switch (type) {
        case ElementType::BUTTON: return "button";
        case ElementType::INPUT: return "input";
        case ElementType::LINK: return "link";
        case ElementType::IMAGE: return "image";
        case ElementType::TEXT: return "text";
        case ElementType::DROPDOWN: return "dropdown";
        case ElementType::CHECKBOX: return "checkbox";
        case ElementType::CANVAS: return "canvas";
        case ElementType::MENU: return "menu";
        case ElementType::DIALOG: return "dialog";
        default: return "unknown";
    }
}

ElementType parseElementType(const std::string& name) {
    static const std::map<std::string, ElementType> types = {
        {"button", ElementType::BUTTON},
        {"input", ElementType::INPUT},
        {"link", ElementType::LINK},
        {"image", ElementType::IMAGE},
        {"text", ElementType::TEXT},
        {"dropdown", ElementType::DROPDOWN},
        {"checkbox", ElementType::CHECKBOX},
        {"canvas", ElementType::CANVAS},
        {"menu", ElementType::MENU},
        {"dialog", ElementType::DIALOG}
    };

    auto it = types.find(utils::StringUtils::toLowerCase(name));
    return it != types.end() ? it->second : ElementType::UNKNOWN;
}

} // namespace mender
