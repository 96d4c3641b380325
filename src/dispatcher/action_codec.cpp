#include "action_codec.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"

namespace mender {

namespace {

using utils::JsonUtils;

std::string mouseButtonToString(MouseButton button) {
    switch (button) {
        case MouseButton::RIGHT: return "right";
        case MouseButton::MIDDLE: return "middle";
        default: return "left";
    }
}

MouseButton parseMouseButton(const std::string& name) {
    std::string lower = utils::StringUtils::toLowerCase(name);
    if (lower == "right") return MouseButton::RIGHT;
    if (lower == "middle") return MouseButton::MIDDLE;
    return MouseButton::LEFT;
}

std::string scrollDirectionToString(ScrollDirection direction) {
    switch (direction) {
        case ScrollDirection::UP: return "up";
        case ScrollDirection::LEFT: return "left";
        case ScrollDirection::RIGHT: return "right";
        case ScrollDirection::TO_ELEMENT: return "to_element";
        default: return "down";
    }
}

ScrollDirection parseScrollDirection(const std::string& name) {
    std::string lower = utils::StringUtils::toLowerCase(name);
    if (lower == "up") return ScrollDirection::UP;
    if (lower == "left") return ScrollDirection::LEFT;
    if (lower == "right") return ScrollDirection::RIGHT;
    if (lower == "to_element") return ScrollDirection::TO_ELEMENT;
    return ScrollDirection::DOWN;
}

std::string waitUntilToString(WaitUntil waitUntil) {
    switch (waitUntil) {
        case WaitUntil::DOM_CONTENT_LOADED: return "domcontentloaded";
        case WaitUntil::NETWORK_IDLE: return "networkidle";
        default: return "load";
    }
}

WaitUntil parseWaitUntil(const std::string& name) {
    std::string lower = utils::StringUtils::toLowerCase(name);
    if (lower == "domcontentloaded") return WaitUntil::DOM_CONTENT_LOADED;
    if (lower == "networkidle") return WaitUntil::NETWORK_IDLE;
    return WaitUntil::LOAD;
}

std::string imageFormatToString(ImageFormat format) {
    return format == ImageFormat::JPEG ? "jpeg" : "png";
}

ImageFormat parseImageFormat(const std::string& name) {
    std::string lower = utils::StringUtils::toLowerCase(name);
    return (lower == "jpeg" || lower == "jpg") ? ImageFormat::JPEG : ImageFormat::PNG;
}

nlohmann::json optionsToJson(const ActionOptions& options) {
    nlohmann::json json = nlohmann::json::object();
    if (options.timeoutMs) json["timeout"] = *options.timeoutMs;
    if (options.retries) json["retries"] = *options.retries;
    if (options.waitAfterMs > 0) json["waitAfter"] = options.waitAfterMs;
    if (options.scrollIntoView) json["scrollIntoView"] = true;
    return json;
}

ActionOptions optionsFromJson(const nlohmann::json& json) {
    ActionOptions options;
    if (!json.is_object()) {
        return options;
    }
    options.timeoutMs = JsonUtils::getOptionalIntField(json, "timeout");
    options.retries = JsonUtils::getOptionalIntField(json, "retries");
    options.waitAfterMs = JsonUtils::getIntField(json, "waitAfter", 0);
    options.scrollIntoView = JsonUtils::getBoolField(json, "scrollIntoView", false);
    return options;
}

Target targetFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Action target must be an object", json.dump(), "actionFromJson");
    }

    std::string type = JsonUtils::getStringField(json, "type");
    if (type == "css") {
        return SelectorTarget{JsonUtils::requireStringField(json, "selector")};
    }
    if (type == "coordinates") {
        if (!json.contains("x") || !json.contains("y") || !json["x"].is_number() || !json["y"].is_number()) {
            MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Coordinate target requires numeric x and y",
                         json.dump(), "actionFromJson");
        }
        return CoordinateTarget{json["x"].get<double>(), json["y"].get<double>()};
    }
    if (type == "semantic") {
        return SemanticTarget{JsonUtils::requireStringField(json, "description")};
    }
    MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Unknown target type: " + type, json.dump(), "actionFromJson");
}

WaitCondition waitConditionFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Wait action requires a condition object", json.dump(), "actionFromJson");
    }

    std::string type = JsonUtils::getStringField(json, "type");
    if (type == "element_visible") {
        return ElementVisible{JsonUtils::requireStringField(json, "selector")};
    }
    if (type == "element_hidden") {
        return ElementHidden{JsonUtils::requireStringField(json, "selector")};
    }
    if (type == "network_idle") {
        return NetworkIdle{JsonUtils::getOptionalIntField(json, "timeout")};
    }
    if (type == "timeout" || type == "delay") {
        return Delay{JsonUtils::getIntField(json, "duration", 0)};
    }
    if (type == "text_visible") {
        return TextVisible{JsonUtils::requireStringField(json, "text")};
    }
    if (type == "url_match") {
        return UrlMatch{JsonUtils::requireStringField(json, "pattern")};
    }
    MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Unknown wait condition: " + type, json.dump(), "actionFromJson");
}

// Primary payload: the named field, else the legacy "value" field.
std::string payloadField(const nlohmann::json& json, const std::string& name) {
    if (json.contains(name) && json[name].is_string()) {
        return json[name].get<std::string>();
    }
    return JsonUtils::getStringField(json, "value");
}

} // anonymous namespace

nlohmann::json targetToJson(const Target& target) {
    if (const auto* sel = std::get_if<SelectorTarget>(&target)) {
        return {{"type", "css"}, {"selector", sel->selector}};
    }
    if (const auto* coords = std::get_if<CoordinateTarget>(&target)) {
        return {{"type", "coordinates"}, {"x", coords->x}, {"y", coords->y}};
    }
    return {{"type", "semantic"}, {"description", std::get<SemanticTarget>(target).description}};
}

nlohmann::json waitConditionToJson(const WaitCondition& condition) {
    if (const auto* c = std::get_if<ElementVisible>(&condition)) {
        return {{"type", "element_visible"}, {"selector", c->selector}};
    }
    if (const auto* c = std::get_if<ElementHidden>(&condition)) {
        return {{"type", "element_hidden"}, {"selector", c->selector}};
    }
    if (const auto* c = std::get_if<NetworkIdle>(&condition)) {
        nlohmann::json json = {{"type", "network_idle"}};
        if (c->timeoutMs) json["timeout"] = *c->timeoutMs;
        return json;
    }
    if (const auto* c = std::get_if<Delay>(&condition)) {
        return {{"type", "timeout"}, {"duration", c->durationMs}};
    }
    if (const auto* c = std::get_if<TextVisible>(&condition)) {
        return {{"type", "text_visible"}, {"text", c->text}};
    }
    return {{"type", "url_match"}, {"pattern", std::get<UrlMatch>(condition).pattern}};
}

nlohmann::json actionToJson(const Action& action) {
    nlohmann::json json;
    json["type"] = actionKindToString(action.kind());

    if (action.target) {
        json["target"] = targetToJson(*action.target);
    }

    nlohmann::json options = optionsToJson(action.options);
    if (!options.empty()) {
        json["options"] = options;
    }

    switch (action.kind()) {
        case ActionKind::CLICK: {
            const auto& p = std::get<ClickParams>(action.params);
            json["button"] = mouseButtonToString(p.button);
            json["clickCount"] = p.clickCount;
            json["modifiers"] = p.modifiers;
            break;
        }
        case ActionKind::TYPE: {
            const auto& p = std::get<TypeParams>(action.params);
            json["text"] = p.text;
            json["keystrokeDelay"] = p.keystrokeDelayMs;
            json["clearFirst"] = p.clearFirst;
            break;
        }
        case ActionKind::HOVER:
            break;
        case ActionKind::WAIT:
            json["condition"] = waitConditionToJson(std::get<WaitParams>(action.params).condition);
            break;
        case ActionKind::NAVIGATE: {
            const auto& p = std::get<NavigateParams>(action.params);
            json["url"] = p.url;
            json["waitUntil"] = waitUntilToString(p.waitUntil);
            break;
        }
        case ActionKind::SCREENSHOT: {
            const auto& p = std::get<ScreenshotParams>(action.params).options;
            json["format"] = imageFormatToString(p.format);
            json["quality"] = p.quality;
            json["fullPage"] = p.fullPage;
            break;
        }
        case ActionKind::SCROLL: {
            const auto& p = std::get<ScrollParams>(action.params);
            json["direction"] = scrollDirectionToString(p.direction);
            if (p.direction == ScrollDirection::TO_ELEMENT) {
                json["toElement"] = true;
            } else {
                json["amount"] = p.amount;
            }
            break;
        }
        case ActionKind::PRESS_KEY: {
            const auto& p = std::get<PressKeyParams>(action.params);
            json["key"] = p.key;
            json["modifiers"] = p.modifiers;
            break;
        }
        case ActionKind::UPLOAD:
            json["filePath"] = std::get<UploadParams>(action.params).filePath;
            break;
        case ActionKind::EVALUATE:
            json["script"] = std::get<EvaluateParams>(action.params).script;
            break;
    }

    return json;
}

Action actionFromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        MENDER_THROW(ErrorKind::CONTRACT_VIOLATION, "Action requires a string 'type' field",
                     json.dump(), "actionFromJson");
    }

    std::string typeName = json["type"].get<std::string>();
    auto kind = parseActionKind(typeName);
    if (!kind) {
        MENDER_THROW(ErrorKind::UNSUPPORTED_ACTION_KIND, "Unsupported action type: " + typeName,
                     json.dump(), "actionFromJson");
    }

    Action action;
    if (json.contains("target") && !json["target"].is_null()) {
        action.target = targetFromJson(json["target"]);
    }
    if (json.contains("options")) {
        action.options = optionsFromJson(json["options"]);
    }

    switch (*kind) {
        case ActionKind::CLICK: {
            ClickParams p;
            p.button = parseMouseButton(JsonUtils::getStringField(json, "button", "left"));
            p.clickCount = JsonUtils::getIntField(json, "clickCount", 1);
            p.modifiers = JsonUtils::getStringArrayField(json, "modifiers");
            action.params = p;
            break;
        }
        case ActionKind::TYPE: {
            TypeParams p;
            p.text = payloadField(json, "text");
            p.keystrokeDelayMs = JsonUtils::getIntField(json, "keystrokeDelay", 0);
            p.clearFirst = JsonUtils::getBoolField(json, "clearFirst", false);
            action.params = p;
            break;
        }
        case ActionKind::HOVER:
            action.params = HoverParams{};
            break;
        case ActionKind::WAIT:
            action.params = WaitParams{waitConditionFromJson(json.contains("condition") ? json["condition"] : nlohmann::json())};
            break;
        case ActionKind::NAVIGATE:
            action.params = NavigateParams{payloadField(json, "url"),
                                           parseWaitUntil(JsonUtils::getStringField(json, "waitUntil", "load"))};
            break;
        case ActionKind::SCREENSHOT: {
            ScreenshotOptions options;
            options.format = parseImageFormat(JsonUtils::getStringField(json, "format", "png"));
            options.quality = JsonUtils::getIntField(json, "quality", 80);
            options.fullPage = JsonUtils::getBoolField(json, "fullPage", false);
            action.params = ScreenshotParams{options};
            break;
        }
        case ActionKind::SCROLL: {
            ScrollParams p;
            p.direction = parseScrollDirection(JsonUtils::getStringField(json, "direction", "down"));
            if (JsonUtils::getBoolField(json, "toElement", false)) {
                p.direction = ScrollDirection::TO_ELEMENT;
            }
            p.amount = p.direction == ScrollDirection::TO_ELEMENT ? 0 : JsonUtils::getIntField(json, "amount", 300);
            action.params = p;
            break;
        }
        case ActionKind::PRESS_KEY:
            action.params = PressKeyParams{payloadField(json, "key"), JsonUtils::getStringArrayField(json, "modifiers")};
            break;
        case ActionKind::UPLOAD:
            action.params = UploadParams{payloadField(json, "filePath")};
            break;
        case ActionKind::EVALUATE:
            action.params = EvaluateParams{payloadField(json, "script")};
            break;
    }

    return action;
}

} // namespace mender
