#ifndef MENDER_TYPES_H
#define MENDER_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <chrono>
#include <nlohmann/json.hpp>
#include "error_handler.h"

namespace mender {

// ---------------------------------------------------------------------------
// Geometry primitives
// ---------------------------------------------------------------------------

struct Point {
    double x;
    double y;

    Point(double x = 0.0, double y = 0.0) : x(x), y(y) {}
};

struct BoundingBox {
    double x, y;           // Top-left corner (pixels or percentages)
    double width, height;

    BoundingBox(double x = 0.0, double y = 0.0, double w = 0.0, double h = 0.0)
        : x(x), y(y), width(w), height(h) {}
};

// ---------------------------------------------------------------------------
// Targets
// ---------------------------------------------------------------------------

struct SelectorTarget {
    std::string selector;
};

struct CoordinateTarget {
    double x = 0.0;
    double y = 0.0;
};

// Natural-language description; must be resolved before dispatch.
struct SemanticTarget {
    std::string description;
};

using Target = std::variant<SelectorTarget, CoordinateTarget, SemanticTarget>;

std::string describeTarget(const Target& target);

// ---------------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------------

// Order matches the alternatives of ActionParams.
enum class ActionKind {
    CLICK,
    TYPE,
    HOVER,
    WAIT,
    NAVIGATE,
    SCREENSHOT,
    SCROLL,
    PRESS_KEY,
    UPLOAD,
    EVALUATE
};

std::string actionKindToString(ActionKind kind);
std::optional<ActionKind> parseActionKind(const std::string& name);

enum class MouseButton { LEFT, RIGHT, MIDDLE };
enum class ScrollDirection { UP, DOWN, LEFT, RIGHT, TO_ELEMENT };
enum class WaitUntil { LOAD, DOM_CONTENT_LOADED, NETWORK_IDLE };
enum class ImageFormat { PNG, JPEG };

struct ElementVisible { std::string selector; };
struct ElementHidden { std::string selector; };
struct NetworkIdle { std::optional<int> timeoutMs; };
struct Delay { int durationMs = 0; };
struct TextVisible { std::string text; };
struct UrlMatch { std::string pattern; };

using WaitCondition = std::variant<ElementVisible, ElementHidden, NetworkIdle, Delay, TextVisible, UrlMatch>;

struct ScreenshotOptions {
    ImageFormat format = ImageFormat::PNG;
    int quality = 80;       // JPEG only
    bool fullPage = false;
};

struct ClickParams {
    MouseButton button = MouseButton::LEFT;
    int clickCount = 1;
    std::vector<std::string> modifiers;
};

struct TypeParams {
    std::string text;
    int keystrokeDelayMs = 0;
    bool clearFirst = false;
};

struct HoverParams {};

struct WaitParams {
    WaitCondition condition;
};

struct NavigateParams {
    std::string url;
    WaitUntil waitUntil = WaitUntil::LOAD;
};

struct ScreenshotParams {
    ScreenshotOptions options;
};

struct ScrollParams {
    ScrollDirection direction = ScrollDirection::DOWN;
    int amount = 300;
};

struct PressKeyParams {
    std::string key;
    std::vector<std::string> modifiers;
};

struct UploadParams {
    std::string filePath;
};

struct EvaluateParams {
    std::string script;
};

using ActionParams = std::variant<ClickParams, TypeParams, HoverParams, WaitParams, NavigateParams,
                                  ScreenshotParams, ScrollParams, PressKeyParams, UploadParams,
                                  EvaluateParams>;

struct ActionOptions {
    std::optional<int> timeoutMs;
    std::optional<int> retries;   // retry count hint; attempts = retries + 1
    int waitAfterMs = 0;
    bool scrollIntoView = false;
};

/**
 * @brief A single requested page interaction
 *
 * The kind is the active alternative of @c params, so kind and payload cannot
 * disagree. Build actions through the factory functions, which require a
 * target exactly for the kinds that need one.
 */
struct Action {
    std::optional<Target> target;
    ActionParams params;
    ActionOptions options;

    ActionKind kind() const { return static_cast<ActionKind>(params.index()); }
    bool requiresTarget() const;

    static Action click(Target target, ClickParams params = ClickParams(), ActionOptions options = ActionOptions());
    static Action type(Target target, std::string text, ActionOptions options = ActionOptions());
    static Action type(Target target, TypeParams params, ActionOptions options = ActionOptions());
    static Action hover(Target target, ActionOptions options = ActionOptions());
    static Action wait(WaitCondition condition, ActionOptions options = ActionOptions());
    static Action navigate(std::string url, WaitUntil waitUntil = WaitUntil::LOAD);
    static Action screenshot(ScreenshotOptions options = ScreenshotOptions());
    static Action scroll(ScrollDirection direction, int amount = 300);
    static Action scrollTo(std::string selector);
    static Action pressKey(std::string key, std::vector<std::string> modifiers = {});
    static Action upload(Target target, std::string filePath);
    static Action evaluate(std::string script);
};

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

struct ActionResult {
    bool success;
    std::string error;        // Empty on success
    ErrorKind errorKind;
    nlohmann::json data;      // Agent payload on success
    std::chrono::system_clock::time_point timestamp;
    long long durationMs;

    ActionResult() : success(false), errorKind(ErrorKind::NONE),
                     timestamp(std::chrono::system_clock::now()), durationMs(0) {}

    static ActionResult ok(long long durationMs, nlohmann::json data = nullptr);
    static ActionResult failure(const std::string& error, ErrorKind kind, long long durationMs);
};

// Raw reply of the page-automation agent.
struct AgentResponse {
    bool success = false;
    nlohmann::json data;
    std::string error;
};

enum class BackoffStrategy { IMMEDIATE, LINEAR, EXPONENTIAL };

std::string backoffStrategyToString(BackoffStrategy strategy);
std::optional<BackoffStrategy> parseBackoffStrategy(const std::string& name);

struct RetryConfig {
    int maxAttempts = 3;
    int backoffMs = 500;
    BackoffStrategy strategy = BackoffStrategy::EXPONENTIAL;
};

// ---------------------------------------------------------------------------
// Page snapshot and vision
// ---------------------------------------------------------------------------

struct VisibleElement {
    std::string tag;
    std::string selector;
    std::string text;
    BoundingBox bbox;
    std::map<std::string, std::string> attributes;
    bool isInteractive = false;

    std::string attribute(const std::string& name) const;
    bool hasAttribute(const std::string& name, const std::string& value) const;
    std::vector<std::string> classes() const;   // from the "class" attribute
};

struct DomSnapshot {
    std::string url;
    std::string title;
    std::vector<VisibleElement> visibleElements;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

enum class ElementType {
    BUTTON, INPUT, LINK, IMAGE, TEXT, DROPDOWN, CHECKBOX, CANVAS, MENU, DIALOG, UNKNOWN
};

std::string elementTypeToString(ElementType type);
ElementType parseElementType(const std::string& name);

struct DetectedElement {
    ElementType type = ElementType::UNKNOWN;
    BoundingBox bbox;
    double confidence = 0.0;   // 0-1
    std::string label;
};

struct ElementLocation {
    bool found = false;
    std::optional<BoundingBox> bbox;
    double confidence = 0.0;   // 0-1
    std::optional<std::string> selector;
};

struct VerificationResult {
    bool success = false;
    std::string reasoning;
    double confidence = 0.0;   // 0-1
    std::vector<std::string> issues;
};

struct Screenshot {
    std::string data;          // base64 image data without data-URL prefix
    ImageFormat format = ImageFormat::PNG;
    int width = 0;
    int height = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    bool isValid() const { return !data.empty(); }
};

struct UIChangeReport {
    bool changed = false;
    std::optional<std::string> suggestedSelector;
    double confidence = 0.0;   // 0-1
    std::string description;
};

// ---------------------------------------------------------------------------
// Component settings (populated by ConfigManager)
// ---------------------------------------------------------------------------

struct DispatchSettings {
    int defaultTimeoutMs = 30000;
    int visibilityProbeMs = 100;
    int pollIntervalMs = 100;
    int sequenceDelayMs = 0;
};

struct HealingSettings {
    int similarityThreshold = 2;
    double uiChangeConfidence = 0.7;
    double minVisionConfidence = 0.0;
    double proximityThresholdPx = 50.0;
};

} // namespace mender

#endif // MENDER_TYPES_H
