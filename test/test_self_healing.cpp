#include <iostream>
#include <memory>
#include <thread>
#include "healing/self_healing.h"
#include "vision/vision_fallback.h"
#include "test_support.h"
#include "test_fakes.h"

using namespace mender;
using namespace mender::test;

namespace {

RetryConfig singleAttempt() {
    RetryConfig config;
    config.maxAttempts = 1;
    config.backoffMs = 0;
    return config;
}

// Dispatcher, executor and resolver over one fake session.
struct HealingFixture {
    SessionFixture fx;
    ActionExecutor executor{fx.dispatcher, singleAttempt(), std::make_shared<FixedJitterSource>(0.0)};
    SelfHealingResolver resolver;
    FakeVisionCollaborator vision;

    explicit HealingFixture(HealingSettings settings = HealingSettings())
        : resolver(fx.dispatcher, executor, settings) {}
};

DomSnapshot snapshotOf(std::vector<VisibleElement> elements) {
    DomSnapshot snapshot;
    snapshot.url = "https://shop.example.com/checkout";
    snapshot.visibleElements = std::move(elements);
    return snapshot;
}

AgentResponse failClicksOn(const nlohmann::json& action, const std::string& selector) {
    if (action["type"] == "click" && action["target"].value("selector", "") == selector) {
        return FakePageAgent::failure("Element not found: " + selector);
    }
    return FakePageAgent::ok();
}

} // anonymous namespace

void testSnapshotStrategies() {
    std::cout << "[TEST] Snapshot Healing Strategies\n";

    HealingFixture h;
    auto& resolver = h.resolver;

    MENDER_CHECK(!resolver.healSelector("#old-button", DomSnapshot()));

    auto byAttribute = resolver.healSelectorWithStrategy("#old-button", snapshotOf({
        makeElement("span", "span.label", "Old button"),
        makeElement("button", "[data-testid=\"old-button\"]", "Submit", {{"data-testid", "old-button"}})
    }));
    MENDER_CHECK(byAttribute);
    MENDER_CHECK(byAttribute->selector == "[data-testid=\"old-button\"]");
    MENDER_CHECK(byAttribute->strategy == HealingStrategy::ATTRIBUTE_FALLBACK);

    auto byAriaLabel = resolver.healSelectorWithStrategy("[aria-label=\"Close dialog\"]", snapshotOf({
        makeElement("button", "button.close-x", "", {{"aria-label", "Close dialog"}})
    }));
    MENDER_CHECK(byAriaLabel && byAriaLabel->selector == "button.close-x");
    MENDER_CHECK(byAriaLabel->strategy == HealingStrategy::ATTRIBUTE_FALLBACK);

    auto byStructure = resolver.healSelectorWithStrategy("div.card.active", snapshotOf({
        makeElement("section", "section.card", "", {{"class", "card"}}),
        makeElement("div", "div.card.highlighted", "", {{"class", "card highlighted"}})
    }));
    MENDER_CHECK(byStructure && byStructure->selector == "div.card.highlighted");
    MENDER_CHECK(byStructure->strategy == HealingStrategy::STRUCTURAL_NAVIGATION);

    auto byText = resolver.healSelectorWithStrategy("#sign-in", snapshotOf({
        makeElement("a", "a.nav-login", "Sign In")
    }));
    MENDER_CHECK(byText && byText->selector == "a.nav-login");
    MENDER_CHECK(byText->strategy == HealingStrategy::TEXT_CONTENT);

    auto byPartialClass = resolver.healSelectorWithStrategy("button.cta-primary", snapshotOf({
        makeElement("button", "button.cta-primary-v2", "Buy now", {{"class", "cta-primary-v2"}})
    }));
    MENDER_CHECK(byPartialClass && byPartialClass->selector == "button.cta-primary-v2");
    MENDER_CHECK(byPartialClass->strategy == HealingStrategy::PARTIAL_CLASS);

    MENDER_CHECK(healingStrategyToString(HealingStrategy::PARTIAL_CLASS) == "partial_class");

    // Strategies only inspect the snapshot.
    MENDER_CHECK(h.fx.agent->calls.empty());

    std::cout << "[OK] Snapshot healing strategies test passed\n\n";
}

void testFindSimilarElement() {
    std::cout << "[TEST] Similar Element Scoring\n";

    HealingFixture h;
    DomSnapshot snapshot = snapshotOf({
        makeElement("button", "button.primary", "Save draft", {{"class", "primary"}}),
        makeElement("div", "div#save", "", {{"id", "save"}})
    });

    // button: tag 2 + class 1 = 3; div: id 5.
    auto similar = h.resolver.findSimilarElement("button#save.primary", snapshot);
    MENDER_CHECK(similar && *similar == "div#save");

    MENDER_CHECK(!h.resolver.findSimilarElement("span.missing", snapshot));

    HealingSettings strict;
    strict.similarityThreshold = 6;
    HealingFixture strictFixture(strict);
    MENDER_CHECK(!strictFixture.resolver.findSimilarElement("button#save.primary", snapshot));

    std::cout << "[OK] Similar element scoring test passed\n\n";
}

void testDetectUIChange() {
    std::cout << "[TEST] UI Change Detection\n";

    HealingFixture present;
    present.fx.agent->visibleSelectors = {"#checkout"};
    UIChangeReport unchanged = present.resolver.detectUIChange("#checkout");
    MENDER_CHECK(!unchanged.changed);
    MENDER_CHECK_NEAR(unchanged.confidence, 1.0, 1e-9);
    MENDER_CHECK(present.fx.agent->snapshotCount == 0);

    HealingFixture moved;
    moved.fx.agent->page = snapshotOf({
        makeElement("button", "[data-testid=\"checkout\"]", "Checkout", {{"data-testid", "checkout"}})
    });
    UIChangeReport healed = moved.resolver.detectUIChange("#checkout");
    MENDER_CHECK(healed.changed);
    MENDER_CHECK(healed.suggestedSelector && *healed.suggestedSelector == "[data-testid=\"checkout\"]");
    MENDER_CHECK_NEAR(healed.confidence, 0.7, 1e-9);
    MENDER_CHECK(healed.description.find("suggested alternative") != std::string::npos);

    HealingSettings tuned;
    tuned.uiChangeConfidence = 0.85;
    HealingFixture tunedFixture(tuned);
    tunedFixture.fx.agent->page = moved.fx.agent->page;
    MENDER_CHECK_NEAR(tunedFixture.resolver.detectUIChange("#checkout").confidence, 0.85, 1e-9);

    HealingFixture gone;
    gone.fx.agent->page = snapshotOf({makeElement("p", "p.footer", "Copyright")});
    UIChangeReport lost = gone.resolver.detectUIChange("#checkout");
    MENDER_CHECK(lost.changed);
    MENDER_CHECK(!lost.suggestedSelector);
    MENDER_CHECK_NEAR(lost.confidence, 0.0, 1e-9);

    HealingFixture broken;
    broken.fx.agent->snapshotError = "frame detached";
    UIChangeReport failed = broken.resolver.detectUIChange("#checkout");
    MENDER_CHECK(failed.changed);
    MENDER_CHECK_NEAR(failed.confidence, 0.0, 1e-9);
    MENDER_CHECK(failed.description.rfind("Error detecting UI change: ", 0) == 0);

    std::cout << "[OK] UI change detection test passed\n\n";
}

void testFindElementWithHealing() {
    std::cout << "[TEST] Find Element With Healing\n";

    HealingFixture direct;
    direct.fx.agent->visibleSelectors = {"#old-button"};
    Target same = direct.resolver.findElementWithHealing("#old-button", "submit", direct.vision);
    MENDER_CHECK(std::get<SelectorTarget>(same).selector == "#old-button");
    MENDER_CHECK(direct.fx.agent->probeCount == 1);

    HealingFixture variation;
    variation.fx.agent->visibleSelectors = {"[aria-label=\"old-button\"]"};
    Target varied = variation.resolver.findElementWithHealing("#old-button", "submit", variation.vision);
    MENDER_CHECK(std::get<SelectorTarget>(varied).selector == "[aria-label=\"old-button\"]");
    MENDER_CHECK(variation.fx.agent->probedSelectors.size() == 3);
    MENDER_CHECK(variation.fx.agent->probedSelectors[1] == "[data-testid=\"old-button\"]");
    MENDER_CHECK(variation.fx.agent->snapshotCount == 0);

    HealingFixture snapshot;
    snapshot.fx.agent->page = snapshotOf({
        makeElement("button", "button.cta-primary-v2", "Buy now", {{"class", "cta-primary-v2"}})
    });
    snapshot.fx.agent->visibleSelectors = {"button.cta-primary-v2"};
    Target healed = snapshot.resolver.findElementWithHealing("button.cta-primary", "buy button", snapshot.vision);
    MENDER_CHECK(std::get<SelectorTarget>(healed).selector == "button.cta-primary-v2");
    MENDER_CHECK(snapshot.vision.locateCount == 0);

    // A healed selector that is not visible falls through to vision.
    HealingFixture hidden;
    hidden.fx.agent->page = snapshot.fx.agent->page;
    hidden.vision.willFind(BoundingBox(100, 200, 50, 20));
    Target visual = hidden.resolver.findElementWithHealing("button.cta-primary", "buy button", hidden.vision);
    const auto& point = std::get<CoordinateTarget>(visual);
    MENDER_CHECK_NEAR(point.x, 125.0, 1e-9);
    MENDER_CHECK_NEAR(point.y, 210.0, 1e-9);
    MENDER_CHECK(hidden.vision.descriptions.size() == 1 && hidden.vision.descriptions[0] == "buy button");
    MENDER_CHECK(hidden.vision.lastScreenshotValid);

    HealingFixture exhausted;
    MENDER_CHECK_THROWS_KIND(exhausted.resolver.findElementWithHealing("#nowhere", "ghost", exhausted.vision),
                             ErrorKind::HEALING_EXHAUSTED);
    MENDER_CHECK(exhausted.vision.locateCount == 1);

    std::cout << "[OK] Find element with healing test passed\n\n";
}

void testResolveSemanticTarget() {
    std::cout << "[TEST] Resolve Semantic Target\n";

    HealingFixture h;
    h.vision.willFind(BoundingBox(100, 200, 50, 20));

    ActionResult result = h.resolver.resolveAndRetry(SemanticTarget{"the blue Submit button"}, "", h.vision);
    MENDER_CHECK(result.success);
    MENDER_CHECK(h.fx.agent->probeCount == 0);
    MENDER_CHECK(h.vision.descriptions[0] == "the blue Submit button");
    MENDER_CHECK(h.fx.agent->actions.size() == 1);

    const auto& click = h.fx.agent->actions[0];
    MENDER_CHECK(click["type"] == "click");
    MENDER_CHECK(click["target"]["type"] == "coordinates");
    MENDER_CHECK_NEAR(click["target"]["x"].get<double>(), 125.0, 1e-9);
    MENDER_CHECK_NEAR(click["target"]["y"].get<double>(), 210.0, 1e-9);

    HealingFixture blind;
    ActionResult unresolved = blind.resolver.resolveAndRetry(SemanticTarget{"a unicorn"}, "", blind.vision);
    MENDER_CHECK(!unresolved.success);
    MENDER_CHECK(unresolved.errorKind == ErrorKind::HEALING_EXHAUSTED);
    MENDER_CHECK(blind.fx.agent->actions.empty());

    std::cout << "[OK] Resolve semantic target test passed\n\n";
}

void testResolveBrokenSelector() {
    std::cout << "[TEST] Resolve Broken Selector\n";

    HealingFixture h;
    h.fx.agent->onAction = [](const nlohmann::json& action) { return failClicksOn(action, "#old-button"); };
    h.fx.agent->visibleSelectors = {"[data-testid=\"old-button\"]"};

    ActionResult result = h.resolver.resolveAndRetry(SelectorTarget{"#old-button"}, "submit button", h.vision);
    MENDER_CHECK(result.success);
    MENDER_CHECK(h.fx.agent->actions.size() == 2);
    MENDER_CHECK(h.fx.agent->actions[1]["target"]["selector"] == "[data-testid=\"old-button\"]");
    MENDER_CHECK(h.vision.locateCount == 0);

    HealingFixture fine;
    ActionResult direct = fine.resolver.resolveAndRetry(SelectorTarget{"#ok"}, "", fine.vision);
    MENDER_CHECK(direct.success);
    MENDER_CHECK(fine.fx.agent->probeCount == 0);

    std::cout << "[OK] Resolve broken selector test passed\n\n";
}

void testLowConfidenceVisionRejected() {
    std::cout << "[TEST] Low Confidence Vision Rejected\n";

    HealingSettings settings;
    settings.minVisionConfidence = 0.8;
    HealingFixture h(settings);
    h.fx.agent->onAction = [](const nlohmann::json& action) { return failClicksOn(action, "#pay"); };
    h.vision.willFind(BoundingBox(10, 10, 10, 10), 0.5);

    ActionResult result = h.resolver.resolveAndRetry(SelectorTarget{"#pay"}, "pay button", h.vision);
    MENDER_CHECK(!result.success);
    MENDER_CHECK(result.errorKind == ErrorKind::HEALING_EXHAUSTED);
    MENDER_CHECK(result.durationMs == 0);
    MENDER_CHECK(h.vision.locateCount == 1);
    MENDER_CHECK(h.fx.agent->actions.size() == 1);

    std::cout << "[OK] Low confidence vision test passed\n\n";
}

void testConcurrentHealingRefused() {
    std::cout << "[TEST] Concurrent Healing Refused\n";

    HealingFixture h;
    auto held = h.fx.session.tryAcquireHealing();
    MENDER_CHECK(held.owns_lock());

    ActionResult refused;
    UIChangeReport report;
    bool findRefused = false;

    std::thread contender([&]() {
        refused = h.resolver.resolveAndRetry(SelectorTarget{"#go"}, "go", h.vision);
        report = h.resolver.detectUIChange("#go");
        try {
            h.resolver.findElementWithHealing("#go", "go", h.vision);
        } catch (const MenderException& e) {
            findRefused = e.kind() == ErrorKind::CONTRACT_VIOLATION;
        }
    });
    contender.join();

    MENDER_CHECK(!refused.success);
    MENDER_CHECK(refused.errorKind == ErrorKind::CONTRACT_VIOLATION);
    MENDER_CHECK(report.changed);
    MENDER_CHECK_NEAR(report.confidence, 0.0, 1e-9);
    MENDER_CHECK(findRefused);
    MENDER_CHECK(h.fx.agent->calls.empty());

    held.unlock();
    MENDER_CHECK(h.resolver.resolveAndRetry(SelectorTarget{"#go"}, "go", h.vision).success);

    std::cout << "[OK] Concurrent healing test passed\n\n";
}

void testTypeWithHealing() {
    std::cout << "[TEST] Type With Healing\n";

    HealingFixture h;
    h.fx.agent->onAction = [](const nlohmann::json& action) {
        if (action["type"] == "type" && action["target"]["type"] == "css") {
            return FakePageAgent::failure("Element not found: #email");
        }
        return FakePageAgent::ok();
    };
    h.vision.willFind(BoundingBox(10, 20, 100, 40));

    ActionResult result = h.resolver.typeWithHealing("#email", "user@example.com", h.vision);
    MENDER_CHECK(result.success);
    MENDER_CHECK(h.vision.descriptions[0] == "text input: #email");

    const auto& actions = h.fx.agent->actions;
    MENDER_CHECK(actions.size() == 3);
    MENDER_CHECK(actions[1]["type"] == "click");
    MENDER_CHECK_NEAR(actions[1]["target"]["x"].get<double>(), 60.0, 1e-9);
    MENDER_CHECK_NEAR(actions[1]["target"]["y"].get<double>(), 40.0, 1e-9);
    MENDER_CHECK(actions[2]["type"] == "type");
    MENDER_CHECK(actions[2]["target"]["type"] == "coordinates");
    MENDER_CHECK(actions[2]["text"] == "user@example.com");

    std::cout << "[OK] Type with healing test passed\n\n";
}

void testVisionFallback() {
    std::cout << "[TEST] Vision Fallback\n";

    SessionFixture fx;
    FakeVisionCollaborator vision;
    vision.detected = {
        makeDetected(ElementType::BUTTON, BoundingBox(0, 0, 20, 20), 0.6, "ok"),
        makeDetected(ElementType::INPUT, BoundingBox(30, 0, 20, 20), 0.9, "name"),
        makeDetected(ElementType::LINK, BoundingBox(400, 400, 20, 20), 0.7, "help")
    };
    VisionFallback fallback(fx.dispatcher, vision);

    auto nearest = fallback.snapToNearestElement(Point(390, 415));
    MENDER_CHECK(nearest && nearest->label == "help");

    // Sorted by confidence, then "name" absorbs "ok" (30px apart) while "help" stands alone.
    auto layout = fallback.describeLayout();
    MENDER_CHECK(layout.size() == 2);
    MENDER_CHECK(layout[0].size() == 2);
    MENDER_CHECK(layout[0][0].label == "name");
    MENDER_CHECK(layout[0][1].label == "ok");
    MENDER_CHECK(layout[1].size() == 1 && layout[1][0].label == "help");

    vision.verification.success = true;
    vision.verification.confidence = 0.95;
    VerificationResult verified = fallback.verifyOutcome("Is the cart empty?");
    MENDER_CHECK(verified.success);
    MENDER_CHECK(vision.prompts.back() == "Is the cart empty?");

    fx.capture->fail = true;
    VerificationResult failed = fallback.verifyOutcome("Is the cart empty?");
    MENDER_CHECK(!failed.success);
    MENDER_CHECK(failed.reasoning.rfind("Verification failed: ", 0) == 0);
    MENDER_CHECK(!fallback.locate("cart icon"));

    fx.capture->fail = false;
    vision.throwOnDetect = true;
    MENDER_CHECK(!fallback.snapToNearestElement(Point(0, 0)));
    MENDER_CHECK_THROWS_KIND(fallback.describeLayout(), ErrorKind::AGENT_FAILURE);

    std::cout << "[OK] Vision fallback test passed\n\n";
}

int main() {
    std::cout << "=== Mender Self-Healing Test Suite ===\n\n";

    try {
        testSnapshotStrategies();
        testFindSimilarElement();
        testDetectUIChange();
        testFindElementWithHealing();
        testResolveSemanticTarget();
        testResolveBrokenSelector();
        testLowConfidenceVisionRejected();
        testConcurrentHealingRefused();
        testTypeWithHealing();
        testVisionFallback();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
