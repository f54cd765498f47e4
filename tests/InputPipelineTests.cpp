#include <catch2/catch.hpp>

#include "InputPipeline.hpp"

namespace input_pipeline_tests {

using namespace std::chrono_literals;

InputEvent key(const std::string& name, InputClock::time_point at) {
    return InputEvent::keyPress(name, at);
}

TEST_CASE("Opposite navigation keys cancel out", "[input][navigation]") {
    NavigationBatcher batcher(50ms);
    auto t0 = InputClock::now();

    batcher.add("Down", t0);
    batcher.add("j", t0 + 1ms);
    batcher.add("Up", t0 + 2ms);
    batcher.add("k", t0 + 3ms);
    CHECK(batcher.hasPendingInput());
    CHECK_FALSE(batcher.hasPendingSteps());

    CHECK_FALSE(batcher.takeStep().has_value());
    CHECK_FALSE(batcher.hasPendingInput());
}

TEST_CASE("Navigation deltas accumulate per axis", "[input][navigation]") {
    NavigationBatcher batcher(50ms);
    auto t0 = InputClock::now();

    batcher.add("Down", t0);
    batcher.add("Down", t0 + 1ms);
    batcher.add("Down", t0 + 2ms);
    batcher.add("Up", t0 + 3ms);
    batcher.add("Right", t0 + 4ms);
    batcher.add("l", t0 + 5ms);
    batcher.add("h", t0 + 6ms);

    CHECK_FALSE(batcher.shouldFlush(t0 + 20ms));
    CHECK(batcher.shouldFlush(t0 + 56ms));

    auto step = batcher.takeStep();
    REQUIRE(step.has_value());
    CHECK(step->vertical == 2);
    CHECK(step->horizontal == 1);
    CHECK_FALSE(batcher.takeStep().has_value());
}

TEST_CASE("Identical keys inside the debounce window are dropped", "[input][debounce]") {
    EventDebouncer debouncer(8ms);
    auto t0 = InputClock::now();

    CHECK(debouncer.shouldProcess(key("a", t0)));
    CHECK_FALSE(debouncer.shouldProcess(key("a", t0 + 3ms)));
    CHECK(debouncer.shouldProcess(key("b", t0 + 4ms)));
    CHECK(debouncer.shouldProcess(key("b", t0 + 20ms)));

    InputEvent resize;
    resize.kind = InputEventKind::Resize;
    resize.timestamp = t0 + 21ms;
    CHECK(debouncer.shouldProcess(resize));
    CHECK(debouncer.shouldProcess(resize));
}

TEST_CASE("Navigation is released before queued actions", "[input][batch]") {
    EventBatcher batcher(5, 8ms, 50ms);
    auto t0 = InputClock::now();

    batcher.push(key("Down", t0));
    batcher.push(key("Down", t0 + 10ms));
    CHECK_FALSE(batcher.hasPendingEvents(t0 + 11ms));
    CHECK(batcher.takeBatch(t0 + 11ms).empty());

    batcher.push(key("Enter", t0 + 12ms));
    EventBatch batch = batcher.takeBatch(t0 + 13ms);
    REQUIRE(batch.navigation.has_value());
    CHECK(batch.navigation->vertical == 2);
    REQUIRE(batch.events.size() == 1);
    CHECK(batch.events[0].key == "Enter");
    CHECK(batcher.takeBatch(t0 + 14ms).empty());
}

TEST_CASE("Navigation flushes on its own after the quiet period", "[input][batch]") {
    EventBatcher batcher(5, 8ms, 50ms);
    auto t0 = InputClock::now();

    batcher.push(key("Up", t0));
    CHECK(batcher.hasPendingEvents(t0 + 50ms));
    EventBatch batch = batcher.takeBatch(t0 + 50ms);
    REQUIRE(batch.navigation.has_value());
    CHECK(batch.navigation->vertical == -1);
}

TEST_CASE("Batches are capped and the queue drops its oldest events", "[input][batch]") {
    EventBatcher batcher(2, 0ms, 50ms);
    auto t0 = InputClock::now();

    const std::string keys = "abcdef";
    for (size_t i = 0; i < keys.size(); ++i) {
        batcher.push(key(std::string(1, keys[i]), t0 + std::chrono::milliseconds(i)));
    }
    CHECK(batcher.queuedEvents() == 4);

    EventBatch first = batcher.takeBatch(t0 + 10ms);
    REQUIRE(first.events.size() == 2);
    CHECK(first.events[0].key == "c");
    CHECK(first.events[1].key == "d");

    EventBatch second = batcher.takeBatch(t0 + 11ms);
    REQUIRE(second.events.size() == 2);
    CHECK(second.events[1].key == "f");
    CHECK(batcher.queuedEvents() == 0);
}

TEST_CASE("Only arrows and hjkl count as navigation", "[input]") {
    for (const char* name : {"Up", "Down", "Left", "Right", "h", "j", "k", "l"}) {
        CAPTURE(name);
        CHECK(isNavigationKey(name));
    }
    for (const char* name : {"Enter", "Tab", "q", "J", ""}) {
        CAPTURE(name);
        CHECK_FALSE(isNavigationKey(name));
    }
}

} // namespace input_pipeline_tests
