#pragma once
#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>

using InputClock = std::chrono::steady_clock;

enum class InputEventKind {
    Key,
    Resize,
    Quit
};

struct InputEvent {
    InputEventKind kind{InputEventKind::Key};
    std::string key;  // "Up", "Down", "Left", "Right", "Enter", "Tab", "Esc" or a single character
    InputClock::time_point timestamp;

    static InputEvent keyPress(const std::string& key, InputClock::time_point timestamp);

    // Identity ignores the timestamp
    bool sameAs(const InputEvent& other) const { return kind == other.kind && key == other.key; }
};

struct NavigationStep {
    int vertical{0};    // positive is down
    int horizontal{0};  // positive is right
};

// Arrow keys and h/j/k/l
bool isNavigationKey(const std::string& key);

class EventDebouncer {
public:
    explicit EventDebouncer(std::chrono::milliseconds window);

    // False for a key event identical to the previous one inside the window.
    // Non-key events always pass.
    bool shouldProcess(const InputEvent& event);

private:
    std::chrono::milliseconds window_;
    std::optional<InputEvent> lastEvent_;
};

class NavigationBatcher {
public:
    explicit NavigationBatcher(std::chrono::milliseconds timeout);

    void add(const std::string& key, InputClock::time_point timestamp);
    bool hasPendingSteps() const { return vertical_ != 0 || horizontal_ != 0; }
    bool hasPendingInput() const { return pendingInput_; }
    // True once the quiet period since the last navigation key has elapsed
    bool shouldFlush(InputClock::time_point now) const;
    // Resets the batch; empty when the deltas cancel out
    std::optional<NavigationStep> takeStep();

private:
    std::chrono::milliseconds timeout_;
    int vertical_{0};
    int horizontal_{0};
    bool pendingInput_{false};
    InputClock::time_point lastNavigation_;
};

struct EventBatch {
    std::optional<NavigationStep> navigation;
    std::vector<InputEvent> events;

    bool empty() const { return !navigation && events.empty(); }
};

class EventBatcher {
public:
    EventBatcher(size_t maxBatchSize, std::chrono::milliseconds debounce,
                 std::chrono::milliseconds navigationTimeout);

    void push(const InputEvent& event);
    // A pending navigation step is released when its window closes or when
    // other events are waiting behind it, then up to maxBatchSize events.
    EventBatch takeBatch(InputClock::time_point now);
    bool hasPendingEvents(InputClock::time_point now) const;

    size_t queuedEvents() const { return queue_.size(); }

private:
    size_t maxBatchSize_;
    EventDebouncer debouncer_;
    NavigationBatcher navigation_;
    std::deque<InputEvent> queue_;
};
