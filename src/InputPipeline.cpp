#include "InputPipeline.hpp"
#include "Logger.hpp"

InputEvent InputEvent::keyPress(const std::string& key, InputClock::time_point timestamp) {
    InputEvent event;
    event.kind = InputEventKind::Key;
    event.key = key;
    event.timestamp = timestamp;
    return event;
}

bool isNavigationKey(const std::string& key) {
    return key == "Up" || key == "Down" || key == "Left" || key == "Right" ||
           key == "k" || key == "j" || key == "h" || key == "l";
}

EventDebouncer::EventDebouncer(std::chrono::milliseconds window)
    : window_(window) {
}

bool EventDebouncer::shouldProcess(const InputEvent& event) {
    if (event.kind != InputEventKind::Key) {
        return true;
    }

    if (lastEvent_ && lastEvent_->sameAs(event) &&
        event.timestamp - lastEvent_->timestamp < window_) {
        return false;
    }

    lastEvent_ = event;
    return true;
}

NavigationBatcher::NavigationBatcher(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

void NavigationBatcher::add(const std::string& key, InputClock::time_point timestamp) {
    lastNavigation_ = timestamp;
    pendingInput_ = true;

    if (key == "Up" || key == "k") {
        --vertical_;
    } else if (key == "Down" || key == "j") {
        ++vertical_;
    } else if (key == "Left" || key == "h") {
        --horizontal_;
    } else if (key == "Right" || key == "l") {
        ++horizontal_;
    }
}

bool NavigationBatcher::shouldFlush(InputClock::time_point now) const {
    return pendingInput_ && now - lastNavigation_ >= timeout_;
}

std::optional<NavigationStep> NavigationBatcher::takeStep() {
    NavigationStep step{vertical_, horizontal_};
    vertical_ = 0;
    horizontal_ = 0;
    pendingInput_ = false;

    if (step.vertical == 0 && step.horizontal == 0) {
        return std::nullopt;
    }
    return step;
}

EventBatcher::EventBatcher(size_t maxBatchSize, std::chrono::milliseconds debounce,
                           std::chrono::milliseconds navigationTimeout)
    : maxBatchSize_(maxBatchSize == 0 ? 1 : maxBatchSize),
      debouncer_(debounce),
      navigation_(navigationTimeout) {
}

void EventBatcher::push(const InputEvent& event) {
    if (!debouncer_.shouldProcess(event)) {
        return;
    }

    if (event.kind == InputEventKind::Key && isNavigationKey(event.key)) {
        navigation_.add(event.key, event.timestamp);
        return;
    }

    queue_.push_back(event);
    while (queue_.size() > maxBatchSize_ * 2) {
        LOG_DEBUG("Input queue full, dropping event '" + queue_.front().key + "'");
        queue_.pop_front();
    }
}

EventBatch EventBatcher::takeBatch(InputClock::time_point now) {
    EventBatch batch;

    if (navigation_.hasPendingInput() && (navigation_.shouldFlush(now) || !queue_.empty())) {
        batch.navigation = navigation_.takeStep();
    }

    while (batch.events.size() < maxBatchSize_ && !queue_.empty()) {
        batch.events.push_back(queue_.front());
        queue_.pop_front();
    }
    return batch;
}

bool EventBatcher::hasPendingEvents(InputClock::time_point now) const {
    return !queue_.empty() || navigation_.shouldFlush(now);
}
