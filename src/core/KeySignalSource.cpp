/**
 * @file KeySignalSource.cpp
 * @brief Trigger key tracking.
 */

#include "KeySignalSource.hpp"
#include <utility>

namespace keytone {

KeySignalSource::KeySignalSource(std::unordered_set<KeyCode> trigger_keys)
    : trigger_keys_(std::move(trigger_keys))
{
}

void KeySignalSource::on_key_down(KeyCode key) {
    if (!is_trigger(key)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    const bool was_empty = pressed_keys_.empty();
    pressed_keys_.insert(key);

    if (was_empty) {
        // Counter first: a reader that sees the new gate also sees the edge.
        press_count_.fetch_add(1, std::memory_order_release);
        active_.store(true, std::memory_order_release);
    }
}

void KeySignalSource::on_key_up(KeyCode key) {
    if (!is_trigger(key)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (pressed_keys_.erase(key) == 0) return;

    if (pressed_keys_.empty()) {
        active_.store(false, std::memory_order_release);
    }
}

size_t KeySignalSource::pressed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pressed_keys_.size();
}

void KeySignalSource::release_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    pressed_keys_.clear();
    active_.store(false, std::memory_order_release);
}

} // namespace keytone
