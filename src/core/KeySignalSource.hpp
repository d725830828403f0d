/**
 * @file KeySignalSource.hpp
 * @brief Turns trigger key transitions into a single "tone active" gate.
 */

#ifndef KEYTONE_KEY_SIGNAL_SOURCE_HPP
#define KEYTONE_KEY_SIGNAL_SOURCE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_set>

namespace keytone {

/**
 * @brief Tracks which trigger keys are held.
 *
 * on_key_down()/on_key_up() are called from the input thread. The gate
 * (is_active) and the press counter are atomics so the audio thread can read
 * them without taking the lock that guards the pressed set.
 */
class KeySignalSource {
public:
    using KeyCode = int;

    explicit KeySignalSource(std::unordered_set<KeyCode> trigger_keys);

    KeySignalSource(const KeySignalSource&) = delete;
    KeySignalSource& operator=(const KeySignalSource&) = delete;

    void on_key_down(KeyCode key);
    void on_key_up(KeyCode key);

    /**
     * @brief True while at least one trigger key is held. Lock-free.
     */
    bool is_active() const {
        return active_.load(std::memory_order_acquire);
    }

    /**
     * @brief Number of rising edges seen so far. Lock-free.
     *
     * Lets a reader that samples the gate once per buffer notice a press and
     * release that both happened between two reads.
     */
    uint64_t press_count() const {
        return press_count_.load(std::memory_order_acquire);
    }

    bool is_trigger(KeyCode key) const {
        return trigger_keys_.count(key) != 0;
    }

    const std::unordered_set<KeyCode>& trigger_keys() const { return trigger_keys_; }

    size_t pressed_count() const;

    /**
     * @brief Forget every held key and drop the gate.
     */
    void release_all();

private:
    const std::unordered_set<KeyCode> trigger_keys_;

    mutable std::mutex mutex_;
    std::unordered_set<KeyCode> pressed_keys_;

    std::atomic<bool> active_{false};
    std::atomic<uint64_t> press_count_{0};
};

} // namespace keytone

#endif // KEYTONE_KEY_SIGNAL_SOURCE_HPP
