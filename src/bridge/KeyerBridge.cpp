/**
 * @file KeyerBridge.cpp
 * @brief C-compatible API bridge for the keyer.
 */

#include "CInterface.h"
#include "KeySignalSource.hpp"
#include "KeyNames.hpp"
#include "oscillator/ToneSynthesizer.hpp"
#include <iostream>
#include <memory>
#include <span>
#include <stdexcept>
#include <unordered_set>

namespace {

// Internal handle structure (hidden from C API)
struct KeyerHandleImpl {
    keytone::KeySignalSource keys;
    keytone::ToneSynthesizer synth;

    KeyerHandleImpl(std::unordered_set<int> trigger_keys, double frequency, int sample_rate, float amplitude)
        : keys(std::move(trigger_keys))
        , synth(frequency, sample_rate, amplitude, keys)
    {
    }
};

KeyerHandleImpl* as_keyer(KeyerHandle handle) {
    return static_cast<KeyerHandleImpl*>(handle);
}

} // namespace

extern "C" {

KeyerHandle keyer_create(double frequency, unsigned int sample_rate, float amplitude,
                         const int* trigger_keys, size_t num_keys) {
    if (!trigger_keys || num_keys == 0) return nullptr;

    try {
        std::unordered_set<int> keys(trigger_keys, trigger_keys + num_keys);
        return new KeyerHandleImpl(std::move(keys), frequency, static_cast<int>(sample_rate), amplitude);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[KeyerBridge] " << e.what() << std::endl;
        return nullptr;
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

void keyer_destroy(KeyerHandle handle) {
    delete as_keyer(handle);
}

int keyer_key_down(KeyerHandle handle, int key) {
    if (!handle) return -1;
    as_keyer(handle)->keys.on_key_down(key);
    return 0;
}

int keyer_key_up(KeyerHandle handle, int key) {
    if (!handle) return -1;
    as_keyer(handle)->keys.on_key_up(key);
    return 0;
}

int keyer_process(KeyerHandle handle, float* output, size_t frames) {
    if (!handle || (!output && frames > 0)) return -1;
    as_keyer(handle)->synth.pull(std::span<float>(output, frames));
    return 0;
}

int keyer_is_active(KeyerHandle handle) {
    if (!handle) return -1;
    return as_keyer(handle)->keys.is_active() ? 1 : 0;
}

int keyer_get_state(KeyerHandle handle) {
    if (!handle) return -1;
    switch (as_keyer(handle)->synth.state()) {
        case keytone::ToneSynthesizer::State::Silent: return KEYER_SILENT;
        case keytone::ToneSynthesizer::State::Active: return KEYER_ACTIVE;
        case keytone::ToneSynthesizer::State::Releasing: return KEYER_RELEASING;
    }
    return -1;
}

int keyer_reset(KeyerHandle handle) {
    if (!handle) return -1;
    auto* keyer = as_keyer(handle);
    keyer->keys.release_all();
    keyer->synth.reset();
    return 0;
}

int keyer_key_code(const char* name) {
    if (!name) return -1;
    try {
        return keytone::key_code(name);
    } catch (const std::invalid_argument&) {
        return -1;
    }
}

} // extern "C"
