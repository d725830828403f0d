/**
 * @file CInterface.h
 * @brief C-compatible API layer for the keyer.
 *
 * Lets non-C++ hosts (GUI front ends, plugin wrappers, FFI from other
 * languages) drive the keyer: they deliver key transitions and pull samples
 * from their own audio callback.
 */

#ifndef KEYTONE_C_INTERFACE_H
#define KEYTONE_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Synthesizer state as reported by keyer_get_state()
enum KeyerState {
    KEYER_SILENT = 0,
    KEYER_ACTIVE = 1,
    KEYER_RELEASING = 2
};

// Opaque handle type
typedef void* KeyerHandle;

/**
 * Create a keyer. Returns NULL on invalid parameters or an empty key list.
 * Key codes are Linux evdev codes; see keyer_key_code().
 */
KeyerHandle keyer_create(double frequency, unsigned int sample_rate, float amplitude,
                         const int* trigger_keys, size_t num_keys);
void keyer_destroy(KeyerHandle handle);

// Key transitions (any thread)
int keyer_key_down(KeyerHandle handle, int key);
int keyer_key_up(KeyerHandle handle, int key);

// Fill `frames` mono samples (audio thread)
int keyer_process(KeyerHandle handle, float* output, size_t frames);

// 1 while any trigger key is held, 0 if not, -1 on a bad handle (any thread)
int keyer_is_active(KeyerHandle handle);

// One of KeyerState, -1 on a bad handle (audio thread)
int keyer_get_state(KeyerHandle handle);

// Reset to silence at phase 0 (audio thread, or while no keyer_process call is running)
int keyer_reset(KeyerHandle handle);

// evdev code for a key name such as "shift_r" or "k", -1 if unknown
int keyer_key_code(const char* name);

#ifdef __cplusplus
}
#endif

#endif // KEYTONE_C_INTERFACE_H
