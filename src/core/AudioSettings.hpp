/**
 * @file AudioSettings.hpp
 * @brief Thread-safe storage for hardware-negotiated audio settings.
 */

#ifndef KEYTONE_AUDIO_SETTINGS_HPP
#define KEYTONE_AUDIO_SETTINGS_HPP

#include <atomic>

namespace keytone {

/**
 * @brief Holds actual hardware settings (Sample Rate, Block Size, Channels).
 *
 * Uses std::atomic to ensure thread-safety between the driver (writer)
 * and the keyer/UI (readers).
 */
struct AudioSettings {
    std::atomic<int> sample_rate{44100};
    std::atomic<int> block_size{256};
    std::atomic<int> num_channels{2};

    // Shared singleton instance for the process
    static AudioSettings& instance() {
        static AudioSettings inst;
        return inst;
    }
};

} // namespace keytone

#endif // KEYTONE_AUDIO_SETTINGS_HPP
