/**
 * @file MonoToInterleavedProcessor.hpp
 * @brief Utility for copying a mono signal into every channel of an interleaved buffer.
 */

#ifndef KEYTONE_MONO_TO_INTERLEAVED_PROCESSOR_HPP
#define KEYTONE_MONO_TO_INTERLEAVED_PROCESSOR_HPP

#include <algorithm>
#include <span>
#include <cstddef>

namespace keytone {

/**
 * @brief A non-owning functional filter for mono-to-N-channel conversion.
 *
 * The keyer is mono; hardware may want one, two or more channels.
 */
class MonoToInterleavedProcessor {
public:
    /**
     * @brief Interleaves mono input into every output channel (L=R=...).
     *
     * Writes min(mono_input.size(), output.size() / channels) frames.
     *
     * @return Number of frames written.
     */
    static size_t process(std::span<const float> mono_input, std::span<float> interleaved_output, size_t channels) {
        if (channels == 0) return 0;

        const size_t frames = std::min(mono_input.size(), interleaved_output.size() / channels);
        for (size_t i = 0; i < frames; ++i) {
            const float sample = mono_input[i];
            for (size_t ch = 0; ch < channels; ++ch) {
                interleaved_output[i * channels + ch] = sample;
            }
        }
        return frames;
    }
};

} // namespace keytone

#endif // KEYTONE_MONO_TO_INTERLEAVED_PROCESSOR_HPP
