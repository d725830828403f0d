/**
 * @file ToneSynthesizer.hpp
 * @brief Keyed sine oscillator with a click-free release tail.
 */

#ifndef KEYTONE_TONE_SYNTHESIZER_HPP
#define KEYTONE_TONE_SYNTHESIZER_HPP

#include <cmath>
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif
#include <cstdint>
#include <span>
#include <vector>
#include "../Processor.hpp"
#include "KeySignalSource.hpp"

namespace keytone {

/**
 * @brief Sine tone gated by a KeySignalSource.
 *
 * State machine:
 * - Silent    -> Active     key down
 * - Active    -> Releasing  key up in the middle of a cycle
 * - Active    -> Silent     key up exactly on a cycle boundary
 * - Releasing -> Silent     phase wraps past 2*pi (rising zero-crossing)
 * - Releasing -> Active     key down before the cycle completes
 *
 * The gate is sampled once at the start of every block. Phase advances on every
 * sample in every state, so a later key down continues the same waveform.
 * Phase and state belong to the audio thread.
 */
class ToneSynthesizer : public Processor {
public:
    enum class State {
        Silent,
        Active,
        Releasing
    };

    /**
     * @param frequency Tone frequency in Hz, 0 < frequency < sample_rate / 2.
     * @param sample_rate Output sample rate in Hz, > 0.
     * @param amplitude Peak level in [0, 1].
     * @param keys Gate source; must outlive the synthesizer.
     * @throws std::invalid_argument on a parameter outside its range.
     */
    ToneSynthesizer(double frequency, int sample_rate, float amplitude, const KeySignalSource& keys);

    /**
     * @brief Produce the next `frames` samples.
     *
     * Allocates; the driver callback uses pull() on a preallocated span instead.
     */
    std::vector<float> fill_buffer(size_t frames);

    State state() const { return state_; }
    bool is_active() const { return state_ == State::Active; }
    bool is_releasing() const { return state_ == State::Releasing; }

    double phase() const { return phase_; }
    double phase_increment() const { return phase_increment_; }
    double frequency() const { return frequency_; }
    int sample_rate() const { return sample_rate_; }
    float amplitude() const { return amplitude_; }

    /**
     * @brief Back to Silent at phase 0.
     */
    void reset() override;

    static constexpr double kTwoPi = 2.0 * M_PI;

    // Phases closer than this to a multiple of 2*pi count as a cycle boundary.
    static constexpr double kPhaseEpsilon = 1e-9;

protected:
    void do_pull(std::span<float> output) override;

private:
    void sync_gate();
    void begin_release();
    bool at_cycle_boundary() const;

    const KeySignalSource& keys_;

    double frequency_;
    int sample_rate_;
    float amplitude_;
    double phase_increment_;

    double phase_;
    State state_;
    uint64_t seen_presses_;
};

const char* to_string(ToneSynthesizer::State state);

} // namespace keytone

#endif // KEYTONE_TONE_SYNTHESIZER_HPP
