/**
 * @file ToneSynthesizer.cpp
 * @brief Keyed sine oscillator with a click-free release tail.
 */

#include "ToneSynthesizer.hpp"
#include "Logger.hpp"
#include <stdexcept>
#include <string>

namespace keytone {

ToneSynthesizer::ToneSynthesizer(double frequency, int sample_rate, float amplitude, const KeySignalSource& keys)
    : keys_(keys)
    , frequency_(frequency)
    , sample_rate_(sample_rate)
    , amplitude_(amplitude)
    , phase_increment_(0.0)
    , phase_(0.0)
    , state_(State::Silent)
    , seen_presses_(keys.press_count())
{
    if (sample_rate <= 0) {
        throw std::invalid_argument("Sample rate must be positive, got " + std::to_string(sample_rate));
    }
    if (!std::isfinite(frequency) || frequency <= 0.0) {
        throw std::invalid_argument("Frequency must be positive, got " + std::to_string(frequency));
    }
    if (frequency >= sample_rate / 2.0) {
        throw std::invalid_argument("Frequency " + std::to_string(frequency) +
                                    " Hz is at or above Nyquist for " + std::to_string(sample_rate) + " Hz");
    }
    if (!std::isfinite(amplitude) || amplitude < 0.0f || amplitude > 1.0f) {
        throw std::invalid_argument("Amplitude must be within [0, 1], got " + std::to_string(amplitude));
    }

    phase_increment_ = kTwoPi * frequency_ / sample_rate_;
}

std::vector<float> ToneSynthesizer::fill_buffer(size_t frames) {
    std::vector<float> buffer(frames, 0.0f);
    pull(std::span<float>(buffer));
    return buffer;
}

void ToneSynthesizer::reset() {
    phase_ = 0.0;
    state_ = State::Silent;
    seen_presses_ = keys_.press_count();
}

void ToneSynthesizer::do_pull(std::span<float> output) {
    sync_gate();

    for (auto& sample : output) {
        if (state_ == State::Silent) {
            sample = 0.0f;
        } else {
            sample = static_cast<float>(amplitude_ * std::sin(phase_));
        }

        phase_ += phase_increment_;
        if (phase_ >= kTwoPi - kPhaseEpsilon) {
            phase_ -= kTwoPi;
            if (phase_ < 0.0) phase_ = 0.0;

            if (state_ == State::Releasing) {
                state_ = State::Silent;
                AudioLogger::instance().log_message("KEYER", "Release complete");
            }
        }
    }
}

void ToneSynthesizer::sync_gate() {
    const uint64_t presses = keys_.press_count();
    const bool gate = keys_.is_active();
    const bool missed_press = presses != seen_presses_;
    seen_presses_ = presses;

    if (gate) {
        if (state_ != State::Active) {
            AudioLogger::instance().log_message("KEYER", state_ == State::Releasing ? "Release cancelled" : "Key down");
            state_ = State::Active;
        }
        return;
    }

    if (state_ == State::Active) {
        begin_release();
    } else if (state_ == State::Silent && missed_press) {
        // Press and release both landed between two blocks: play one tail.
        state_ = State::Releasing;
        AudioLogger::instance().log_message("KEYER", "Short press");
    }
}

void ToneSynthesizer::begin_release() {
    if (at_cycle_boundary()) {
        state_ = State::Silent;
        AudioLogger::instance().log_message("KEYER", "Key up on boundary");
    } else {
        state_ = State::Releasing;
        AudioLogger::instance().log_message("KEYER", "Key up");
    }
}

bool ToneSynthesizer::at_cycle_boundary() const {
    return phase_ < kPhaseEpsilon || (kTwoPi - phase_) < kPhaseEpsilon;
}

const char* to_string(ToneSynthesizer::State state) {
    switch (state) {
        case ToneSynthesizer::State::Silent: return "Silent";
        case ToneSynthesizer::State::Active: return "Active";
        case ToneSynthesizer::State::Releasing: return "Releasing";
    }
    return "Unknown";
}

} // namespace keytone
