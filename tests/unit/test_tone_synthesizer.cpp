#include <gtest/gtest.h>
#include "oscillator/ToneSynthesizer.hpp"
#include "KeySignalSource.hpp"
#include "Logger.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using namespace keytone;

namespace {

constexpr int kKey = 37; // KEY_K

double expected_sine(double amplitude, double frequency, int sample_rate, size_t n) {
    return amplitude * std::sin(2.0 * M_PI * frequency * static_cast<double>(n) / sample_rate);
}

} // namespace

class ToneSynthesizerTest : public ::testing::Test {
protected:
    const int sample_rate = 48000;
    const double frequency = 600.0;
    const size_t block_size = 480; // 10 ms

    KeySignalSource keys{std::unordered_set<int>{kKey}};
};

TEST_F(ToneSynthesizerTest, StartsSilentAtPhaseZero) {
    ToneSynthesizer synth(frequency, sample_rate, 1.0f, keys);
    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Silent);
    EXPECT_EQ(synth.phase(), 0.0);

    auto buffer = synth.fill_buffer(64);
    ASSERT_EQ(buffer.size(), 64u);
    for (float sample : buffer) {
        EXPECT_EQ(sample, 0.0f);
    }
}

TEST_F(ToneSynthesizerTest, KeyDownProducesSineFromPhaseZero) {
    ToneSynthesizer synth(frequency, sample_rate, 1.0f, keys);

    keys.on_key_down(kKey);
    auto buffer = synth.fill_buffer(block_size);

    ASSERT_EQ(buffer.size(), block_size);
    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Active);
    for (size_t n = 0; n < block_size; ++n) {
        EXPECT_NEAR(buffer[n], expected_sine(1.0, frequency, sample_rate, n), 1e-5) << "sample " << n;
    }
}

TEST_F(ToneSynthesizerTest, KeyUpOnCycleBoundaryGoesStraightToSilence) {
    ToneSynthesizer synth(frequency, sample_rate, 1.0f, keys);

    keys.on_key_down(kKey);
    synth.fill_buffer(block_size); // 480 samples = exactly 6 cycles of 600 Hz

    keys.on_key_up(kKey);
    auto buffer = synth.fill_buffer(block_size);

    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Silent);
    for (float sample : buffer) {
        EXPECT_EQ(sample, 0.0f);
    }
}

TEST_F(ToneSynthesizerTest, KeyUpMidCycleFinishesTheCycle) {
    ToneSynthesizer synth(frequency, sample_rate, 1.0f, keys);

    keys.on_key_down(kKey);
    synth.fill_buffer(500); // 6.25 cycles, phase = pi/2

    keys.on_key_up(kKey);
    auto buffer = synth.fill_buffer(block_size);

    // 80 samples per cycle, 20 already played: 60 tail samples
    const size_t tail = 60;
    for (size_t n = 0; n < tail; ++n) {
        EXPECT_NEAR(buffer[n], expected_sine(1.0, frequency, sample_rate, 500 + n), 1e-5) << "sample " << n;
        EXPECT_NE(buffer[n], 0.0f) << "sample " << n;
    }
    for (size_t n = tail; n < block_size; ++n) {
        EXPECT_EQ(buffer[n], 0.0f) << "sample " << n;
    }

    EXPECT_LE(std::abs(buffer[tail - 1]), std::sin(synth.phase_increment()) + 1e-6);
    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Silent);
}

TEST_F(ToneSynthesizerTest, PhaseContinuityAcrossBuffers) {
    KeySignalSource other_keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer whole(697.0, 44100, 0.7f, keys);
    ToneSynthesizer chunked(697.0, 44100, 0.7f, other_keys);

    keys.on_key_down(kKey);
    other_keys.on_key_down(kKey);

    auto reference = whole.fill_buffer(1000);

    std::vector<float> joined;
    for (size_t chunk : {1u, 7u, 128u, 300u, 564u}) {
        auto part = chunked.fill_buffer(chunk);
        joined.insert(joined.end(), part.begin(), part.end());
    }

    ASSERT_EQ(joined.size(), reference.size());
    for (size_t n = 0; n < reference.size(); ++n) {
        EXPECT_FLOAT_EQ(joined[n], reference[n]) << "sample " << n;
    }
}

TEST_F(ToneSynthesizerTest, SilenceStillAdvancesPhase) {
    ToneSynthesizer synth(frequency, sample_rate, 1.0f, keys);

    auto buffer = synth.fill_buffer(100);
    for (float sample : buffer) {
        EXPECT_EQ(sample, 0.0f);
    }

    const double expected = std::fmod(100 * synth.phase_increment(), ToneSynthesizer::kTwoPi);
    EXPECT_NEAR(synth.phase(), expected, 1e-9);
}

TEST_F(ToneSynthesizerTest, KeyDownAfterSilenceContinuesTheSameWaveform) {
    ToneSynthesizer synth(frequency, sample_rate, 1.0f, keys);

    synth.fill_buffer(30);
    keys.on_key_down(kKey);
    auto buffer = synth.fill_buffer(10);

    for (size_t n = 0; n < buffer.size(); ++n) {
        EXPECT_NEAR(buffer[n], expected_sine(1.0, frequency, sample_rate, 30 + n), 1e-5);
    }
}

TEST(ToneSynthesizerRelease, TailStaysBelowClickThreshold) {
    // 300 Hz at 48 kHz: 160 samples per cycle, phase step ~0.039 rad
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    const float amplitude = 0.8f;
    ToneSynthesizer synth(300.0, 48000, amplitude, keys);

    keys.on_key_down(kKey);
    synth.fill_buffer(1234); // 114 samples into the current cycle

    keys.on_key_up(kKey);
    auto buffer = synth.fill_buffer(1000);

    size_t first_zero = 0;
    while (first_zero < buffer.size() && buffer[first_zero] != 0.0f) {
        ++first_zero;
    }

    ASSERT_EQ(first_zero, 46u);
    for (size_t n = 0; n < first_zero; ++n) {
        EXPECT_NEAR(buffer[n], expected_sine(amplitude, 300.0, 48000, 1234 + n), 1e-5);
    }
    EXPECT_LT(std::abs(buffer[first_zero - 1]), 0.05f * amplitude);
    for (size_t n = first_zero; n < buffer.size(); ++n) {
        EXPECT_EQ(buffer[n], 0.0f);
    }
}

TEST(ToneSynthesizerRelease, TailSpansSeveralBuffers) {
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer synth(300.0, 48000, 1.0f, keys);

    keys.on_key_down(kKey);
    synth.fill_buffer(10);
    keys.on_key_up(kKey);

    size_t tail_samples = 0;
    int blocks = 0;
    do {
        auto buffer = synth.fill_buffer(32);
        for (float sample : buffer) {
            if (sample != 0.0f) ++tail_samples;
        }
        ++blocks;
        if (synth.state() == ToneSynthesizer::State::Releasing) {
            EXPECT_FALSE(synth.is_active());
        }
    } while (synth.state() != ToneSynthesizer::State::Silent && blocks < 100);

    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Silent);
    EXPECT_EQ(tail_samples, 150u);
    EXPECT_EQ(blocks, 5);
}

TEST(ToneSynthesizerRelease, KeyDownDuringReleaseResumesFullTone) {
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer synth(300.0, 48000, 1.0f, keys);

    keys.on_key_down(kKey);
    synth.fill_buffer(10);
    keys.on_key_up(kKey);
    synth.fill_buffer(32);
    ASSERT_EQ(synth.state(), ToneSynthesizer::State::Releasing);
    EXPECT_TRUE(synth.is_releasing());

    keys.on_key_down(kKey);
    auto buffer = synth.fill_buffer(320);
    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Active);

    // Two full cycles past where the release would have ended
    for (size_t n = 0; n < buffer.size(); ++n) {
        EXPECT_NEAR(buffer[n], expected_sine(1.0, 300.0, 48000, 42 + n), 1e-5) << "sample " << n;
    }
}

TEST(ToneSynthesizerRelease, PressAndReleaseBetweenBuffersStillSounds) {
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer synth(300.0, 48000, 1.0f, keys);

    synth.fill_buffer(16);
    keys.on_key_down(kKey);
    keys.on_key_up(kKey);

    auto buffer = synth.fill_buffer(320);
    EXPECT_NE(buffer[0], 0.0f);
    EXPECT_NE(buffer[143], 0.0f);
    EXPECT_EQ(buffer[144], 0.0f);
    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Silent);

    // The press is consumed once
    auto after = synth.fill_buffer(64);
    for (float sample : after) {
        EXPECT_EQ(sample, 0.0f);
    }
}

TEST(ToneSynthesizerParameters, AmplitudeScalesPeak) {
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer synth(600.0, 48000, 0.25f, keys);

    keys.on_key_down(kKey);
    auto buffer = synth.fill_buffer(80);

    float peak = 0.0f;
    for (float sample : buffer) {
        peak = std::max(peak, std::abs(sample));
    }
    EXPECT_NEAR(peak, 0.25f, 1e-4f);
}

TEST(ToneSynthesizerParameters, RejectsInvalidConfiguration) {
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    EXPECT_THROW(ToneSynthesizer(600.0, 0, 0.5f, keys), std::invalid_argument);
    EXPECT_THROW(ToneSynthesizer(600.0, -44100, 0.5f, keys), std::invalid_argument);
    EXPECT_THROW(ToneSynthesizer(0.0, 44100, 0.5f, keys), std::invalid_argument);
    EXPECT_THROW(ToneSynthesizer(-440.0, 44100, 0.5f, keys), std::invalid_argument);
    EXPECT_THROW(ToneSynthesizer(30000.0, 48000, 0.5f, keys), std::invalid_argument);
    EXPECT_THROW(ToneSynthesizer(600.0, 44100, 1.5f, keys), std::invalid_argument);
    EXPECT_THROW(ToneSynthesizer(600.0, 44100, -0.1f, keys), std::invalid_argument);
    EXPECT_NO_THROW(ToneSynthesizer(600.0, 44100, 0.0f, keys));
}

TEST(ToneSynthesizerParameters, ZeroLengthBuffer) {
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer synth(600.0, 48000, 1.0f, keys);

    keys.on_key_down(kKey);
    EXPECT_TRUE(synth.fill_buffer(0).empty());
    EXPECT_EQ(synth.phase(), 0.0);
}

TEST(ToneSynthesizerParameters, ResetReturnsToSilenceAtPhaseZero) {
    KeySignalSource keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer synth(600.0, 48000, 1.0f, keys);

    keys.on_key_down(kKey);
    synth.fill_buffer(123);
    keys.release_all();
    synth.reset();

    EXPECT_EQ(synth.state(), ToneSynthesizer::State::Silent);
    EXPECT_EQ(synth.phase(), 0.0);
    auto buffer = synth.fill_buffer(32);
    for (float sample : buffer) {
        EXPECT_EQ(sample, 0.0f);
    }
}

TEST(ToneSynthesizerTelemetry, LogsStateTransitions) {
    auto& logger = AudioLogger::instance();
    while (logger.pop_entry()) {}

    KeySignalSource keys{std::unordered_set<int>{kKey}};
    ToneSynthesizer synth(300.0, 48000, 1.0f, keys);

    keys.on_key_down(kKey);
    synth.fill_buffer(10);
    keys.on_key_up(kKey);
    synth.fill_buffer(320);

    std::vector<std::string> messages;
    while (auto entry = logger.pop_entry()) {
        EXPECT_STREQ(entry->tag, "KEYER");
        messages.emplace_back(entry->message);
    }
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0], "Key down");
    EXPECT_EQ(messages[1], "Key up");
    EXPECT_EQ(messages[2], "Release complete");
}

TEST(ToneSynthesizerTelemetry, StateNames) {
    EXPECT_STREQ(to_string(ToneSynthesizer::State::Silent), "Silent");
    EXPECT_STREQ(to_string(ToneSynthesizer::State::Active), "Active");
    EXPECT_STREQ(to_string(ToneSynthesizer::State::Releasing), "Releasing");
}
