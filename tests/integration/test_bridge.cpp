#include <gtest/gtest.h>
#include "CInterface.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

namespace {

float peak(const std::vector<float>& buffer) {
    float max_abs = 0.0f;
    for (float sample : buffer) max_abs = std::max(max_abs, std::abs(sample));
    return max_abs;
}

} // namespace

class BridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        trigger = keyer_key_code("shift_r");
        ASSERT_GE(trigger, 0);
        keyer = keyer_create(600.0, sample_rate, 0.5f, &trigger, 1);
        ASSERT_NE(keyer, nullptr);
    }

    void TearDown() override {
        keyer_destroy(keyer);
    }

    const unsigned int sample_rate = 48000;
    const size_t block_size = 128;
    int trigger = -1;
    KeyerHandle keyer = nullptr;
};

TEST_F(BridgeTest, LifecycleAndProcess) {
    std::vector<float> buffer(block_size, 1.0f);

    // Silent before any key
    EXPECT_EQ(keyer_process(keyer, buffer.data(), block_size), 0);
    EXPECT_EQ(peak(buffer), 0.0f);
    EXPECT_EQ(keyer_get_state(keyer), KEYER_SILENT);

    EXPECT_EQ(keyer_key_down(keyer, trigger), 0);
    EXPECT_EQ(keyer_is_active(keyer), 1);

    EXPECT_EQ(keyer_process(keyer, buffer.data(), block_size), 0);
    EXPECT_EQ(keyer_get_state(keyer), KEYER_ACTIVE);
    EXPECT_GT(peak(buffer), 0.4f);
    EXPECT_LE(peak(buffer), 0.5f + 1e-6f);
}

TEST_F(BridgeTest, KeyUpFinishesTheCycle) {
    std::vector<float> buffer(block_size, 0.0f);

    keyer_key_down(keyer, trigger);
    keyer_process(keyer, buffer.data(), block_size); // 128 of 80-sample cycles: mid-cycle
    keyer_key_up(keyer, trigger);
    EXPECT_EQ(keyer_is_active(keyer), 0);

    keyer_process(keyer, buffer.data(), 16);
    EXPECT_EQ(keyer_get_state(keyer), KEYER_RELEASING);
    EXPECT_GT(peak(std::vector<float>(buffer.begin(), buffer.begin() + 16)), 0.0f);

    // 128 % 80 = 48, so the cycle ends after 32 tail samples
    keyer_process(keyer, buffer.data(), 16);
    EXPECT_EQ(keyer_get_state(keyer), KEYER_SILENT);

    keyer_process(keyer, buffer.data(), block_size);
    EXPECT_EQ(peak(buffer), 0.0f);
}

TEST_F(BridgeTest, OtherKeysAreIgnored) {
    std::vector<float> buffer(block_size, 0.0f);

    EXPECT_EQ(keyer_key_down(keyer, keyer_key_code("space")), 0);
    EXPECT_EQ(keyer_is_active(keyer), 0);

    keyer_process(keyer, buffer.data(), block_size);
    EXPECT_EQ(peak(buffer), 0.0f);
}

TEST_F(BridgeTest, ResetSilencesImmediately) {
    std::vector<float> buffer(block_size, 0.0f);

    keyer_key_down(keyer, trigger);
    keyer_process(keyer, buffer.data(), block_size);
    EXPECT_EQ(keyer_reset(keyer), 0);

    EXPECT_EQ(keyer_is_active(keyer), 0);
    EXPECT_EQ(keyer_get_state(keyer), KEYER_SILENT);
    keyer_process(keyer, buffer.data(), block_size);
    EXPECT_EQ(peak(buffer), 0.0f);
}

// Key events from a host input thread; state queries stay on the thread that processes
TEST_F(BridgeTest, KeysFromAnotherThreadStateOnProcessingThread) {
    std::vector<float> buffer(block_size, 0.0f);
    std::atomic<bool> released{false};

    std::thread input([&]() {
        keyer_key_down(keyer, trigger);
        keyer_key_up(keyer, trigger);
        released = true;
    });

    bool saw_valid_state = true;
    while (!released) {
        keyer_process(keyer, buffer.data(), block_size);
        const int state = keyer_get_state(keyer);
        if (state != KEYER_SILENT && state != KEYER_ACTIVE && state != KEYER_RELEASING) saw_valid_state = false;
    }
    input.join();

    // The tap is heard as at most one cycle, then silence
    keyer_process(keyer, buffer.data(), block_size);
    keyer_process(keyer, buffer.data(), block_size);
    EXPECT_TRUE(saw_valid_state);
    EXPECT_EQ(keyer_get_state(keyer), KEYER_SILENT);
    EXPECT_EQ(keyer_reset(keyer), 0);
}

TEST(BridgeErrorTest, InvalidParametersReturnNull) {
    const int keys[] = {keyer_key_code("k")};

    EXPECT_EQ(keyer_create(600.0, 0, 0.5f, keys, 1), nullptr);
    EXPECT_EQ(keyer_create(30000.0, 44100, 0.5f, keys, 1), nullptr);
    EXPECT_EQ(keyer_create(600.0, 44100, 2.0f, keys, 1), nullptr);
    EXPECT_EQ(keyer_create(600.0, 44100, 0.5f, keys, 0), nullptr);
    EXPECT_EQ(keyer_create(600.0, 44100, 0.5f, nullptr, 1), nullptr);
}

TEST(BridgeErrorTest, NullHandleIsRejected) {
    float sample = 0.0f;
    EXPECT_EQ(keyer_key_down(nullptr, 1), -1);
    EXPECT_EQ(keyer_key_up(nullptr, 1), -1);
    EXPECT_EQ(keyer_process(nullptr, &sample, 1), -1);
    EXPECT_EQ(keyer_is_active(nullptr), -1);
    EXPECT_EQ(keyer_get_state(nullptr), -1);
    EXPECT_EQ(keyer_reset(nullptr), -1);
    keyer_destroy(nullptr);
}

TEST(BridgeErrorTest, KeyCodeLookup) {
    EXPECT_GT(keyer_key_code("ctrl_r"), 0);
    EXPECT_EQ(keyer_key_code("K"), keyer_key_code("k"));
    EXPECT_EQ(keyer_key_code("no_such_key"), -1);
    EXPECT_EQ(keyer_key_code(nullptr), -1);
}
