/**
 * @file Processor.hpp
 * @brief Base class for digital signal processing (DSP) components.
 *
 * - Separation of Concerns: Core DSP logic must be strictly separated from
 *   hardware/OS audio and input code.
 * - Pull Model: Output pulls from processors.
 */

#ifndef KEYTONE_PROCESSOR_HPP
#define KEYTONE_PROCESSOR_HPP

#include <span>
#include <chrono>
#include <cstddef>
#include "InputSource.hpp"

namespace keytone {

/**
 * @brief Base class for audio processing units (Pull Model).
 *
 * Subclasses implement do_pull(); pull() wraps it with block timing so the
 * cost of the audio callback can be inspected from tests and tools.
 */
class Processor : public InputSource {
public:
    /**
     * @brief Performance metrics structure.
     */
    struct PerformanceMetrics {
        std::chrono::nanoseconds last_execution_time{0};
        std::chrono::nanoseconds max_execution_time{0};
        size_t total_blocks_processed{0};
    };

    virtual ~Processor() = default;

    /**
     * @brief Pull data into output span (Pull Model).
     *
     * @param output Output buffer to fill (mono, block-based)
     */
    void pull(std::span<float> output) override {
        const auto start = std::chrono::steady_clock::now();

        do_pull(output);

        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);
        metrics_.last_execution_time = elapsed;
        if (elapsed > metrics_.max_execution_time) {
            metrics_.max_execution_time = elapsed;
        }
        ++metrics_.total_blocks_processed;
    }

    /**
     * @brief Reset internal state.
     */
    virtual void reset() = 0;

    PerformanceMetrics get_metrics() const {
        return metrics_;
    }

protected:
    /**
     * @brief Pure virtual method for subclasses to implement actual processing.
     *
     * @param output Output buffer to fill
     */
    virtual void do_pull(std::span<float> output) = 0;

private:
    PerformanceMetrics metrics_;
};

} // namespace keytone

#endif // KEYTONE_PROCESSOR_HPP
