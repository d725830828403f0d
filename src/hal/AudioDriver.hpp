/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio output drivers.
 *
 * Hardware/OS audio code must be strictly separated from core DSP logic.
 */

#ifndef KEYTONE_AUDIO_DRIVER_HPP
#define KEYTONE_AUDIO_DRIVER_HPP

#include <functional>
#include <span>

namespace hal {

/**
 * @brief Abstract base class for audio output drivers.
 *
 * The driver owns the device and the real-time thread. It calls the mono
 * callback whenever it needs another block and fans the result out to the
 * hardware channels itself.
 */
class AudioDriver {
public:
    /**
     * @brief Callback function type for mono audio processing.
     *
     * Runs on the driver's real-time thread and must not block.
     */
    using AudioCallback = std::function<void(std::span<float> output)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Start the audio driver.
     *
     * @return true if successfully started, false otherwise.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the audio driver.
     */
    virtual void stop() = 0;

    /**
     * @brief Set the mono processing callback. Call before start().
     */
    virtual void set_callback(AudioCallback callback) = 0;

    /**
     * @brief Get the current sample rate.
     *
     * @return int Sample rate in Hz.
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Get the current block size (buffer size).
     *
     * @return int Number of frames per block.
     */
    virtual int block_size() const = 0;
};

} // namespace hal

#endif // KEYTONE_AUDIO_DRIVER_HPP
