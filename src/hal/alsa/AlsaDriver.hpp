/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef KEYTONE_HAL_ALSA_DRIVER_HPP
#define KEYTONE_HAL_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace hal {

/**
 * @brief ALSA playback driver.
 *
 * The keyer is mono; for multi-channel hardware the driver copies the mono
 * block into every channel while interleaving.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @brief A playable PCM as reported by ALSA's name hints.
     */
    struct DeviceInfo {
        std::string name;
        std::string description;
    };

    /**
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param num_channels Requested hardware channels.
     * @param device ALSA device name.
     */
    AlsaDriver(int sample_rate = 44100, int block_size = 256, int num_channels = 2, const std::string& device = "default");
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    bool start() override;
    void stop() override;
    void set_callback(AudioCallback callback) override;

    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const { return num_channels_; }
    const std::string& device() const { return device_name_; }

    /**
     * @brief Enumerate PCM devices that accept playback.
     */
    static std::vector<DeviceInfo> list_devices();

private:
    void thread_loop();
    bool setup_pcm();
    void close_pcm();
    void recover_pcm(int err);
    void convert_block();

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    snd_pcm_format_t format_;
    AudioCallback callback_;
    std::atomic<bool> running_;
    std::thread processing_thread_;

    // Internal buffers, sized once in setup_pcm()
    std::vector<float> mono_buffer_;
    std::vector<float> float_interleaved_;
    std::vector<uint8_t> interleaved_buffer_;
};

} // namespace hal

#endif // KEYTONE_HAL_ALSA_DRIVER_HPP
