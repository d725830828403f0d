/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "Logger.hpp"
#include "AudioSettings.hpp"
#include "routing/MonoToInterleavedProcessor.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <span>
#include <pthread.h>

namespace hal {

namespace {

using HwParamsPtr = std::unique_ptr<snd_pcm_hw_params_t, decltype(&snd_pcm_hw_params_free)>;

// Copies an ALSA hint string and releases the original.
std::string take_hint(void* hint, const char* id) {
    char* value = snd_device_name_get_hint(hint, id);
    if (!value) return {};
    std::string result(value);
    std::free(value);
    return result;
}

} // namespace

AlsaDriver::AlsaDriver(int sample_rate, int block_size, int num_channels, const std::string& device)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(num_channels)
    , format_(SND_PCM_FORMAT_S32_LE)
    , running_(false)
{
    // Buffers will be resized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

void AlsaDriver::set_callback(AudioCallback callback) {
    callback_ = std::move(callback);
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!setup_pcm()) {
        close_pcm();
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);

    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    snd_pcm_hw_params_t* raw_params = nullptr;
    if ((err = snd_pcm_hw_params_malloc(&raw_params)) < 0) {
        std::cerr << "ALSA: Cannot allocate hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    HwParamsPtr hw_params(raw_params, &snd_pcm_hw_params_free);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot initialize hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params.get(), SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        std::cerr << "ALSA: Cannot set access type (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    // Prefer S32_LE; virtual devices often only take S16_LE
    format_ = SND_PCM_FORMAT_S32_LE;
    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), format_)) < 0) {
        std::cerr << "ALSA: Cannot set S32_LE, falling back to S16_LE" << std::endl;
        format_ = SND_PCM_FORMAT_S16_LE;
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), format_)) < 0) {
            std::cerr << "ALSA: Cannot set sample format (" << snd_strerror(err) << ")" << std::endl;
            return false;
        }
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params.get(), &rate, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set sample rate (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    if (static_cast<int>(rate) != sample_rate_) {
        std::cerr << "ALSA: Requested " << sample_rate_ << " Hz, device uses " << rate << " Hz" << std::endl;
    }
    sample_rate_ = static_cast<int>(rate);

    unsigned int channels = static_cast<unsigned int>(num_channels_);
    if ((err = snd_pcm_hw_params_set_channels_near(pcm_handle_, hw_params.get(), &channels)) < 0) {
        std::cerr << "ALSA: Cannot set channel count (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    num_channels_ = static_cast<int>(channels);

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params.get(), &frames, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period size (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    block_size_ = static_cast<int>(frames);

    // Low latency: a short ring of periods
    unsigned int periods = 4;
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params.get(), &periods, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period count, using device default (" << snd_strerror(err) << ")" << std::endl;
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot set parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    // Update global settings with actual hardware values
    auto& settings = keytone::AudioSettings::instance();
    settings.sample_rate = sample_rate_;
    settings.block_size = block_size_;
    settings.num_channels = num_channels_;

    // Resize internal buffers
    const size_t samples = static_cast<size_t>(block_size_) * static_cast<size_t>(num_channels_);
    mono_buffer_.assign(static_cast<size_t>(block_size_), 0.0f);
    float_interleaved_.assign(samples, 0.0f);
    interleaved_buffer_.assign(samples * static_cast<size_t>(snd_pcm_format_physical_width(format_) / 8), 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    return true;
}

void AlsaDriver::thread_loop() {
    // Set Real-Time Priority (SCHED_FIFO, Priority 80)
    struct sched_param param;
    param.sched_priority = 80;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            keytone::AudioLogger::instance().log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            keytone::AudioLogger::instance().log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        keytone::AudioLogger::instance().log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    }

    while (running_) {
        // Zeroing: no callback means silence, never stale data
        std::fill(mono_buffer_.begin(), mono_buffer_.end(), 0.0f);

        if (callback_) {
            auto start_time = std::chrono::steady_clock::now();

            callback_(std::span<float>(mono_buffer_));

            auto end_time = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count();
            keytone::AudioLogger::instance().log_event("PROC_US", static_cast<float>(duration));
        }

        keytone::MonoToInterleavedProcessor::process(mono_buffer_, float_interleaved_,
                                                     static_cast<size_t>(num_channels_));
        convert_block();

        int err = static_cast<int>(snd_pcm_writei(pcm_handle_, interleaved_buffer_.data(),
                                                  static_cast<snd_pcm_uframes_t>(block_size_)));
        if (err < 0) {
            recover_pcm(err);
        }
    }
}

void AlsaDriver::convert_block() {
    if (format_ == SND_PCM_FORMAT_S32_LE) {
        int32_t* s32_ptr = reinterpret_cast<int32_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < float_interleaved_.size(); ++i) {
            float sample = std::clamp(float_interleaved_[i], -1.0f, 1.0f);
            s32_ptr[i] = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
        }
    } else {
        int16_t* s16_ptr = reinterpret_cast<int16_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < float_interleaved_.size(); ++i) {
            float sample = std::clamp(float_interleaved_[i], -1.0f, 1.0f);
            s16_ptr[i] = static_cast<int16_t>(sample * 32767.0f);
        }
    }
}

void AlsaDriver::recover_pcm(int err) {
    if (err == -EPIPE) {
        keytone::AudioLogger::instance().log_message("ALSA", "Underrun");
        snd_pcm_prepare(pcm_handle_);
    } else if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            snd_pcm_prepare(pcm_handle_);
        }
    } else {
        keytone::AudioLogger::instance().log_message("ALSA", snd_strerror(err));
        snd_pcm_recover(pcm_handle_, err, 1);
    }
}

std::vector<AlsaDriver::DeviceInfo> AlsaDriver::list_devices() {
    std::vector<DeviceInfo> devices;

    void** hints = nullptr;
    int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0) {
        std::cerr << "ALSA: Cannot enumerate devices (" << snd_strerror(err) << ")" << std::endl;
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        std::string name = take_hint(*hint, "NAME");
        std::string io = take_hint(*hint, "IOID");
        // No IOID means the PCM does both directions
        if (name.empty() || (!io.empty() && io != "Output")) continue;

        std::string description = take_hint(*hint, "DESC");
        std::replace(description.begin(), description.end(), '\n', ' ');
        devices.push_back({std::move(name), std::move(description)});
    }

    snd_device_name_free_hint(hints);
    return devices;
}

} // namespace hal
