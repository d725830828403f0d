/**
 * @file main.cpp
 * @brief keytone: play a sine tone while the trigger keys are held.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include <vector>
#include "CommandLine.hpp"
#include "KeyNames.hpp"
#include "KeySignalSource.hpp"
#include "Logger.hpp"
#include "ToneConfig.hpp"
#include "alsa/AlsaDriver.hpp"
#include "input/KeyboardListener.hpp"
#include "oscillator/ToneSynthesizer.hpp"

using namespace keytone;

namespace {

std::atomic<bool> g_keep_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_keep_running = false;
    }
}

int list_devices() {
    auto devices = hal::AlsaDriver::list_devices();
    std::cout << "Available audio devices:" << std::endl;
    for (const auto& device : devices) {
        std::cout << "  " << device.name;
        if (!device.description.empty()) {
            std::cout << "  (" << device.description << ")";
        }
        std::cout << std::endl;
    }
    return 0;
}

int list_keyboards() {
    auto keyboards = hal::KeyboardListener::find_keyboards();
    if (keyboards.empty()) {
        std::cout << "No readable keyboards under /dev/input" << std::endl;
        return 0;
    }
    std::cout << "Detected keyboards:" << std::endl;
    for (const auto& path : keyboards) {
        std::cout << "  " << path << "  " << hal::KeyboardListener::device_name(path) << std::endl;
    }
    return 0;
}

void print_stream_error(const ToneConfig& config) {
    std::cerr << "Could not start audio stream. Parameters: device=" << config.device
              << ", samplerate=" << config.sample_rate
              << ", channels=" << config.channels
              << ", blocksize=" << config.block_size << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "keytone";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CommandLineOptions options;
    std::string error;
    if (!parse_command_line(args, options, error)) {
        std::cerr << "Error: " << error << "\n\n" << usage(program);
        return 1;
    }

    if (options.show_help) {
        std::cout << usage(program);
        return 0;
    }
    if (options.list_devices) return list_devices();
    if (options.list_keyboards) return list_keyboards();

    ToneConfig config;
    if (options.config_path && !ConfigStore::load_from_file(config, *options.config_path)) {
        return 1;
    }
    options.apply_to(config);

    if (auto problem = config.validate()) {
        std::cerr << "Error: invalid configuration: " << *problem << std::endl;
        return 1;
    }
    if (options.save_config_path && !ConfigStore::save_to_file(config, *options.save_config_path)) {
        return 1;
    }

    // validate() has already resolved every name
    KeySignalSource keys(key_codes(config.trigger_keys));

    // Declared before the driver so the driver thread is joined before the synth is freed
    std::unique_ptr<ToneSynthesizer> synth;
    hal::AlsaDriver driver(config.sample_rate, config.block_size, config.channels, config.device);

    auto start_driver = [&](int sample_rate) -> bool {
        try {
            synth = std::make_unique<ToneSynthesizer>(config.frequency, sample_rate, config.amplitude, keys);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return false;
        }
        ToneSynthesizer* raw_synth = synth.get();
        driver.set_callback([raw_synth](std::span<float> output) {
            raw_synth->pull(output);
        });
        return driver.start();
    };

    if (!start_driver(config.sample_rate)) {
        print_stream_error(config);
        return 1;
    }

    // The device may have picked another rate; rebuild the oscillator for it
    if (driver.sample_rate() != config.sample_rate) {
        const int actual_rate = driver.sample_rate();
        driver.stop();
        if (!start_driver(actual_rate)) {
            print_stream_error(config);
            return 1;
        }
    }

    hal::KeyboardListener listener(config.input_devices);
    listener.set_callback([&keys](int code, bool pressed) {
        if (pressed) {
            keys.on_key_down(code);
        } else {
            keys.on_key_up(code);
        }
    });

    if (!listener.start()) {
        std::cerr << "Could not start keyboard listener" << std::endl;
        driver.stop();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (options.verbose) {
        std::cout << "Output: " << driver.device() << ", " << driver.sample_rate() << " Hz, "
                  << driver.channels() << " ch, " << driver.block_size() << " frames" << std::endl;
        for (const auto& path : listener.devices()) {
            std::cout << "Input: " << path << " " << hal::KeyboardListener::device_name(path) << std::endl;
        }
    }
    std::cout << "Hold " << join_key_names(config.trigger_keys) << " to beep" << std::endl;

    auto& logger = AudioLogger::instance();
    while (g_keep_running && listener.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (options.verbose) {
            logger.flush(std::clog);
        } else {
            while (logger.pop_entry()) {}
        }
    }

    std::cout << "\nProgram ended" << std::endl;
    listener.stop();
    std::cout << "Listener stopped" << std::endl;
    driver.stop();
    return 0;
}
