#include "ToneConfig.hpp"
#include "KeyNames.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace keytone {

std::optional<std::string> ToneConfig::validate() const {
    if (sample_rate <= 0) {
        return "sample rate must be positive (got " + std::to_string(sample_rate) + ")";
    }
    if (!std::isfinite(frequency) || frequency <= 0.0) {
        return "frequency must be positive (got " + std::to_string(frequency) + ")";
    }
    if (frequency >= sample_rate / 2.0) {
        return "frequency must be below half the sample rate (" + std::to_string(sample_rate / 2) + " Hz)";
    }
    if (!std::isfinite(amplitude) || amplitude < 0.0f || amplitude > 1.0f) {
        return "volume must be within [0, 1] (got " + std::to_string(amplitude) + ")";
    }
    if (channels <= 0) {
        return "channel count must be positive (got " + std::to_string(channels) + ")";
    }
    if (block_size <= 0) {
        return "block size must be positive (got " + std::to_string(block_size) + ")";
    }
    if (device.empty()) {
        return "output device name cannot be empty";
    }
    if (trigger_keys.empty()) {
        return "at least one trigger key is required";
    }
    try {
        key_codes(trigger_keys);
    } catch (const std::invalid_argument& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

bool ConfigStore::deserialize(ToneConfig& config, const std::string& data) {
    try {
        json j = json::parse(data);
        config = j.get<ToneConfig>();
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] " << e.what() << std::endl;
        return false;
    }
}

bool ConfigStore::save_to_file(const ToneConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config) << '\n';
    if (!file) {
        std::cerr << "[ConfigStore] Failed to write: " << path << std::endl;
        return false;
    }
    std::cout << "[ConfigStore] Saved configuration to " << path << std::endl;
    return true;
}

bool ConfigStore::load_from_file(ToneConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (!deserialize(config, content)) {
        std::cerr << "[ConfigStore] Failed to deserialize configuration from: " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace keytone
