/**
 * @file ToneConfig.hpp
 * @brief Human-readable JSON configuration for the keyer.
 */

#ifndef KEYTONE_TONE_CONFIG_HPP
#define KEYTONE_TONE_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace keytone {

using json = nlohmann::json;

/**
 * @brief Everything the keyer needs at startup.
 */
struct ToneConfig {
    int version = 1;

    // Tone
    double frequency = 600.0;
    float amplitude = 0.5f;

    // Output device
    int sample_rate = 44100;
    int channels = 2;
    int block_size = 256;
    std::string device = "default";

    // Input
    std::vector<std::string> trigger_keys = {"shift_r"};
    std::vector<std::string> input_devices; // Empty: every detected keyboard

    /**
     * @brief Check ranges and key names.
     *
     * @return Description of the first problem, or std::nullopt if valid.
     */
    std::optional<std::string> validate() const;

    // JSON conversion; missing fields keep their defaults
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ToneConfig, version, frequency, amplitude, sample_rate,
                                                channels, block_size, device, trigger_keys, input_devices)
};

/**
 * @brief Manages saving and loading of ToneConfig.
 */
class ConfigStore {
public:
    static bool save_to_file(const ToneConfig& config, const std::string& path);
    static bool load_from_file(ToneConfig& config, const std::string& path);

    /**
     * @brief Convert ToneConfig to JSON string.
     */
    static std::string serialize(const ToneConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Load ToneConfig from JSON string.
     *
     * @return false on malformed JSON or mistyped fields; config is untouched.
     */
    static bool deserialize(ToneConfig& config, const std::string& data);
};

} // namespace keytone

#endif // KEYTONE_TONE_CONFIG_HPP
