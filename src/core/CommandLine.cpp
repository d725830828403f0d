#include "CommandLine.hpp"
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace keytone {

namespace {

bool is_flag(const std::string& token) {
    return token.size() > 1 && token[0] == '-';
}

template<typename T>
bool parse_number(const std::string& text, T& out) {
    try {
        size_t consumed = 0;
        if constexpr (std::is_same_v<T, int>) {
            out = std::stoi(text, &consumed);
        } else if constexpr (std::is_same_v<T, float>) {
            out = std::stof(text, &consumed);
        } else {
            out = std::stod(text, &consumed);
        }
        return consumed == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

void CommandLineOptions::apply_to(ToneConfig& config) const {
    if (device) config.device = *device;
    if (keys) config.trigger_keys = *keys;
    if (frequency) config.frequency = *frequency;
    if (volume) config.amplitude = *volume;
    if (sample_rate) config.sample_rate = *sample_rate;
    if (channels) config.channels = *channels;
    if (block_size) config.block_size = *block_size;
    if (input_devices) config.input_devices = *input_devices;
}

bool parse_command_line(const std::vector<std::string>& args, CommandLineOptions& options, std::string& error) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto take_value = [&](std::string& out) -> bool {
            if (i + 1 >= args.size() || is_flag(args[i + 1])) {
                error = "option " + arg + " expects a value";
                return false;
            }
            out = args[++i];
            return true;
        };

        auto take_list = [&](std::vector<std::string>& out) -> bool {
            while (i + 1 < args.size() && !is_flag(args[i + 1])) {
                out.push_back(args[++i]);
            }
            if (out.empty()) {
                error = "option " + arg + " expects at least one value";
                return false;
            }
            return true;
        };

        auto take_number = [&](auto& out) -> bool {
            std::string text;
            if (!take_value(text)) return false;
            using T = std::decay_t<decltype(*out)>;
            T value{};
            if (!parse_number(text, value)) {
                error = "invalid number for " + arg + ": " + text;
                return false;
            }
            out = value;
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-l" || arg == "--list-devices") {
            options.list_devices = true;
        } else if (arg == "-L" || arg == "--list-keyboards") {
            options.list_keyboards = true;
        } else if (arg == "-V" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-d" || arg == "--device") {
            std::string value;
            if (!take_value(value)) return false;
            options.device = value;
        } else if (arg == "-k" || arg == "--keys") {
            std::vector<std::string> values;
            if (!take_list(values)) return false;
            options.keys = values;
        } else if (arg == "-i" || arg == "--input") {
            std::vector<std::string> values;
            if (!take_list(values)) return false;
            options.input_devices = values;
        } else if (arg == "-f" || arg == "--frequency") {
            if (!take_number(options.frequency)) return false;
        } else if (arg == "-v" || arg == "--volume") {
            if (!take_number(options.volume)) return false;
        } else if (arg == "-s" || arg == "--samplerate") {
            if (!take_number(options.sample_rate)) return false;
        } else if (arg == "-c" || arg == "--channels") {
            if (!take_number(options.channels)) return false;
        } else if (arg == "-b" || arg == "--blocksize") {
            if (!take_number(options.block_size)) return false;
        } else if (arg == "--config") {
            std::string value;
            if (!take_value(value)) return false;
            options.config_path = value;
        } else if (arg == "--save-config") {
            std::string value;
            if (!take_value(value)) return false;
            options.save_config_path = value;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }
    return true;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "Play a sine tone while the trigger keys are held.\n\n"
        << "  -l, --list-devices        List ALSA output devices and exit\n"
        << "  -L, --list-keyboards      List detected keyboards and exit\n"
        << "  -d, --device NAME         ALSA output device (default: default)\n"
        << "  -k, --keys KEY...         Trigger keys (default: shift_r)\n"
        << "  -f, --frequency HZ        Tone frequency (default: 600)\n"
        << "  -v, --volume LEVEL        Tone amplitude, 0 to 1 (default: 0.5)\n"
        << "  -s, --samplerate HZ       Sample rate (default: 44100)\n"
        << "  -c, --channels N          Output channels (default: 2)\n"
        << "  -b, --blocksize FRAMES    Frames per audio block (default: 256)\n"
        << "  -i, --input PATH...       evdev keyboard nodes (default: all keyboards)\n"
        << "      --config FILE         Load settings from a JSON file\n"
        << "      --save-config FILE    Write the effective settings to a JSON file\n"
        << "  -V, --verbose             Print audio thread telemetry\n"
        << "  -h, --help                Show this help\n";
    return out.str();
}

} // namespace keytone
