/**
 * @file CommandLine.hpp
 * @brief Command-line options for the keytone executable.
 */

#ifndef KEYTONE_COMMAND_LINE_HPP
#define KEYTONE_COMMAND_LINE_HPP

#include <optional>
#include <string>
#include <vector>
#include "ToneConfig.hpp"

namespace keytone {

/**
 * @brief Parsed flags. Unset optionals leave the configuration alone.
 */
struct CommandLineOptions {
    bool show_help = false;
    bool list_devices = false;
    bool list_keyboards = false;
    bool verbose = false;

    std::optional<std::string> config_path;
    std::optional<std::string> save_config_path;

    std::optional<std::string> device;
    std::optional<std::vector<std::string>> keys;
    std::optional<double> frequency;
    std::optional<float> volume;
    std::optional<int> sample_rate;
    std::optional<int> channels;
    std::optional<int> block_size;
    std::optional<std::vector<std::string>> input_devices;

    /**
     * @brief Overwrite the fields of `config` that were given on the command line.
     */
    void apply_to(ToneConfig& config) const;
};

/**
 * @brief Parse arguments (without the program name).
 *
 * @param error Set to a one-line description when parsing fails.
 * @return false on an unknown flag, a missing value, or a malformed number.
 */
bool parse_command_line(const std::vector<std::string>& args, CommandLineOptions& options, std::string& error);

std::string usage(const std::string& program);

} // namespace keytone

#endif // KEYTONE_COMMAND_LINE_HPP
