/**
 * @file KeyNames.hpp
 * @brief Mapping between readable key names and Linux evdev key codes.
 */

#ifndef KEYTONE_KEY_NAMES_HPP
#define KEYTONE_KEY_NAMES_HPP

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace keytone {

/**
 * @brief Resolve a key name such as "shift_r", "space", "f5" or "k".
 *
 * Case-insensitive. Single characters map to the key that types them on a
 * US layout.
 *
 * @throws std::invalid_argument if the name is empty or unknown.
 */
int key_code(std::string_view name);

/**
 * @brief Resolve a list of names into a trigger set.
 *
 * @throws std::invalid_argument on the first unknown name.
 */
std::unordered_set<int> key_codes(const std::vector<std::string>& names);

/**
 * @brief Readable name for a code, "code <n>" when the code has no name.
 */
std::string key_name(int code);

/**
 * @brief "a & b & c", for the startup banner.
 */
std::string join_key_names(const std::vector<std::string>& names);

} // namespace keytone

#endif // KEYTONE_KEY_NAMES_HPP
