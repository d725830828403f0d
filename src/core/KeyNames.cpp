/**
 * @file KeyNames.cpp
 * @brief Mapping between readable key names and Linux evdev key codes.
 */

#include "KeyNames.hpp"
#include <linux/input-event-codes.h>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace keytone {

namespace {

const std::unordered_map<std::string, int>& special_keys() {
    static const std::unordered_map<std::string, int> table = {
        {"alt", KEY_LEFTALT}, {"alt_gr", KEY_RIGHTALT}, {"alt_l", KEY_LEFTALT}, {"alt_r", KEY_RIGHTALT},
        {"backspace", KEY_BACKSPACE}, {"caps_lock", KEY_CAPSLOCK},
        {"cmd", KEY_LEFTMETA}, {"cmd_l", KEY_LEFTMETA}, {"cmd_r", KEY_RIGHTMETA},
        {"ctrl", KEY_LEFTCTRL}, {"ctrl_l", KEY_LEFTCTRL}, {"ctrl_r", KEY_RIGHTCTRL},
        {"delete", KEY_DELETE}, {"down", KEY_DOWN}, {"end", KEY_END}, {"enter", KEY_ENTER}, {"esc", KEY_ESC},
        {"f1", KEY_F1}, {"f2", KEY_F2}, {"f3", KEY_F3}, {"f4", KEY_F4}, {"f5", KEY_F5},
        {"f6", KEY_F6}, {"f7", KEY_F7}, {"f8", KEY_F8}, {"f9", KEY_F9}, {"f10", KEY_F10},
        {"f11", KEY_F11}, {"f12", KEY_F12}, {"f13", KEY_F13}, {"f14", KEY_F14}, {"f15", KEY_F15},
        {"f16", KEY_F16}, {"f17", KEY_F17}, {"f18", KEY_F18}, {"f19", KEY_F19}, {"f20", KEY_F20},
        {"home", KEY_HOME}, {"insert", KEY_INSERT}, {"left", KEY_LEFT},
        {"media_next", KEY_NEXTSONG}, {"media_play_pause", KEY_PLAYPAUSE}, {"media_previous", KEY_PREVIOUSSONG},
        {"media_volume_down", KEY_VOLUMEDOWN}, {"media_volume_mute", KEY_MUTE}, {"media_volume_up", KEY_VOLUMEUP},
        {"menu", KEY_COMPOSE}, {"num_lock", KEY_NUMLOCK}, {"page_down", KEY_PAGEDOWN}, {"page_up", KEY_PAGEUP},
        {"pause", KEY_PAUSE}, {"print_screen", KEY_SYSRQ}, {"right", KEY_RIGHT}, {"scroll_lock", KEY_SCROLLLOCK},
        {"shift", KEY_LEFTSHIFT}, {"shift_l", KEY_LEFTSHIFT}, {"shift_r", KEY_RIGHTSHIFT},
        {"space", KEY_SPACE}, {"tab", KEY_TAB}, {"up", KEY_UP}
    };
    return table;
}

const std::unordered_map<char, int>& character_keys() {
    static const std::unordered_map<char, int> table = {
        {'a', KEY_A}, {'b', KEY_B}, {'c', KEY_C}, {'d', KEY_D}, {'e', KEY_E}, {'f', KEY_F},
        {'g', KEY_G}, {'h', KEY_H}, {'i', KEY_I}, {'j', KEY_J}, {'k', KEY_K}, {'l', KEY_L},
        {'m', KEY_M}, {'n', KEY_N}, {'o', KEY_O}, {'p', KEY_P}, {'q', KEY_Q}, {'r', KEY_R},
        {'s', KEY_S}, {'t', KEY_T}, {'u', KEY_U}, {'v', KEY_V}, {'w', KEY_W}, {'x', KEY_X},
        {'y', KEY_Y}, {'z', KEY_Z},
        {'1', KEY_1}, {'2', KEY_2}, {'3', KEY_3}, {'4', KEY_4}, {'5', KEY_5},
        {'6', KEY_6}, {'7', KEY_7}, {'8', KEY_8}, {'9', KEY_9}, {'0', KEY_0},
        {'-', KEY_MINUS}, {'=', KEY_EQUAL}, {'[', KEY_LEFTBRACE}, {']', KEY_RIGHTBRACE},
        {';', KEY_SEMICOLON}, {'\'', KEY_APOSTROPHE}, {'`', KEY_GRAVE}, {'\\', KEY_BACKSLASH},
        {',', KEY_COMMA}, {'.', KEY_DOT}, {'/', KEY_SLASH}, {' ', KEY_SPACE}
    };
    return table;
}

} // namespace

int key_code(std::string_view name) {
    if (name.empty()) throw std::invalid_argument("Key name cannot be empty");

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    const auto& specials = special_keys();
    if (auto it = specials.find(lower_name); it != specials.end()) {
        return it->second;
    }

    if (lower_name.size() == 1) {
        const auto& chars = character_keys();
        if (auto it = chars.find(lower_name[0]); it != chars.end()) {
            return it->second;
        }
    }

    throw std::invalid_argument("Unknown key: " + std::string(name));
}

std::unordered_set<int> key_codes(const std::vector<std::string>& names) {
    std::unordered_set<int> codes;
    for (const auto& name : names) {
        codes.insert(key_code(name));
    }
    return codes;
}

std::string key_name(int code) {
    // Prefer the sided names (shift_r over shift) for display.
    std::string best;
    for (const auto& [name, value] : special_keys()) {
        if (value != code) continue;
        if (best.empty() || name.size() > best.size() || (name.size() == best.size() && name < best)) {
            best = name;
        }
    }
    if (!best.empty()) return best;

    for (const auto& [c, value] : character_keys()) {
        if (value == code && c != ' ') return std::string(1, c);
    }
    return "code " + std::to_string(code);
}

std::string join_key_names(const std::vector<std::string>& names) {
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) joined += " & ";
        joined += names[i];
    }
    return joined;
}

} // namespace keytone
