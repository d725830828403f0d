/**
 * @file KeyboardListener.cpp
 * @brief Linux evdev keyboard reader.
 */

#include "KeyboardListener.hpp"
#include <linux/input.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace hal {

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr size_t kBitsPerLong = sizeof(unsigned long) * 8;

bool test_bit(const unsigned long* bits, int bit) {
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

bool looks_like_keyboard(int fd) {
    std::array<unsigned long, KEY_MAX / kBitsPerLong + 1> key_bits{};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits.data()) < 0) {
        return false;
    }
    return test_bit(key_bits.data(), KEY_A) && test_bit(key_bits.data(), KEY_Z)
        && test_bit(key_bits.data(), KEY_SPACE);
}

} // namespace

KeyboardListener::KeyboardListener(std::vector<std::string> device_paths)
    : requested_paths_(std::move(device_paths))
    , running_(false)
{
}

KeyboardListener::~KeyboardListener() {
    stop();
}

void KeyboardListener::set_callback(KeyCallback callback) {
    callback_ = std::move(callback);
}

bool KeyboardListener::attach(int fd, const std::string& label) {
    reap_finished_thread();
    if (running_ || fd < 0) return false;

    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0 && !(flags & O_NONBLOCK)) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    Device device;
    device.path = label;
    device.fd = fd;
    devices_.push_back(std::move(device));
    opened_paths_.push_back(label);
    return true;
}

bool KeyboardListener::start() {
    reap_finished_thread();
    if (running_) return true;

    if (devices_.empty()) {
        std::vector<std::string> paths = requested_paths_.empty() ? find_keyboards() : requested_paths_;
        if (paths.empty()) {
            std::cerr << "[KeyboardListener] No keyboard found under /dev/input (is the user in the 'input' group?)" << std::endl;
            return false;
        }

        for (const auto& path : paths) {
            int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
            if (fd < 0) {
                std::cerr << "[KeyboardListener] Cannot open " << path << " (" << std::strerror(errno) << ")" << std::endl;
                continue;
            }
            attach(fd, path);
        }
    }

    if (devices_.empty()) {
        return false;
    }

    holders_.clear();
    running_ = true;
    reader_thread_ = std::thread(&KeyboardListener::thread_loop, this);
    return true;
}

void KeyboardListener::stop() {
    running_ = false;
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    close_devices();
}

void KeyboardListener::reap_finished_thread() {
    // The thread clears running_ itself when its last device is gone
    if (!running_ && reader_thread_.joinable()) {
        reader_thread_.join();
        close_devices();
    }
}

void KeyboardListener::close_devices() {
    for (auto& device : devices_) {
        if (device.fd >= 0) ::close(device.fd);
    }
    devices_.clear();
    opened_paths_.clear();
}

void KeyboardListener::press(Device& device, int code) {
    if (!device.held.insert(code).second) return; // auto-repeat
    if (holders_[code]++ == 0 && callback_) {
        callback_(code, true);
    }
}

void KeyboardListener::release(Device& device, int code) {
    if (device.held.erase(code) == 0) return;
    if (--holders_[code] == 0) {
        holders_.erase(code);
        if (callback_) callback_(code, false);
    }
}

void KeyboardListener::release_all(Device& device) {
    const std::vector<int> codes(device.held.begin(), device.held.end());
    for (int code : codes) {
        release(device, code);
    }
}

void KeyboardListener::resync(Device& device) {
    std::array<unsigned long, KEY_MAX / kBitsPerLong + 1> key_state{};
    if (ioctl(device.fd, EVIOCGKEY(sizeof(key_state)), key_state.data()) < 0) {
        // State unknown: assume everything went up
        release_all(device);
        return;
    }

    const std::vector<int> codes(device.held.begin(), device.held.end());
    for (int code : codes) {
        if (!test_bit(key_state.data(), code)) release(device, code);
    }
    for (int code = 0; code <= KEY_MAX; ++code) {
        if (test_bit(key_state.data(), code)) press(device, code);
    }
}

void KeyboardListener::handle_event(Device& device, const input_event& event) {
    if (event.type == EV_SYN) {
        if (event.code == SYN_DROPPED) {
            device.dropping = true;
        } else if (event.code == SYN_REPORT && device.dropping) {
            device.dropping = false;
            resync(device);
        }
        return;
    }

    // The kernel queue overflowed; everything up to the next report is stale
    if (device.dropping || event.type != EV_KEY) return;

    // value: 0 release, 1 press, 2 auto-repeat
    if (event.value == 0) {
        release(device, static_cast<int>(event.code));
    } else {
        press(device, static_cast<int>(event.code));
    }
}

void KeyboardListener::thread_loop() {
    std::vector<pollfd> poll_fds;
    for (const auto& device : devices_) {
        poll_fds.push_back({device.fd, POLLIN, 0});
    }

    auto drop_device = [&](size_t i, const char* reason) {
        std::cerr << "[KeyboardListener] Lost device " << devices_[i].path << " (" << reason << ")" << std::endl;
        devices_[i].lost = true;
        // poll() skips negative descriptors; the fd itself is closed in close_devices()
        poll_fds[i].fd = -1;
        release_all(devices_[i]);
    };

    std::array<input_event, 64> events;

    while (running_) {
        int ready = ::poll(poll_fds.data(), poll_fds.size(), kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[KeyboardListener] poll failed (" << std::strerror(errno) << ")" << std::endl;
            break;
        }
        if (ready == 0) continue;

        for (size_t i = 0; i < poll_fds.size(); ++i) {
            auto& pfd = poll_fds[i];
            if (pfd.fd < 0 || pfd.revents == 0) continue;

            if (!(pfd.revents & POLLIN)) {
                drop_device(i, "hangup");
                continue;
            }

            // Pending events are read before a hangup is acted on
            ssize_t bytes = ::read(pfd.fd, events.data(), sizeof(events));
            if (bytes < 0) {
                if (errno != EAGAIN && errno != EINTR) {
                    drop_device(i, std::strerror(errno));
                }
                continue;
            }
            if (bytes == 0) {
                drop_device(i, "end of stream");
                continue;
            }

            const size_t count = static_cast<size_t>(bytes) / sizeof(input_event);
            for (size_t e = 0; e < count; ++e) {
                handle_event(devices_[i], events[e]);
            }
        }

        if (std::all_of(devices_.begin(), devices_.end(), [](const Device& d) { return d.lost; })) {
            std::cerr << "[KeyboardListener] No input devices left" << std::endl;
            break;
        }
    }

    for (auto& device : devices_) {
        release_all(device);
    }
    running_ = false;
}

std::vector<std::string> KeyboardListener::find_keyboards() {
    std::vector<std::string> keyboards;

    std::error_code ec;
    std::filesystem::directory_iterator it("/dev/input", ec);
    if (ec) {
        std::cerr << "[KeyboardListener] Cannot list /dev/input (" << ec.message() << ")" << std::endl;
        return keyboards;
    }

    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) != 0) continue;

        int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;
        if (looks_like_keyboard(fd)) {
            keyboards.push_back(entry.path().string());
        }
        ::close(fd);
    }

    std::sort(keyboards.begin(), keyboards.end());
    return keyboards;
}

std::string KeyboardListener::device_name(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) return {};

    std::array<char, 256> name{};
    std::string result;
    if (ioctl(fd, EVIOCGNAME(name.size() - 1), name.data()) >= 0) {
        result = name.data();
    }
    ::close(fd);
    return result;
}

} // namespace hal
