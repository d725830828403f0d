/**
 * @file KeyboardListener.hpp
 * @brief Linux evdev keyboard reader.
 */

#ifndef KEYTONE_HAL_KEYBOARD_LISTENER_HPP
#define KEYTONE_HAL_KEYBOARD_LISTENER_HPP

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct input_event;

namespace hal {

/**
 * @brief Reads key transitions from /dev/input/event* on its own thread.
 *
 * Events are read regardless of which window has focus, which is what a
 * keyer next to a voice-chat client needs. Reading evdev nodes requires
 * membership of the "input" group (or root).
 *
 * Held keys are tracked per device. The callback sees one press when the
 * first device goes down on a code and one release when the last device lets
 * go. A device that disappears, and the reader thread when it exits, release
 * everything they still hold, so no key stays down without a source.
 */
class KeyboardListener {
public:
    /**
     * @brief Called on the reader thread for every press and release.
     */
    using KeyCallback = std::function<void(int code, bool pressed)>;

    /**
     * @param device_paths evdev nodes to read; empty means every detected keyboard.
     */
    explicit KeyboardListener(std::vector<std::string> device_paths = {});
    ~KeyboardListener();

    KeyboardListener(const KeyboardListener&) = delete;
    KeyboardListener& operator=(const KeyboardListener&) = delete;

    /**
     * @brief Open the devices and start the reader thread.
     *
     * Devices given to attach() are used instead of opening paths. May be
     * called again after the thread has stopped on its own.
     *
     * @return false if no device could be opened.
     */
    bool start();
    void stop();
    bool running() const { return running_; }

    /**
     * @brief Read an already open event stream instead of an evdev path.
     *
     * Takes ownership of `fd` on success. Used for pipes and uinput streams.
     *
     * @return false while the reader thread is running.
     */
    bool attach(int fd, const std::string& label);

    void set_callback(KeyCallback callback);

    /**
     * @brief Paths (or labels) of the devices being read.
     */
    const std::vector<std::string>& devices() const { return opened_paths_; }

    /**
     * @brief evdev nodes that report letter keys and the space bar.
     */
    static std::vector<std::string> find_keyboards();

    /**
     * @brief Kernel-reported name of an evdev node, empty if unreadable.
     */
    static std::string device_name(const std::string& path);

private:
    struct Device {
        std::string path;
        int fd = -1;
        bool lost = false;
        bool dropping = false; // Between SYN_DROPPED and the next SYN_REPORT
        std::unordered_set<int> held;
    };

    void thread_loop();
    void close_devices();
    void reap_finished_thread();

    void handle_event(Device& device, const input_event& event);
    void press(Device& device, int code);
    void release(Device& device, int code);
    void release_all(Device& device);
    void resync(Device& device);

    std::vector<std::string> requested_paths_;
    std::vector<std::string> opened_paths_;
    std::vector<Device> devices_;

    // Reader thread only: number of devices holding each code
    std::unordered_map<int, int> holders_;

    KeyCallback callback_;
    std::atomic<bool> running_;
    std::thread reader_thread_;
};

} // namespace hal

#endif // KEYTONE_HAL_KEYBOARD_LISTENER_HPP
