#ifndef EVDEV_INPUT_SOURCE_HPP
#define EVDEV_INPUT_SOURCE_HPP

#include "input_source.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <libevdev-1.0/libevdev/libevdev.h>

constexpr const char* INPUT_BY_ID_DIR = "/dev/input/by-id";
constexpr int RECONNECT_INITIAL_BACKOFF_MS = 500;
constexpr int RECONNECT_MAX_BACKOFF_MS = 2000;

// One joystick event node, opened through its stable /dev/input/by-id link.
struct EvdevDevice {
    std::string by_id;
    std::string resolved_path;
    std::string name;
    int fd;
    struct libevdev* dev;
    bool enabled;
    bool online;
    bool primed;

    // evdev codes in ascending order; position in the vector is the public index
    std::vector<int> button_codes;
    std::vector<int> axis_codes;
    std::vector<std::pair<int, int>> hat_codes;

    std::vector<bool> buttons;
    std::vector<float> axes;
    std::vector<HatValue> hats;

    // Values as last returned from poll_all()
    std::vector<bool> reported_buttons;
    std::vector<float> reported_axes;
    std::vector<HatValue> reported_hats;

    std::chrono::steady_clock::time_point last_reconnect_attempt;
    int reconnect_backoff_ms;

    EvdevDevice() : fd(-1), dev(nullptr), enabled(false), online(false), primed(false),
                    reconnect_backoff_ms(RECONNECT_INITIAL_BACKOFF_MS) {}
    ~EvdevDevice() { close_and_free(); }

    EvdevDevice(const EvdevDevice&) = delete;
    EvdevDevice& operator=(const EvdevDevice&) = delete;

    int open_and_init();
    void close_and_free();

    // Drains pending events. Returns false when the device went away.
    bool drain_events();
    void load_current_state();

private:
    void read_capabilities();
    float normalize_axis(int code, int value) const;
};

class EvdevInputSource : public InputSource {
public:
    // Empty list enables every joystick that is found
    explicit EvdevInputSource(const std::vector<std::string>& enabled_by_id = {});

    // Re-reads /dev/input/by-id. Device ids are positions in the sorted path list.
    void scan();

    std::vector<int> list_devices() const override;
    std::vector<DeviceDescriptor> describe_devices() const override;
    std::string device_name(int device_id) const override;

    int button_count(int device_id) const override;
    int axis_count(int device_id) const override;
    int hat_count(int device_id) const override;

    bool read_button(int device_id, int index) const override;
    float read_axis(int device_id, int index) const override;
    HatValue read_hat(int device_id, int index) const override;

    void pump() override;
    std::vector<RawSample> poll_all() override;

    bool enable_device(int device_id) override;
    bool disable_device(int device_id) override;
    bool is_enabled(int device_id) const override;

    std::vector<std::string> enabled_by_id() const;

private:
    std::vector<std::unique_ptr<EvdevDevice>> devices;
    std::vector<std::string> initial_enabled;

    const EvdevDevice* get(int device_id) const;
    EvdevDevice* get(int device_id);
    void attempt_reconnection(EvdevDevice& device);
    void mark_offline(EvdevDevice& device);
};

#endif // EVDEV_INPUT_SOURCE_HPP
