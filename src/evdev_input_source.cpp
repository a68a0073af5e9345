#include "evdev_input_source.hpp"
#include "value_engine.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <iostream>
#include <linux/input.h>
#include <unistd.h>

namespace {

int sign(int value) {
    return (value > 0) - (value < 0);
}

bool is_hat_code(int code) {
    return code >= ABS_HAT0X && code <= ABS_HAT3Y;
}

} // namespace

int EvdevDevice::open_and_init() {
    close_and_free();

    char real_path[PATH_MAX];
    if (realpath(by_id.c_str(), real_path) == nullptr) {
        return -1;
    }
    resolved_path = real_path;

    fd = open(resolved_path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        return -1;
    }

    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        close(fd);
        fd = -1;
        dev = nullptr;
        return -1;
    }

    const char* dev_name = libevdev_get_name(dev);
    name = dev_name ? dev_name : "Unknown";

    read_capabilities();
    load_current_state();
    online = true;
    primed = false;
    return 0;
}

void EvdevDevice::close_and_free() {
    if (dev) {
        libevdev_free(dev);
        dev = nullptr;
    }
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
    online = false;
}

void EvdevDevice::read_capabilities() {
    button_codes.clear();
    axis_codes.clear();
    hat_codes.clear();

    for (int code = BTN_MISC; code <= KEY_MAX; code++) {
        if (libevdev_has_event_code(dev, EV_KEY, code)) {
            button_codes.push_back(code);
        }
    }
    for (int code = 0; code < ABS_MT_SLOT; code++) {
        if (is_hat_code(code)) continue;
        if (libevdev_has_event_code(dev, EV_ABS, code)) {
            axis_codes.push_back(code);
        }
    }
    for (int n = 0; n < 4; n++) {
        int x_code = ABS_HAT0X + 2 * n;
        int y_code = ABS_HAT0Y + 2 * n;
        if (libevdev_has_event_code(dev, EV_ABS, x_code) && libevdev_has_event_code(dev, EV_ABS, y_code)) {
            hat_codes.emplace_back(x_code, y_code);
        }
    }

    buttons.assign(button_codes.size(), false);
    axes.assign(axis_codes.size(), 0.0f);
    hats.assign(hat_codes.size(), HatValue{});
    reported_buttons = buttons;
    reported_axes = axes;
    reported_hats = hats;
}

float EvdevDevice::normalize_axis(int code, int value) const {
    const struct input_absinfo* info = libevdev_get_abs_info(dev, code);
    if (!info || info->maximum <= info->minimum) {
        return 0.0f;
    }
    float v = 2.0f * static_cast<float>(value - info->minimum) /
              static_cast<float>(info->maximum - info->minimum) - 1.0f;
    return std::clamp(v, -1.0f, 1.0f);
}

bool EvdevDevice::drain_events() {
    if (!dev) return false;

    unsigned int flags = LIBEVDEV_READ_FLAG_NORMAL;
    while (true) {
        struct input_event ev;
        int rc = libevdev_next_event(dev, flags, &ev);

        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            continue;
        }
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Kernel buffer overflowed; replay the resync delta
            flags = LIBEVDEV_READ_FLAG_SYNC;
            continue;
        }
        if (rc == -EAGAIN) {
            if (flags == LIBEVDEV_READ_FLAG_SYNC) {
                flags = LIBEVDEV_READ_FLAG_NORMAL;
                continue;
            }
            return true;
        }
        if (rc == -ENODEV) {
            return false;
        }

        std::cerr << "Read error on " << resolved_path << ": " << strerror(-rc) << "\n";
        return false;
    }
}

void EvdevDevice::load_current_state() {
    if (!dev) return;

    for (size_t i = 0; i < button_codes.size(); i++) {
        buttons[i] = libevdev_get_event_value(dev, EV_KEY, button_codes[i]) != 0;
    }
    for (size_t i = 0; i < axis_codes.size(); i++) {
        axes[i] = normalize_axis(axis_codes[i], libevdev_get_event_value(dev, EV_ABS, axis_codes[i]));
    }
    for (size_t i = 0; i < hat_codes.size(); i++) {
        HatValue hat;
        hat.x = sign(libevdev_get_event_value(dev, EV_ABS, hat_codes[i].first));
        // evdev reports up as negative
        hat.y = -sign(libevdev_get_event_value(dev, EV_ABS, hat_codes[i].second));
        hats[i] = hat;
    }
}

EvdevInputSource::EvdevInputSource(const std::vector<std::string>& enabled_by_id)
    : initial_enabled(enabled_by_id) {
    scan();
}

void EvdevInputSource::scan() {
    std::vector<std::string> enabled_paths = devices.empty() ? initial_enabled : enabled_by_id();
    bool enable_all = devices.empty() && initial_enabled.empty();
    devices.clear();

    std::vector<std::string> paths;
    DIR* dir = opendir(INPUT_BY_ID_DIR);
    if (!dir) {
        perror("Failed to open /dev/input/by-id");
        return;
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (strstr(entry->d_name, "event-joystick") == nullptr) continue;
        paths.push_back(std::string(INPUT_BY_ID_DIR) + "/" + entry->d_name);
    }
    closedir(dir);
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        auto device = std::make_unique<EvdevDevice>();
        device->by_id = path;
        device->enabled = enable_all ||
                          std::find(enabled_paths.begin(), enabled_paths.end(), path) != enabled_paths.end();
        if (device->open_and_init() < 0) {
            std::cerr << "Failed to open " << path << "\n";
            device->last_reconnect_attempt = std::chrono::steady_clock::now();
        } else {
            std::cout << "Opened device " << devices.size() << ": " << device->name
                      << " (" << device->button_codes.size() << " buttons, "
                      << device->axis_codes.size() << " axes, "
                      << device->hat_codes.size() << " hats)"
                      << (device->enabled ? "" : " [disabled]") << "\n";
        }
        devices.push_back(std::move(device));
    }
}

const EvdevDevice* EvdevInputSource::get(int device_id) const {
    if (device_id < 0 || device_id >= static_cast<int>(devices.size())) return nullptr;
    return devices[device_id].get();
}

EvdevDevice* EvdevInputSource::get(int device_id) {
    if (device_id < 0 || device_id >= static_cast<int>(devices.size())) return nullptr;
    return devices[device_id].get();
}

std::vector<int> EvdevInputSource::list_devices() const {
    std::vector<int> ids;
    for (size_t i = 0; i < devices.size(); i++) {
        if (devices[i]->enabled && devices[i]->online) {
            ids.push_back(static_cast<int>(i));
        }
    }
    return ids;
}

std::vector<DeviceDescriptor> EvdevInputSource::describe_devices() const {
    std::vector<DeviceDescriptor> out;
    for (size_t i = 0; i < devices.size(); i++) {
        const auto& d = *devices[i];
        DeviceDescriptor desc;
        desc.id = static_cast<int>(i);
        desc.name = d.name.empty() ? d.by_id : d.name;
        desc.by_id = d.by_id;
        desc.enabled = d.enabled;
        desc.online = d.online;
        desc.buttons = static_cast<int>(d.button_codes.size());
        desc.axes = static_cast<int>(d.axis_codes.size());
        desc.hats = static_cast<int>(d.hat_codes.size());
        out.push_back(desc);
    }
    return out;
}

std::string EvdevInputSource::device_name(int device_id) const {
    const EvdevDevice* d = get(device_id);
    return d ? d->name : "";
}

int EvdevInputSource::button_count(int device_id) const {
    const EvdevDevice* d = get(device_id);
    return d ? static_cast<int>(d->button_codes.size()) : 0;
}

int EvdevInputSource::axis_count(int device_id) const {
    const EvdevDevice* d = get(device_id);
    return d ? static_cast<int>(d->axis_codes.size()) : 0;
}

int EvdevInputSource::hat_count(int device_id) const {
    const EvdevDevice* d = get(device_id);
    return d ? static_cast<int>(d->hat_codes.size()) : 0;
}

bool EvdevInputSource::read_button(int device_id, int index) const {
    const EvdevDevice* d = get(device_id);
    if (!d || index < 0 || index >= static_cast<int>(d->buttons.size())) return false;
    return d->buttons[index];
}

float EvdevInputSource::read_axis(int device_id, int index) const {
    const EvdevDevice* d = get(device_id);
    if (!d || index < 0 || index >= static_cast<int>(d->axes.size())) return 0.0f;
    return d->axes[index];
}

HatValue EvdevInputSource::read_hat(int device_id, int index) const {
    const EvdevDevice* d = get(device_id);
    if (!d || index < 0 || index >= static_cast<int>(d->hats.size())) return HatValue{};
    return d->hats[index];
}

void EvdevInputSource::mark_offline(EvdevDevice& device) {
    std::cout << "Disconnect " << device.name << ": " << device.resolved_path << "\n";
    device.close_and_free();
    device.last_reconnect_attempt = std::chrono::steady_clock::now();
    device.reconnect_backoff_ms = RECONNECT_INITIAL_BACKOFF_MS;
}

void EvdevInputSource::attempt_reconnection(EvdevDevice& device) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - device.last_reconnect_attempt);
    if (elapsed.count() < device.reconnect_backoff_ms) {
        return;
    }
    device.last_reconnect_attempt = now;

    if (device.open_and_init() == 0) {
        device.reconnect_backoff_ms = RECONNECT_INITIAL_BACKOFF_MS;
        std::cout << "Successfully reconnected " << device.name << ": " << device.resolved_path << "\n";
    } else {
        device.reconnect_backoff_ms = std::min(device.reconnect_backoff_ms * 2, RECONNECT_MAX_BACKOFF_MS);
    }
}

void EvdevInputSource::pump() {
    for (auto& device : devices) {
        if (!device->enabled) continue;
        if (!device->online) {
            attempt_reconnection(*device);
            continue;
        }
        if (!device->drain_events()) {
            mark_offline(*device);
            continue;
        }
        device->load_current_state();
    }
}

std::vector<RawSample> EvdevInputSource::poll_all() {
    pump();

    std::vector<RawSample> samples;
    for (size_t id = 0; id < devices.size(); id++) {
        EvdevDevice& d = *devices[id];
        if (!d.enabled || !d.online) continue;

        bool report_all = !d.primed;
        d.primed = true;

        for (size_t i = 0; i < d.buttons.size(); i++) {
            if (report_all || d.buttons[i] != d.reported_buttons[i]) {
                RawSample s;
                s.device_id = static_cast<int>(id);
                s.kind = InputKind::Button;
                s.index = static_cast<int>(i);
                s.pressed = d.buttons[i];
                samples.push_back(s);
                d.reported_buttons[i] = d.buttons[i];
            }
        }
        for (size_t i = 0; i < d.axes.size(); i++) {
            if (report_all || std::fabs(d.axes[i] - d.reported_axes[i]) > AXIS_CHANGE_THRESHOLD) {
                RawSample s;
                s.device_id = static_cast<int>(id);
                s.kind = InputKind::Axis;
                s.index = static_cast<int>(i);
                s.axis = d.axes[i];
                samples.push_back(s);
                d.reported_axes[i] = d.axes[i];
            }
        }
        for (size_t i = 0; i < d.hats.size(); i++) {
            if (report_all || d.hats[i] != d.reported_hats[i]) {
                RawSample s;
                s.device_id = static_cast<int>(id);
                s.kind = InputKind::Hat;
                s.index = static_cast<int>(i);
                s.hat = d.hats[i];
                samples.push_back(s);
                d.reported_hats[i] = d.hats[i];
            }
        }
    }
    return samples;
}

bool EvdevInputSource::enable_device(int device_id) {
    EvdevDevice* d = get(device_id);
    if (!d) return false;
    d->enabled = true;
    if (!d->online && d->open_and_init() < 0) {
        std::cerr << "Device " << device_id << " enabled but not available: " << d->by_id << "\n";
        d->last_reconnect_attempt = std::chrono::steady_clock::now();
    }
    return true;
}

bool EvdevInputSource::disable_device(int device_id) {
    EvdevDevice* d = get(device_id);
    if (!d) return false;
    d->enabled = false;
    return true;
}

bool EvdevInputSource::is_enabled(int device_id) const {
    const EvdevDevice* d = get(device_id);
    return d && d->enabled;
}

std::vector<std::string> EvdevInputSource::enabled_by_id() const {
    std::vector<std::string> out;
    for (const auto& d : devices) {
        if (d->enabled) out.push_back(d->by_id);
    }
    return out;
}
