#pragma once

#include "capture.hpp"
#include "input_source.hpp"
#include "udp_transport.hpp"
#include <chrono>
#include <cmath>
#include <functional>
#include <string>
#include <tuple>
#include <vector>

// Scriptable joysticks on a virtual clock. Scheduled changes land when pump() or poll_all()
// runs at or after their time.
class FakeInputSource : public InputSource {
public:
    struct Device {
        std::string name;
        bool enabled = true;
        bool online = true;
        std::vector<bool> buttons;
        std::vector<float> axes;
        std::vector<HatValue> hats;
    };

    int add_device(int buttons, int axes, int hats, const std::string& name = "Fake Stick") {
        Device dev;
        dev.name = name;
        dev.buttons.assign(buttons, false);
        dev.axes.assign(axes, 0.0f);
        dev.hats.assign(hats, HatValue());
        devices.push_back(dev);
        reported.push_back(dev);
        return static_cast<int>(devices.size()) - 1;
    }

    void set_button(int dev, int index, bool pressed) { devices[dev].buttons[index] = pressed; }
    void set_axis(int dev, int index, float value) { devices[dev].axes[index] = value; }
    void set_hat(int dev, int index, int x, int y) { devices[dev].hats[index] = HatValue{x, y}; }

    void at(int offset_ms, std::function<void(FakeInputSource&)> change) {
        scheduled.push_back({clock + std::chrono::milliseconds(offset_ms), std::move(change)});
    }

    std::chrono::steady_clock::time_point now() const { return clock; }
    void advance(std::chrono::milliseconds d) { clock += d; }

    void install_clock(MappingCapture& capture) {
        capture.set_clock([this] { return now(); },
                          [this](std::chrono::milliseconds d) { advance(d); });
    }

    std::vector<int> list_devices() const override {
        std::vector<int> ids;
        for (size_t i = 0; i < devices.size(); i++) {
            if (devices[i].enabled && devices[i].online) ids.push_back(static_cast<int>(i));
        }
        return ids;
    }

    std::vector<DeviceDescriptor> describe_devices() const override {
        std::vector<DeviceDescriptor> out;
        for (size_t i = 0; i < devices.size(); i++) {
            DeviceDescriptor d;
            d.id = static_cast<int>(i);
            d.name = devices[i].name;
            d.by_id = "/dev/input/by-id/fake-" + std::to_string(i) + "-event-joystick";
            d.enabled = devices[i].enabled;
            d.online = devices[i].online;
            d.buttons = static_cast<int>(devices[i].buttons.size());
            d.axes = static_cast<int>(devices[i].axes.size());
            d.hats = static_cast<int>(devices[i].hats.size());
            out.push_back(d);
        }
        return out;
    }

    std::string device_name(int device_id) const override { return valid(device_id) ? devices[device_id].name : ""; }

    int button_count(int device_id) const override {
        return valid(device_id) ? static_cast<int>(devices[device_id].buttons.size()) : 0;
    }
    int axis_count(int device_id) const override {
        return valid(device_id) ? static_cast<int>(devices[device_id].axes.size()) : 0;
    }
    int hat_count(int device_id) const override {
        return valid(device_id) ? static_cast<int>(devices[device_id].hats.size()) : 0;
    }

    bool read_button(int device_id, int index) const override { return devices[device_id].buttons[index]; }
    float read_axis(int device_id, int index) const override { return devices[device_id].axes[index]; }
    HatValue read_hat(int device_id, int index) const override { return devices[device_id].hats[index]; }

    void pump() override {
        pump_count++;
        apply_due();
    }

    std::vector<RawSample> poll_all() override {
        apply_due();
        std::vector<RawSample> out;
        for (int dev : list_devices()) {
            Device& cur = devices[dev];
            Device& rep = reported[dev];
            for (size_t i = 0; i < cur.buttons.size(); i++) {
                if (cur.buttons[i] == rep.buttons[i]) continue;
                RawSample s;
                s.device_id = dev;
                s.kind = InputKind::Button;
                s.index = static_cast<int>(i);
                s.pressed = cur.buttons[i];
                out.push_back(s);
                rep.buttons[i] = cur.buttons[i];
            }
            for (size_t i = 0; i < cur.axes.size(); i++) {
                if (std::fabs(cur.axes[i] - rep.axes[i]) < 0.01f) continue;
                RawSample s;
                s.device_id = dev;
                s.kind = InputKind::Axis;
                s.index = static_cast<int>(i);
                s.axis = cur.axes[i];
                out.push_back(s);
                rep.axes[i] = cur.axes[i];
            }
            for (size_t i = 0; i < cur.hats.size(); i++) {
                if (cur.hats[i] == rep.hats[i]) continue;
                RawSample s;
                s.device_id = dev;
                s.kind = InputKind::Hat;
                s.index = static_cast<int>(i);
                s.hat = cur.hats[i];
                out.push_back(s);
                rep.hats[i] = cur.hats[i];
            }
        }
        return out;
    }

    bool enable_device(int device_id) override {
        if (!valid(device_id)) return false;
        devices[device_id].enabled = true;
        return true;
    }
    bool disable_device(int device_id) override {
        if (!valid(device_id)) return false;
        devices[device_id].enabled = false;
        return true;
    }
    bool is_enabled(int device_id) const override { return valid(device_id) && devices[device_id].enabled; }

    std::vector<Device> devices;
    int pump_count = 0;

private:
    struct Scheduled {
        std::chrono::steady_clock::time_point when;
        std::function<void(FakeInputSource&)> change;
    };

    std::vector<Device> reported;
    std::vector<Scheduled> scheduled;
    std::chrono::steady_clock::time_point clock{std::chrono::seconds(1000)};

    bool valid(int device_id) const { return device_id >= 0 && device_id < static_cast<int>(devices.size()); }

    void apply_due() {
        for (auto it = scheduled.begin(); it != scheduled.end();) {
            if (it->when <= clock) {
                auto change = std::move(it->change);
                it = scheduled.erase(it);
                change(*this);
            } else {
                ++it;
            }
        }
    }
};

class RecordingTransport : public Transport {
public:
    struct Sent {
        uint16_t id;
        uint8_t value;
        bool high_priority;
    };

    bool send(uint16_t function_id, uint8_t value, bool high_priority) override {
        attempts++;
        if (fail) return false;
        sent.push_back({function_id, value, high_priority});
        return true;
    }

    std::vector<uint8_t> values_for(uint16_t id) const {
        std::vector<uint8_t> out;
        for (const auto& s : sent) {
            if (s.id == id) out.push_back(s.value);
        }
        return out;
    }

    std::vector<Sent> sent;
    int attempts = 0;
    bool fail = false;
};

inline RawSample button_sample(int dev, int index, bool pressed) {
    RawSample s;
    s.device_id = dev;
    s.kind = InputKind::Button;
    s.index = index;
    s.pressed = pressed;
    return s;
}

inline RawSample axis_sample(int dev, int index, float value) {
    RawSample s;
    s.device_id = dev;
    s.kind = InputKind::Axis;
    s.index = index;
    s.axis = value;
    return s;
}

inline RawSample hat_sample(int dev, int index, int x, int y) {
    RawSample s;
    s.device_id = dev;
    s.kind = InputKind::Hat;
    s.index = index;
    s.hat = HatValue{x, y};
    return s;
}

inline InputLocator button_at(int dev, int index) { return InputLocator{dev, InputKind::Button, index, std::nullopt}; }
inline InputLocator axis_at(int dev, int index) { return InputLocator{dev, InputKind::Axis, index, std::nullopt}; }
inline InputLocator hat_at(int dev, int index, std::optional<HatDirection> dir = std::nullopt) {
    return InputLocator{dev, InputKind::Hat, index, dir};
}
