#ifndef INPUT_SOURCE_HPP
#define INPUT_SOURCE_HPP

#include "bindings.hpp"
#include <string>
#include <vector>

struct DeviceDescriptor {
    int id = -1;
    std::string name;
    std::string by_id;
    bool enabled = false;
    bool online = false;
    int buttons = 0;
    int axes = 0;
    int hats = 0;
};

// Joystick state as buttons, normalized axes and hats, addressed by device id and index.
class InputSource {
public:
    virtual ~InputSource() = default;

    // Ids of devices that are enabled and online
    virtual std::vector<int> list_devices() const = 0;
    virtual std::vector<DeviceDescriptor> describe_devices() const = 0;
    virtual std::string device_name(int device_id) const = 0;

    virtual int button_count(int device_id) const = 0;
    virtual int axis_count(int device_id) const = 0;
    virtual int hat_count(int device_id) const = 0;

    // Cached state as of the last pump() or poll_all()
    virtual bool read_button(int device_id, int index) const = 0;
    virtual float read_axis(int device_id, int index) const = 0;
    virtual HatValue read_hat(int device_id, int index) const = 0;

    // Refreshes cached state without producing change samples
    virtual void pump() = 0;

    // Refreshes state and returns every value that changed since the previous call
    virtual std::vector<RawSample> poll_all() = 0;

    virtual bool enable_device(int device_id) = 0;
    virtual bool disable_device(int device_id) = 0;
    virtual bool is_enabled(int device_id) const = 0;
};

#endif // INPUT_SOURCE_HPP
