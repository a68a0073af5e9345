#pragma once

#include "tui.hpp"

class DeviceDashboard : public View {
private:
    int scroll_offset;
    std::vector<DeviceDescriptor> devices;

public:
    DeviceDashboard(TUI* parent);

    void draw() override;
    void handle_input(int ch) override;

private:
    void toggle_enabled(const DeviceDescriptor& dev);
    void show_device_details(const DeviceDescriptor& dev);
};
