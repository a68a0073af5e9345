#pragma once

#include "bindings.hpp"

constexpr float SPLIT_DEADZONE = 0.05f;

// One axis driving both throttle notch and dynamic brake.
class CombinedLever {
public:
    // Returns true when the throttle/dyn pair changed.
    bool on_axis(ThrottleMode mode, float value);

    // Rising edge flips the selection in Toggle mode; returns true when it flipped.
    bool on_toggle_button(ThrottleMode mode, bool pressed);

    int throttle_notch() const { return notch; }
    int dyn_brake() const { return dyn; }
    bool dyn_selected() const { return select_dyn; }
    bool has_output() const { return have_output; }

    void reset();

private:
    float last_axis = 0.0f;
    bool have_axis = false;
    bool toggle_prev = false;
    bool select_dyn = false;
    int notch = 0;
    int dyn = 0;
    bool have_output = false;

    bool recompute(ThrottleMode mode);
};
