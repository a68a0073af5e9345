#include "combined_lever.hpp"
#include "value_engine.hpp"
#include <algorithm>
#include <cmath>

bool CombinedLever::on_axis(ThrottleMode mode, float value) {
    last_axis = std::clamp(value, -1.0f, 1.0f);
    have_axis = true;
    return recompute(mode);
}

bool CombinedLever::on_toggle_button(ThrottleMode mode, bool pressed) {
    bool rising = pressed && !toggle_prev;
    toggle_prev = pressed;
    if (!rising || mode != ThrottleMode::Toggle) {
        return false;
    }
    select_dyn = !select_dyn;
    DEBUG_LOG("[lever] toggle -> %s\n", select_dyn ? "dyn brake" : "throttle");
    recompute(mode);
    return true;
}

void CombinedLever::reset() {
    last_axis = 0.0f;
    have_axis = false;
    toggle_prev = false;
    select_dyn = false;
    notch = 0;
    dyn = 0;
    have_output = false;
}

bool CombinedLever::recompute(ThrottleMode mode) {
    if (!have_axis) return false;

    int new_notch = 0;
    int new_dyn = 0;
    float v = last_axis;

    if (mode == ThrottleMode::Split) {
        if (v > SPLIT_DEADZONE) {
            new_notch = std::clamp(static_cast<int>(std::nearbyint(v * 8.0f)), 0, 8);
        } else if (v < -SPLIT_DEADZONE) {
            new_dyn = std::clamp(static_cast<int>(std::nearbyint(std::fabs(v) * 255.0f)), 0, 255);
        }
    } else if (mode == ThrottleMode::Toggle) {
        if (select_dyn) {
            new_dyn = std::clamp(static_cast<int>(std::nearbyint((v + 1.0f) / 2.0f * 255.0f)), 0, 255);
        } else {
            new_notch = throttle_notch_for(v);
        }
    } else {
        return false;
    }

    bool changed = !have_output || new_notch != notch || new_dyn != dyn;
    notch = new_notch;
    dyn = new_dyn;
    have_output = true;
    return changed;
}
