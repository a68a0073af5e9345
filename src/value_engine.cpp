#include "value_engine.hpp"
#include <algorithm>
#include <cmath>

// Lever laws round half to even (nearbyint under the default rounding mode)
int throttle_notch_for(float v) {
    return std::clamp(static_cast<int>(std::nearbyint((v + 1.0f) / 2.0f * 8.0f)), 0, 8);
}

int reverser_axis_value_for(float v) {
    if (v < -0.8f) return REVERSER_REVERSE_VALUE;
    if (v > 0.8f) return REVERSER_FORWARD_VALUE;
    return REVERSER_NEUTRAL_VALUE;
}

int dyn_brake_value_for(float v) {
    if (v <= -0.95f) return 0;
    float norm = (v + 0.95f) / 1.95f;
    return std::clamp(static_cast<int>(std::nearbyint(norm * 254.0f)) + 1, 1, 255);
}

int brake_value_for(float v) {
    return std::clamp(static_cast<int>(std::nearbyint((v + 1.0f) / 2.0f * 255.0f)), 0, 255);
}

ValueEngine::ValueEngine(const FunctionCatalog& catalog, MappingTable& table)
    : catalog(catalog), table(table) {
    init_counters();
    table.add_listener([this](TableChange change, const std::string& function) {
        on_table_change(change, function);
    });
}

void ValueEngine::init_counters() {
    counters.clear();
    for (const auto& spec : catalog.all()) {
        if (multiway_positions(spec.behavior) > 0) {
            counters[spec.name] = 0;
        }
    }
}

int ValueEngine::counter(const std::string& function) const {
    auto it = counters.find(function);
    return it == counters.end() ? 0 : it->second;
}

void ValueEngine::reset() {
    prev.clear();
    latest.clear();
    init_counters();
    reverser_switch.reset();
    combined.reset();
}

void ValueEngine::forget(const std::string& function) {
    for (auto it = prev.begin(); it != prev.end();) {
        if (it->first.first == function) {
            it = prev.erase(it);
        } else {
            ++it;
        }
    }
}

void ValueEngine::on_table_change(TableChange change, const std::string& function) {
    switch (change) {
        case TableChange::Mapping:
            forget(function);
            break;
        case TableChange::ReverserPosition:
            break;
        case TableChange::ReverserMode:
            reverser_switch.reset();
            forget(FN_REVERSER);
            break;
        case TableChange::ThrottleMode:
            combined.reset();
            forget(FN_THROTTLE);
            forget(FN_DYN_BRAKE);
            break;
    }
}

bool ValueEngine::is_active(const InputLocator& locator, const RawSample& sample) {
    switch (sample.kind) {
        case InputKind::Button:
            return sample.pressed;
        case InputKind::Axis:
            return std::fabs(sample.axis) > DEADZONE;
        case InputKind::Hat:
            if (locator.direction) {
                return hat_points(sample.hat, *locator.direction);
            }
            return !sample.hat.centered();
    }
    return false;
}

bool ValueEngine::currently_active(const std::optional<InputLocator>& locator) const {
    if (!locator) return false;
    auto it = latest.find(SourceKey{locator->device_id, locator->kind, locator->index});
    if (it == latest.end()) return false;
    return is_active(*locator, it->second);
}

bool ValueEngine::active_in_batch(const std::optional<InputLocator>& locator,
                                  const std::vector<RawSample>& samples) {
    if (!locator) return false;
    for (const auto& s : samples) {
        if (locator->same_source(s.device_id, s.kind, s.index) && is_active(*locator, s)) {
            return true;
        }
    }
    return false;
}

bool ValueEngine::touched_in_batch(const std::optional<InputLocator>& locator,
                                   const std::vector<RawSample>& samples) {
    if (!locator) return false;
    for (const auto& s : samples) {
        if (locator->same_source(s.device_id, s.kind, s.index)) return true;
    }
    return false;
}

int ValueEngine::lever_value(const std::string& function, float v, bool reverse) const {
    if (reverse) v = -v;
    v = std::clamp(v, -1.0f, 1.0f);

    if (function == FN_THROTTLE) return throttle_notch_for(v);
    if (function == FN_REVERSER) return reverser_axis_value_for(v);
    if (function == FN_DYN_BRAKE) return dyn_brake_value_for(v);
    return brake_value_for(v);
}

ProcessResult ValueEngine::process(const std::string& function, const InputLocator& locator,
                                   const RawSample& sample) {
    const FunctionSpec& spec = catalog.by_name(function);

    if (function == FN_REVERSER && table.reverser_mode() != ReverserMode::Axis) {
        return {true, reverser_switch.value()};
    }

    PrevValue& p = prev[PrevKey{function, locator}];

    switch (spec.behavior) {
        case Behavior::Lever: {
            if (sample.kind != InputKind::Axis) {
                return {};
            }
            auto mapping = table.get(function);
            bool reverse = mapping && mapping->reverse_axis;
            int value = lever_value(function, sample.axis, reverse);
            if (value == p.value) {
                return {};
            }
            p.value = value;
            return {true, value};
        }

        case Behavior::Momentary: {
            bool active = is_active(locator, sample);
            if (active == p.active) {
                return {};
            }
            p.active = active;
            return {true, active ? 1 : 0};
        }

        case Behavior::Toggle:
        case Behavior::Button: {
            bool active = is_active(locator, sample);
            bool rising = active && !p.active;
            p.active = active;
            if (rising) {
                return {true, 1};
            }
            return {};
        }

        case Behavior::ThreeWay:
        case Behavior::FourWay:
        case Behavior::FiveWay: {
            bool whole_hat = sample.kind == InputKind::Hat && !locator.direction;
            if (whole_hat && spec.behavior != Behavior::FiveWay) {
                int position;
                if (spec.behavior == Behavior::ThreeWay) {
                    // Diagonals resolve by their vertical component
                    position = sample.hat.y < 0 ? 0 : (sample.hat.y > 0 ? 2 : 1);
                } else {
                    auto dir = cardinal_direction(sample.hat);
                    position = 0;
                    if (dir == HatDirection::Left) position = 1;
                    else if (dir == HatDirection::Up) position = 2;
                    else if (dir == HatDirection::Right) position = 3;
                }
                if (position == p.value) {
                    return {};
                }
                p.value = position;
                return {true, position};
            }

            bool active = is_active(locator, sample);
            bool rising = active && !p.active;
            p.active = active;
            if (!rising) {
                return {};
            }
            int& count = counters[function];
            count = (count + 1) % multiway_positions(spec.behavior);
            return {true, count};
        }
    }
    return {};
}

void ValueEngine::run_reverser(ReverserMode mode, const std::vector<RawSample>& samples, CommandQueue& queue) {
    auto forward = table.reverser_position(ReverserPosition::Forward);
    auto neutral = table.reverser_position(ReverserPosition::Neutral);
    auto reverse = table.reverser_position(ReverserPosition::Reverse);

    bool changed = false;
    if (mode == ReverserMode::ThreeWay) {
        changed = reverser_switch.apply_three_way(active_in_batch(forward, samples),
                                                  active_in_batch(neutral, samples),
                                                  active_in_batch(reverse, samples));
    } else if (mode == ReverserMode::TwoWay) {
        if (!touched_in_batch(forward, samples) && !touched_in_batch(reverse, samples)) {
            return;
        }
        changed = reverser_switch.apply_two_way(currently_active(forward), currently_active(reverse));
    }

    if (changed) {
        queue.push(catalog.by_name(FN_REVERSER).id, reverser_switch.value());
    }
}

void ValueEngine::run_combined(ThrottleMode mode, const std::vector<RawSample>& samples, CommandQueue& queue) {
    auto lever_mapping = table.get(FN_THROTTLE);
    auto toggle_mapping = table.get(FN_THROTTLE_DYN_TOGGLE);

    bool changed = false;
    for (const auto& s : samples) {
        if (toggle_mapping && toggle_mapping->locator.same_source(s.device_id, s.kind, s.index)) {
            if (combined.on_toggle_button(mode, is_active(toggle_mapping->locator, s))) {
                changed = true;
            }
        }
        if (lever_mapping && s.kind == InputKind::Axis &&
            lever_mapping->locator.same_source(s.device_id, s.kind, s.index)) {
            float v = lever_mapping->reverse_axis ? -s.axis : s.axis;
            if (combined.on_axis(mode, v)) {
                changed = true;
            }
        }
    }

    if (changed && combined.has_output()) {
        queue.push(catalog.by_name(FN_THROTTLE).id, combined.throttle_notch());
        queue.push(catalog.by_name(FN_DYN_BRAKE).id, combined.dyn_brake());
    }
}

void ValueEngine::run_tick(const std::vector<RawSample>& samples, CommandQueue& queue) {
    for (const auto& s : samples) {
        latest[SourceKey{s.device_id, s.kind, s.index}] = s;
    }

    ReverserMode rev_mode = table.reverser_mode();
    ThrottleMode thr_mode = table.throttle_mode();

    if (rev_mode != ReverserMode::Axis) {
        run_reverser(rev_mode, samples, queue);
    }
    if (thr_mode != ThrottleMode::Separate) {
        run_combined(thr_mode, samples, queue);
    }

    for (const auto& s : samples) {
        for (const auto& mapping : table.find_by_source(s.device_id, s.kind, s.index)) {
            // The toggle button only ever feeds the combined lever
            if (mapping.function == FN_THROTTLE_DYN_TOGGLE) continue;
            if (thr_mode != ThrottleMode::Separate &&
                (mapping.function == FN_THROTTLE || mapping.function == FN_DYN_BRAKE)) {
                continue;
            }

            ProcessResult result = process(mapping.function, mapping.locator, s);
            if (result.changed) {
                const FunctionSpec& spec = catalog.by_name(mapping.function);
                DEBUG_LOG("[engine] %s (%u) = %d\n", spec.name.c_str(), static_cast<unsigned>(spec.id), result.value);
                queue.push(spec.id, result.value);
            }
        }
    }
}
