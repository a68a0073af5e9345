#include "capture.hpp"
#include "value_engine.hpp"
#include <cmath>
#include <map>
#include <thread>

namespace {

std::string position_label(ReverserPosition position) {
    switch (position) {
        case ReverserPosition::Forward: return "Reverser Forward";
        case ReverserPosition::Neutral: return "Reverser Neutral";
        case ReverserPosition::Reverse: return "Reverser Reverse";
    }
    return "Reverser";
}

struct Baseline {
    std::map<int, std::vector<bool>> buttons;
    std::map<int, std::vector<float>> axes;
    std::map<int, std::vector<HatValue>> hats;
};

} // namespace

std::string CaptureTarget::label() const {
    if (position) return position_label(*position);
    return function;
}

const char* capture_status_name(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Detected:           return "detected";
        case CaptureStatus::Timeout:            return "timeout";
        case CaptureStatus::InvalidKind:        return "invalid kind";
        case CaptureStatus::Cancelled:          return "cancelled";
        case CaptureStatus::Busy:               return "busy";
        case CaptureStatus::NoDevices:          return "no devices";
        case CaptureStatus::CollisionCancelled: return "collision cancelled";
    }
    return "unknown";
}

MappingCapture::MappingCapture(InputSource& input, MappingTable& table)
    : input(input), table(table),
      now([] { return std::chrono::steady_clock::now(); }),
      sleep([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

void MappingCapture::set_clock(Clock clock, Sleeper sleeper) {
    now = std::move(clock);
    sleep = std::move(sleeper);
}

bool MappingCapture::all_released(const std::vector<int>& devices) const {
    for (int dev : devices) {
        for (int i = 0; i < input.button_count(dev); i++) {
            if (input.read_button(dev, i)) return false;
        }
        for (int i = 0; i < input.axis_count(dev); i++) {
            if (std::fabs(input.read_axis(dev, i)) > DEADZONE) return false;
        }
    }
    return true;
}

CaptureResult MappingCapture::detect(const std::atomic<bool>& cancel) {
    CaptureResult result;
    std::vector<int> devices = input.list_devices();
    if (devices.empty()) {
        result.status = CaptureStatus::NoDevices;
        result.message = "No input devices enabled";
        return result;
    }

    // Let a control that is still held from a previous action come back to rest
    auto settle_deadline = now() + CAPTURE_SETTLE_TIME;
    while (true) {
        if (cancel.load()) {
            result.status = CaptureStatus::Cancelled;
            return result;
        }
        input.pump();
        if (all_released(devices) || now() >= settle_deadline) break;
        sleep(CAPTURE_POLL_INTERVAL);
    }

    input.pump();
    Baseline base;
    for (int dev : devices) {
        for (int i = 0; i < input.button_count(dev); i++) base.buttons[dev].push_back(input.read_button(dev, i));
        for (int i = 0; i < input.axis_count(dev); i++) base.axes[dev].push_back(input.read_axis(dev, i));
        for (int i = 0; i < input.hat_count(dev); i++) base.hats[dev].push_back(input.read_hat(dev, i));
    }

    auto deadline = now() + CAPTURE_TIMEOUT;
    while (now() < deadline) {
        if (cancel.load()) {
            result.status = CaptureStatus::Cancelled;
            return result;
        }
        input.pump();

        for (int dev : devices) {
            auto& buttons = base.buttons[dev];
            for (size_t i = 0; i < buttons.size(); i++) {
                bool pressed = input.read_button(dev, static_cast<int>(i));
                if (pressed && !buttons[i]) {
                    result.status = CaptureStatus::Detected;
                    result.locator = InputLocator{dev, InputKind::Button, static_cast<int>(i), std::nullopt};
                    return result;
                }
                // A button held at baseline counts once it is released and pressed again
                buttons[i] = pressed;
            }

            auto& hats = base.hats[dev];
            for (size_t i = 0; i < hats.size(); i++) {
                HatValue hat = input.read_hat(dev, static_cast<int>(i));
                auto dir = cardinal_direction(hat);
                if (dir && hat != hats[i]) {
                    result.status = CaptureStatus::Detected;
                    result.locator = InputLocator{dev, InputKind::Hat, static_cast<int>(i), dir};
                    return result;
                }
                hats[i] = hat;
            }

            const auto& axes = base.axes[dev];
            for (size_t i = 0; i < axes.size(); i++) {
                int index = static_cast<int>(i);
                if (std::fabs(input.read_axis(dev, index) - axes[i]) <= DEADZONE) continue;

                // Require the axis to stay deflected so a bump does not bind
                sleep(CAPTURE_AXIS_CONFIRM_DELAY);
                input.pump();
                if (std::fabs(input.read_axis(dev, index) - axes[i]) > DEADZONE * CAPTURE_AXIS_CONFIRM_FACTOR) {
                    result.status = CaptureStatus::Detected;
                    result.locator = InputLocator{dev, InputKind::Axis, index, std::nullopt};
                    return result;
                }
            }
        }

        sleep(CAPTURE_POLL_INTERVAL);
    }

    result.status = CaptureStatus::Timeout;
    result.message = "No input detected";
    return result;
}

std::string MappingCapture::validate(const CaptureTarget& target, const InputLocator& locator) const {
    if (target.position) {
        if (locator.kind == InputKind::Axis) {
            return "Reverser positions need a button or hat direction, not an axis";
        }
        return "";
    }

    const FunctionSpec& spec = table.get_catalog().by_name(target.function);
    if (spec.behavior == Behavior::Lever) {
        if (locator.kind != InputKind::Axis) {
            return spec.name + " is a lever: move an axis to map it";
        }
        return "";
    }
    if (locator.kind == InputKind::Axis) {
        return spec.name + " needs a button or hat, not an axis";
    }
    return "";
}

InputLocator MappingCapture::adapt_for_target(const CaptureTarget& target, InputLocator locator) const {
    if (target.position || locator.kind != InputKind::Hat) {
        return locator;
    }
    Behavior behavior = table.get_catalog().by_name(target.function).behavior;
    if (behavior == Behavior::ThreeWay || behavior == Behavior::FourWay) {
        // The whole hat selects the position directly
        locator.direction.reset();
    }
    return locator;
}

std::vector<std::string> MappingCapture::collisions(const CaptureTarget& target, const InputLocator& locator) const {
    std::vector<std::string> others;
    for (const auto& name : table.find_all_by_locator(locator)) {
        if (!target.position && name == target.function) continue;
        others.push_back(name);
    }
    for (auto pos : table.find_positions_by_locator(locator)) {
        if (target.position && *target.position == pos) continue;
        others.push_back(position_label(pos));
    }
    return others;
}

void MappingCapture::clear_others(const CaptureTarget& target, const InputLocator& locator) {
    for (const auto& name : table.find_all_by_locator(locator)) {
        if (!target.position && name == target.function) continue;
        table.clear(name);
    }
    for (auto pos : table.find_positions_by_locator(locator)) {
        if (target.position && *target.position == pos) continue;
        table.clear_reverser_position(pos);
    }
}

CaptureResult MappingCapture::run(const CaptureTarget& target, const CollisionResolver& resolver,
                                  const std::atomic<bool>& cancel) {
    CaptureResult result;

    bool expected = false;
    if (!in_flight.compare_exchange_strong(expected, true)) {
        result.status = CaptureStatus::Busy;
        result.message = "A capture is already in progress";
        return result;
    }
    struct Release {
        std::atomic<bool>& flag;
        ~Release() { flag.store(false); }
    } release{in_flight};

    if (target.position) {
        ReverserMode mode = table.reverser_mode();
        if (mode == ReverserMode::Axis ||
            (mode == ReverserMode::TwoWay && *target.position == ReverserPosition::Neutral)) {
            result.status = CaptureStatus::InvalidKind;
            result.message = target.label() + " is not used in " + reverser_mode_name(mode) + " reverser mode";
            return result;
        }
    } else {
        table.get_catalog().by_name(target.function);
    }

    result = detect(cancel);
    if (result.status != CaptureStatus::Detected) {
        return result;
    }

    InputLocator locator = *result.locator;
    std::string problem = validate(target, locator);
    if (!problem.empty()) {
        result.status = CaptureStatus::InvalidKind;
        result.message = problem;
        return result;
    }

    locator = adapt_for_target(target, locator);
    result.locator = locator;

    auto others = collisions(target, locator);
    if (!others.empty()) {
        CollisionChoice choice = resolver ? resolver(others, locator) : CollisionChoice::Cancel;
        if (choice == CollisionChoice::Cancel) {
            result.status = CaptureStatus::CollisionCancelled;
            result.message = describe_locator(locator) + " is already used by " + others.front();
            return result;
        }
        if (choice == CollisionChoice::ClearOther) {
            clear_others(target, locator);
        }
    }

    if (target.position) {
        table.set_reverser_position(*target.position, locator);
    } else {
        // A new axis starts unreversed
        table.set(target.function, locator, false);
    }
    result.message = target.label() + " -> " + describe_locator(locator);
    return result;
}
