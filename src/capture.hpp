#pragma once

#include "bindings.hpp"
#include "input_source.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

constexpr auto CAPTURE_SETTLE_TIME = std::chrono::milliseconds(150);
constexpr auto CAPTURE_TIMEOUT = std::chrono::milliseconds(5000);
constexpr auto CAPTURE_AXIS_CONFIRM_DELAY = std::chrono::milliseconds(150);
constexpr auto CAPTURE_POLL_INTERVAL = std::chrono::milliseconds(2);
constexpr float CAPTURE_AXIS_CONFIRM_FACTOR = 0.7f;

enum class CaptureStatus {
    Detected,
    Timeout,
    InvalidKind,
    Cancelled,
    Busy,
    NoDevices,
    CollisionCancelled
};

enum class CollisionChoice {
    Cancel,
    ClearOther,
    KeepBoth
};

// Either a catalog function or one of the reverser switch positions.
struct CaptureTarget {
    std::string function;
    std::optional<ReverserPosition> position;

    static CaptureTarget for_function(const std::string& name) { return CaptureTarget{name, std::nullopt}; }
    static CaptureTarget for_position(ReverserPosition pos) { return CaptureTarget{"", pos}; }

    std::string label() const;
};

struct CaptureResult {
    CaptureStatus status = CaptureStatus::Timeout;
    std::optional<InputLocator> locator;
    std::string message;
};

// Watches the input source for the control the user actuates and installs it in the table.
class MappingCapture {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    // Receives the labels already bound to the locator
    using CollisionResolver = std::function<CollisionChoice(const std::vector<std::string>& others,
                                                            const InputLocator& locator)>;

    MappingCapture(InputSource& input, MappingTable& table);

    void set_clock(Clock clock, Sleeper sleeper);

    CaptureResult run(const CaptureTarget& target, const CollisionResolver& resolver,
                      const std::atomic<bool>& cancel);

    // Detection only; nothing is validated or installed
    CaptureResult detect(const std::atomic<bool>& cancel);

    // Empty when the kind fits the target, otherwise the message to show
    std::string validate(const CaptureTarget& target, const InputLocator& locator) const;

private:
    InputSource& input;
    MappingTable& table;
    Clock now;
    Sleeper sleep;
    std::atomic<bool> in_flight{false};

    bool all_released(const std::vector<int>& devices) const;
    std::vector<std::string> collisions(const CaptureTarget& target, const InputLocator& locator) const;
    void clear_others(const CaptureTarget& target, const InputLocator& locator);
    InputLocator adapt_for_target(const CaptureTarget& target, InputLocator locator) const;
};

const char* capture_status_name(CaptureStatus status);
