#pragma once

#include "bindings.hpp"
#include "combined_lever.hpp"
#include "command_queue.hpp"
#include "function_catalog.hpp"
#include "reverser_switch.hpp"
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// Axis travel that counts as "pressed" when an axis drives a digital function
constexpr float DEADZONE = 0.7f;

// Smaller axis movements are not reported by input sources
constexpr float AXIS_CHANGE_THRESHOLD = 0.01f;

// Lever laws. Input is the normalized axis after reversal, clamped to [-1, 1].
int throttle_notch_for(float v);
int reverser_axis_value_for(float v);
int dyn_brake_value_for(float v);
int brake_value_for(float v);

struct ProcessResult {
    bool changed = false;
    int value = 0;
};

// Turns raw samples into simulator values according to each function's behavior.
class ValueEngine {
public:
    ValueEngine(const FunctionCatalog& catalog, MappingTable& table);

    ValueEngine(const ValueEngine&) = delete;
    ValueEngine& operator=(const ValueEngine&) = delete;

    // Evaluates one sample for one mapped function. The locator selects the per-input history.
    ProcessResult process(const std::string& function, const InputLocator& locator, const RawSample& sample);

    // Processes one poll's worth of changed samples and queues everything that must be sent.
    void run_tick(const std::vector<RawSample>& samples, CommandQueue& queue);

    const ReverserSwitch& reverser() const { return reverser_switch; }
    const CombinedLever& lever() const { return combined; }
    int counter(const std::string& function) const;
    int reverser_value() const { return reverser_switch.value(); }

    void reset();

private:
    struct PrevValue {
        bool active = false;
        int value = -1;
    };

    using PrevKey = std::pair<std::string, InputLocator>;
    using SourceKey = std::tuple<int, InputKind, int>;

    const FunctionCatalog& catalog;
    MappingTable& table;
    std::map<PrevKey, PrevValue> prev;
    std::map<std::string, int> counters;
    std::map<SourceKey, RawSample> latest;
    ReverserSwitch reverser_switch;
    CombinedLever combined;

    void on_table_change(TableChange change, const std::string& function);
    void forget(const std::string& function);
    void init_counters();

    static bool is_active(const InputLocator& locator, const RawSample& sample);
    bool currently_active(const std::optional<InputLocator>& locator) const;
    static bool active_in_batch(const std::optional<InputLocator>& locator, const std::vector<RawSample>& samples);
    static bool touched_in_batch(const std::optional<InputLocator>& locator, const std::vector<RawSample>& samples);

    int lever_value(const std::string& function, float v, bool reverse) const;
    void run_reverser(ReverserMode mode, const std::vector<RawSample>& samples, CommandQueue& queue);
    void run_combined(ThrottleMode mode, const std::vector<RawSample>& samples, CommandQueue& queue);
};
