#pragma once

#include "function_catalog.hpp"
#include <cstdio>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class InputKind {
    Button,
    Axis,
    Hat
};

enum class HatDirection {
    Up,
    Down,
    Left,
    Right
};

struct HatValue {
    int x = 0;
    int y = 0;  // +1 is up

    bool centered() const { return x == 0 && y == 0; }
    bool operator==(const HatValue& other) const { return x == other.x && y == other.y; }
    bool operator!=(const HatValue& other) const { return !(*this == other); }
};

// One physical control, optionally narrowed to a single hat direction.
struct InputLocator {
    int device_id = -1;
    InputKind kind = InputKind::Button;
    int index = 0;
    std::optional<HatDirection> direction;

    bool operator<(const InputLocator& other) const {
        if (device_id != other.device_id) return device_id < other.device_id;
        if (kind != other.kind) return kind < other.kind;
        if (index != other.index) return index < other.index;
        return direction < other.direction;
    }

    bool operator==(const InputLocator& other) const {
        return device_id == other.device_id && kind == other.kind &&
               index == other.index && direction == other.direction;
    }

    bool operator!=(const InputLocator& other) const { return !(*this == other); }

    // True if this locator reads from the given physical control
    bool same_source(int dev, InputKind k, int idx) const {
        return device_id == dev && kind == k && index == idx;
    }
};

// Current value of one physical control as reported by an input source.
struct RawSample {
    int device_id = -1;
    InputKind kind = InputKind::Button;
    int index = 0;
    bool pressed = false;
    float axis = 0.0f;
    HatValue hat;
};

struct Mapping {
    std::string function;
    InputLocator locator;
    bool reverse_axis = false;
};

enum class ReverserMode {
    Axis,
    TwoWay,
    ThreeWay
};

enum class ReverserPosition {
    Forward,
    Neutral,
    Reverse
};

enum class ThrottleMode {
    Separate,
    Toggle,
    Split
};

enum class TableChange {
    Mapping,
    ReverserPosition,
    ReverserMode,
    ThrottleMode
};

class MappingTable {
public:
    // function is empty for changes that are not tied to one function
    using Listener = std::function<void(TableChange change, const std::string& function)>;

    explicit MappingTable(const FunctionCatalog& catalog);

    void set(const std::string& function, const InputLocator& locator, bool reverse_axis = false);
    bool clear(const std::string& function);
    std::optional<Mapping> get(const std::string& function) const;
    bool set_reverse(const std::string& function, bool reverse);
    void clear_all();

    std::optional<std::string> find_by_locator(const InputLocator& locator) const;
    std::vector<std::string> find_all_by_locator(const InputLocator& locator) const;
    std::vector<Mapping> find_by_source(int device_id, InputKind kind, int index) const;

    const std::map<std::string, Mapping>& all() const { return mappings; }
    bool empty() const { return mappings.empty() && positions.empty(); }

    void set_reverser_position(ReverserPosition position, const InputLocator& locator);
    bool clear_reverser_position(ReverserPosition position);
    std::optional<InputLocator> reverser_position(ReverserPosition position) const;
    std::vector<ReverserPosition> find_positions_by_locator(const InputLocator& locator) const;
    const std::map<ReverserPosition, InputLocator>& reverser_positions() const { return positions; }

    ReverserMode reverser_mode() const { return rev_mode; }
    void set_reverser_mode(ReverserMode mode);
    ThrottleMode throttle_mode() const { return thr_mode; }
    void set_throttle_mode(ThrottleMode mode);

    void add_listener(Listener listener) { listeners.push_back(std::move(listener)); }
    const FunctionCatalog& get_catalog() const { return catalog; }

private:
    const FunctionCatalog& catalog;
    std::map<std::string, Mapping> mappings;
    std::map<ReverserPosition, InputLocator> positions;
    ReverserMode rev_mode = ReverserMode::Axis;
    ThrottleMode thr_mode = ThrottleMode::Separate;
    std::vector<Listener> listeners;

    void notify(TableChange change, const std::string& function);
};

const char* kind_name(InputKind kind);
std::optional<InputKind> parse_kind(const std::string& text);
const char* direction_name(HatDirection direction);
std::optional<HatDirection> parse_direction(const std::string& text);

const char* reverser_mode_name(ReverserMode mode);
std::optional<ReverserMode> parse_reverser_mode(const std::string& text);
const char* throttle_mode_name(ThrottleMode mode);
std::optional<ThrottleMode> parse_throttle_mode(const std::string& text);
const char* position_name(ReverserPosition position);
std::optional<ReverserPosition> parse_position(const std::string& text);

// Short human readable form, e.g. "Dev 0 Hat 0 Up"
std::string describe_locator(const InputLocator& locator);

// Direction of a hat value along one of the four cardinals, if it is exactly one.
std::optional<HatDirection> cardinal_direction(const HatValue& hat);
bool hat_points(const HatValue& hat, HatDirection direction);

#ifdef CONDUCTOR_DEBUG
extern bool debug_log_enabled;
#define DEBUG_LOG(...) if (debug_log_enabled) { printf(__VA_ARGS__); }
#else
#define DEBUG_LOG(...)
#endif
