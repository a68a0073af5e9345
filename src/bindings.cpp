#include "bindings.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

#ifdef CONDUCTOR_DEBUG
bool debug_log_enabled = false;
#endif

namespace {

std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

MappingTable::MappingTable(const FunctionCatalog& catalog) : catalog(catalog) {}

void MappingTable::set(const std::string& function, const InputLocator& locator, bool reverse_axis) {
    catalog.by_name(function);
    mappings[function] = Mapping{function, locator, reverse_axis};
    DEBUG_LOG("[table] %s -> %s%s\n", function.c_str(), describe_locator(locator).c_str(),
              reverse_axis ? " (reversed)" : "");
    notify(TableChange::Mapping, function);
}

bool MappingTable::clear(const std::string& function) {
    catalog.by_name(function);
    if (mappings.erase(function) == 0) {
        return false;
    }
    notify(TableChange::Mapping, function);
    return true;
}

std::optional<Mapping> MappingTable::get(const std::string& function) const {
    catalog.by_name(function);
    auto it = mappings.find(function);
    if (it == mappings.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MappingTable::set_reverse(const std::string& function, bool reverse) {
    catalog.by_name(function);
    auto it = mappings.find(function);
    if (it == mappings.end()) {
        return false;
    }
    if (it->second.reverse_axis != reverse) {
        it->second.reverse_axis = reverse;
        notify(TableChange::Mapping, function);
    }
    return true;
}

void MappingTable::clear_all() {
    std::vector<std::string> names;
    for (const auto& [name, mapping] : mappings) {
        names.push_back(name);
    }
    mappings.clear();
    positions.clear();
    for (const auto& name : names) {
        notify(TableChange::Mapping, name);
    }
    notify(TableChange::ReverserPosition, "");
}

std::optional<std::string> MappingTable::find_by_locator(const InputLocator& locator) const {
    for (const auto& [name, mapping] : mappings) {
        if (mapping.locator == locator) return name;
    }
    return std::nullopt;
}

std::vector<std::string> MappingTable::find_all_by_locator(const InputLocator& locator) const {
    std::vector<std::string> names;
    for (const auto& [name, mapping] : mappings) {
        if (mapping.locator == locator) names.push_back(name);
    }
    return names;
}

std::vector<Mapping> MappingTable::find_by_source(int device_id, InputKind kind, int index) const {
    std::vector<Mapping> result;
    for (const auto& [name, mapping] : mappings) {
        if (mapping.locator.same_source(device_id, kind, index)) {
            result.push_back(mapping);
        }
    }
    return result;
}

void MappingTable::set_reverser_position(ReverserPosition position, const InputLocator& locator) {
    positions[position] = locator;
    notify(TableChange::ReverserPosition, "");
}

bool MappingTable::clear_reverser_position(ReverserPosition position) {
    if (positions.erase(position) == 0) {
        return false;
    }
    notify(TableChange::ReverserPosition, "");
    return true;
}

std::optional<InputLocator> MappingTable::reverser_position(ReverserPosition position) const {
    auto it = positions.find(position);
    if (it == positions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ReverserPosition> MappingTable::find_positions_by_locator(const InputLocator& locator) const {
    std::vector<ReverserPosition> result;
    for (const auto& [position, loc] : positions) {
        if (loc == locator) result.push_back(position);
    }
    return result;
}

void MappingTable::set_reverser_mode(ReverserMode mode) {
    if (mode == rev_mode) return;
    rev_mode = mode;
    notify(TableChange::ReverserMode, FN_REVERSER);
}

void MappingTable::set_throttle_mode(ThrottleMode mode) {
    if (mode == thr_mode) return;
    thr_mode = mode;
    notify(TableChange::ThrottleMode, FN_THROTTLE);
}

void MappingTable::notify(TableChange change, const std::string& function) {
    for (const auto& listener : listeners) {
        listener(change, function);
    }
}

const char* kind_name(InputKind kind) {
    switch (kind) {
        case InputKind::Button: return "button";
        case InputKind::Axis:   return "axis";
        case InputKind::Hat:    return "hat";
    }
    return "unknown";
}

std::optional<InputKind> parse_kind(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "button") return InputKind::Button;
    if (t == "axis") return InputKind::Axis;
    if (t == "hat") return InputKind::Hat;
    return std::nullopt;
}

const char* direction_name(HatDirection direction) {
    switch (direction) {
        case HatDirection::Up:    return "up";
        case HatDirection::Down:  return "down";
        case HatDirection::Left:  return "left";
        case HatDirection::Right: return "right";
    }
    return "unknown";
}

std::optional<HatDirection> parse_direction(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "up") return HatDirection::Up;
    if (t == "down") return HatDirection::Down;
    if (t == "left") return HatDirection::Left;
    if (t == "right") return HatDirection::Right;
    return std::nullopt;
}

const char* reverser_mode_name(ReverserMode mode) {
    switch (mode) {
        case ReverserMode::Axis:     return "axis";
        case ReverserMode::TwoWay:   return "2way";
        case ReverserMode::ThreeWay: return "3way";
    }
    return "axis";
}

std::optional<ReverserMode> parse_reverser_mode(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "axis") return ReverserMode::Axis;
    if (t == "2way") return ReverserMode::TwoWay;
    if (t == "3way") return ReverserMode::ThreeWay;
    return std::nullopt;
}

const char* throttle_mode_name(ThrottleMode mode) {
    switch (mode) {
        case ThrottleMode::Separate: return "separate";
        case ThrottleMode::Toggle:   return "toggle";
        case ThrottleMode::Split:    return "split";
    }
    return "separate";
}

std::optional<ThrottleMode> parse_throttle_mode(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "separate") return ThrottleMode::Separate;
    if (t == "toggle") return ThrottleMode::Toggle;
    if (t == "split") return ThrottleMode::Split;
    return std::nullopt;
}

const char* position_name(ReverserPosition position) {
    switch (position) {
        case ReverserPosition::Forward: return "forward";
        case ReverserPosition::Neutral: return "neutral";
        case ReverserPosition::Reverse: return "reverse";
    }
    return "neutral";
}

std::optional<ReverserPosition> parse_position(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "forward") return ReverserPosition::Forward;
    if (t == "neutral") return ReverserPosition::Neutral;
    if (t == "reverse") return ReverserPosition::Reverse;
    return std::nullopt;
}

std::string describe_locator(const InputLocator& locator) {
    std::ostringstream ss;
    ss << "Dev " << locator.device_id << " ";
    switch (locator.kind) {
        case InputKind::Button: ss << "Button "; break;
        case InputKind::Axis:   ss << "Axis "; break;
        case InputKind::Hat:    ss << "Hat "; break;
    }
    ss << locator.index;
    if (locator.direction) {
        std::string dir = direction_name(*locator.direction);
        dir[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(dir[0])));
        ss << " " << dir;
    }
    return ss.str();
}

std::optional<HatDirection> cardinal_direction(const HatValue& hat) {
    if (hat.x == 0 && hat.y == 1) return HatDirection::Up;
    if (hat.x == 0 && hat.y == -1) return HatDirection::Down;
    if (hat.x == 1 && hat.y == 0) return HatDirection::Right;
    if (hat.x == -1 && hat.y == 0) return HatDirection::Left;
    return std::nullopt;
}

bool hat_points(const HatValue& hat, HatDirection direction) {
    switch (direction) {
        case HatDirection::Up:    return hat.y > 0;
        case HatDirection::Down:  return hat.y < 0;
        case HatDirection::Left:  return hat.x < 0;
        case HatDirection::Right: return hat.x > 0;
    }
    return false;
}
