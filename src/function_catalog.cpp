#include "function_catalog.hpp"
#include <stdexcept>

namespace {

std::vector<FunctionSpec> make_default_catalog() {
    return {
        {FN_THROTTLE, 16, Behavior::Lever, "Main Controls"},
        {FN_TRAIN_BRAKE, 18, Behavior::Lever, "Main Controls"},
        {FN_INDEPENDENT_BRAKE, 9, Behavior::Lever, "Main Controls"},
        {FN_DYN_BRAKE, 4, Behavior::Lever, "Main Controls"},
        {FN_REVERSER, 14, Behavior::Lever, "Main Controls"},
        {FN_THROTTLE_DYN_TOGGLE, 101, Behavior::Button, "Main Controls"},

        {"Sander", 15, Behavior::Momentary, "Cab Controls"},
        {"Horn", 8, Behavior::Momentary, "Cab Controls"},
        {"Bell", 2, Behavior::Momentary, "Cab Controls"},
        {"Alerter", 1, Behavior::Momentary, "Cab Controls"},
        {"Independent Bailoff", 10, Behavior::Momentary, "Cab Controls"},
        {"Distance Counter", 3, Behavior::ThreeWay, "Cab Controls"},

        {"Headlight Front", 5, Behavior::ThreeWay, "Lights and Wipers"},
        {"Headlight Rear", 6, Behavior::ThreeWay, "Lights and Wipers"},
        {"Wiper Switch", 19, Behavior::FourWay, "Lights and Wipers"},
        {"Cab Light Switch", 41, Behavior::Toggle, "Lights and Wipers"},
        {"Step Light Switch", 42, Behavior::Toggle, "Lights and Wipers"},
        {"Gauge Light Switch", 43, Behavior::Toggle, "Lights and Wipers"},

        {"HEP Switch", 52, Behavior::Toggle, "Electrical"},
        {"Circuit Breaker Control", 37, Behavior::Toggle, "Electrical"},
        {"Circuit Breaker DynBrake", 38, Behavior::Toggle, "Electrical"},
        {"Circuit Breaker EngRun", 39, Behavior::Toggle, "Electrical"},
        {"Circuit Breaker GenField", 40, Behavior::Toggle, "Electrical"},

        {"DPU Throttle Increase", 58, Behavior::Momentary, "DPU"},
        {"DPU Throttle Decrease", 59, Behavior::Momentary, "DPU"},
        {"DPU Dyn-Brake Setup", 60, Behavior::Momentary, "DPU"},
        {"DPU Fence Increase", 61, Behavior::Momentary, "DPU"},
        {"DPU Fence Decrease", 62, Behavior::Momentary, "DPU"},

        {"EOT Emg Stop", 44, Behavior::Momentary, "Misc"},
        {"Slow Speed Toggle", 55, Behavior::Toggle, "Misc"},
        {"Slow Speed Increment", 56, Behavior::Momentary, "Misc"},
        {"Slow Speed Decrement", 57, Behavior::Momentary, "Misc"},
        {"Park-Brake Set", 12, Behavior::Momentary, "Misc"},
        {"Park-Brake Release", 13, Behavior::Momentary, "Misc"},
    };
}

} // namespace

FunctionCatalog::FunctionCatalog() : FunctionCatalog(make_default_catalog()) {}

FunctionCatalog::FunctionCatalog(std::vector<FunctionSpec> specs_in) : specs(std::move(specs_in)) {
    for (size_t i = 0; i < specs.size(); i++) {
        if (!index.emplace(specs[i].name, i).second) {
            throw std::logic_error("Duplicate function in catalog: " + specs[i].name);
        }
    }
}

const FunctionSpec& FunctionCatalog::by_name(const std::string& name) const {
    auto it = index.find(name);
    if (it == index.end()) {
        throw std::logic_error("Unknown function: " + name);
    }
    return specs[it->second];
}

const FunctionSpec* FunctionCatalog::find(const std::string& name) const {
    auto it = index.find(name);
    if (it == index.end()) {
        return nullptr;
    }
    return &specs[it->second];
}

const FunctionSpec* FunctionCatalog::by_id(uint16_t id) const {
    for (const auto& spec : specs) {
        if (spec.id == id) return &spec;
    }
    return nullptr;
}

std::vector<FunctionSpec> FunctionCatalog::in_category(const std::string& category) const {
    std::vector<FunctionSpec> result;
    for (const auto& spec : specs) {
        if (spec.category == category) result.push_back(spec);
    }
    return result;
}

std::vector<std::string> FunctionCatalog::categories() const {
    std::vector<std::string> result;
    for (const auto& spec : specs) {
        bool seen = false;
        for (const auto& c : result) {
            if (c == spec.category) {
                seen = true;
                break;
            }
        }
        if (!seen) result.push_back(spec.category);
    }
    return result;
}

const char* behavior_name(Behavior behavior) {
    switch (behavior) {
        case Behavior::Momentary: return "momentary";
        case Behavior::Toggle:    return "toggle";
        case Behavior::Lever:     return "lever";
        case Behavior::ThreeWay:  return "3way";
        case Behavior::FourWay:   return "4way";
        case Behavior::FiveWay:   return "5way";
        case Behavior::Button:    return "button";
    }
    return "unknown";
}

int multiway_positions(Behavior behavior) {
    switch (behavior) {
        case Behavior::ThreeWay: return 3;
        case Behavior::FourWay:  return 4;
        case Behavior::FiveWay:  return 5;
        default:                 return 0;
    }
}
