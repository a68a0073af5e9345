#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class Behavior {
    Momentary,
    Toggle,
    Lever,
    ThreeWay,
    FourWay,
    FiveWay,
    Button
};

struct FunctionSpec {
    std::string name;
    uint16_t id;
    Behavior behavior;
    std::string category;
};

// Names the engine treats specially
constexpr const char* FN_THROTTLE = "Throttle Lever";
constexpr const char* FN_TRAIN_BRAKE = "Train Brake Lever";
constexpr const char* FN_INDEPENDENT_BRAKE = "Independent Brake Lever";
constexpr const char* FN_DYN_BRAKE = "Dyn Brake Lever";
constexpr const char* FN_REVERSER = "Reverser Lever";
constexpr const char* FN_THROTTLE_DYN_TOGGLE = "Throttle/Dyn Toggle";

// Immutable table of the simulator functions that can be mapped.
class FunctionCatalog {
public:
    FunctionCatalog();
    explicit FunctionCatalog(std::vector<FunctionSpec> specs);

    // Throws std::logic_error for a name that is not in the catalog.
    const FunctionSpec& by_name(const std::string& name) const;
    const FunctionSpec* find(const std::string& name) const;
    const FunctionSpec* by_id(uint16_t id) const;

    const std::vector<FunctionSpec>& all() const { return specs; }
    std::vector<FunctionSpec> in_category(const std::string& category) const;
    std::vector<std::string> categories() const;

    bool contains(const std::string& name) const { return index.count(name) > 0; }

private:
    std::vector<FunctionSpec> specs;
    std::map<std::string, size_t> index;
};

const char* behavior_name(Behavior behavior);

// Number of positions a multi-way behavior cycles through, 0 otherwise.
int multiway_positions(Behavior behavior);
