#pragma once

#include "bindings.hpp"
#include <string>

constexpr const char* MAPPING_CSV_HEADER = "Function,Device,Type,Index,Reverse,Direction";
constexpr const char* SENTINEL_REVERSER_MODE = "__reverser_mode__";
constexpr const char* SENTINEL_THROTTLE_MODE = "__throttle_mode__";
constexpr const char* SENTINEL_REVERSER_SWITCH_LEGACY = "__reverser_switch_mode__";
constexpr const char* SENTINEL_REVERSER_FORWARD = "__reverser_forward__";
constexpr const char* SENTINEL_REVERSER_NEUTRAL = "__reverser_neutral__";
constexpr const char* SENTINEL_REVERSER_REVERSE = "__reverser_reverse__";

// CSV persistence of the mapping table, its mode flags and reverser position inputs.
class MappingStore {
public:
    // Replaces the table contents. False if the file cannot be read.
    static bool load(const std::string& path, MappingTable& table);
    static bool save(const std::string& path, const MappingTable& table);

    static bool load_from_string(const std::string& csv, MappingTable& table);
    static std::string save_to_string(const MappingTable& table);

private:
    static std::vector<std::string> split_row(const std::string& line);
    static std::optional<InputLocator> parse_locator(const std::vector<std::string>& fields, int device_col,
                                                     int type_col, int index_col, int direction_col);
};
