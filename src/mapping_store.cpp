#include "mapping_store.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <sys/stat.h>

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(start, end - start + 1);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

bool parse_bool(const std::string& s) {
    std::string t = s;
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return std::tolower(c); });
    return t == "true" || t == "1" || t == "yes";
}

std::optional<int> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

const std::map<std::string, ReverserPosition>& position_sentinels() {
    static const std::map<std::string, ReverserPosition> sentinels = {
        {SENTINEL_REVERSER_FORWARD, ReverserPosition::Forward},
        {SENTINEL_REVERSER_NEUTRAL, ReverserPosition::Neutral},
        {SENTINEL_REVERSER_REVERSE, ReverserPosition::Reverse},
    };
    return sentinels;
}

// Type and Direction are written capitalised
const char* csv_kind(InputKind kind) {
    switch (kind) {
        case InputKind::Button: return "Button";
        case InputKind::Axis:   return "Axis";
        case InputKind::Hat:    return "Hat";
    }
    return "Button";
}

const char* csv_direction(HatDirection direction) {
    switch (direction) {
        case HatDirection::Up:    return "Up";
        case HatDirection::Down:  return "Down";
        case HatDirection::Left:  return "Left";
        case HatDirection::Right: return "Right";
    }
    return "Up";
}

std::string write_row(const std::string& function, const InputLocator& loc, bool reverse) {
    std::ostringstream ss;
    ss << function << "," << loc.device_id << "," << csv_kind(loc.kind) << "," << loc.index << ","
       << (reverse ? "True" : "False") << ",";
    if (loc.direction) ss << csv_direction(*loc.direction);
    ss << "\n";
    return ss.str();
}

} // namespace

std::vector<std::string> MappingStore::split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.push_back("");
    }
    return fields;
}

std::optional<InputLocator> MappingStore::parse_locator(const std::vector<std::string>& fields, int device_col,
                                                        int type_col, int index_col, int direction_col) {
    if (type_col < 0 || index_col < 0) return std::nullopt;
    if (static_cast<int>(fields.size()) <= std::max({device_col, type_col, index_col})) return std::nullopt;

    auto device = parse_int(fields[device_col]);
    auto kind = parse_kind(fields[type_col]);
    auto index = parse_int(fields[index_col]);
    if (!device || !kind || !index) return std::nullopt;

    InputLocator loc{*device, *kind, *index, std::nullopt};
    if (*kind == InputKind::Hat && direction_col >= 0 && direction_col < static_cast<int>(fields.size()) &&
        !fields[direction_col].empty()) {
        auto dir = parse_direction(fields[direction_col]);
        if (!dir) return std::nullopt;
        loc.direction = dir;
    }
    return loc;
}

bool MappingStore::load(const std::string& path, MappingTable& table) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str(), table);
}

bool MappingStore::load_from_string(const std::string& csv, MappingTable& table) {
    std::istringstream in(csv);
    std::string line;

    if (!std::getline(in, line)) {
        table.clear_all();
        return true;
    }

    // Columns are located by header name so older files without Direction still load
    auto header = split_row(line);
    std::map<std::string, int> col;
    for (size_t i = 0; i < header.size(); i++) {
        col[header[i]] = static_cast<int>(i);
    }
    if (!col.count("Function") || !col.count("Device")) {
        std::cerr << "Mapping file has no Function/Device header\n";
        return false;
    }
    int type_col = col.count("Type") ? col["Type"] : -1;
    int index_col = col.count("Index") ? col["Index"] : -1;
    int reverse_col = col.count("Reverse") ? col["Reverse"] : -1;
    int direction_col = col.count("Direction") ? col["Direction"] : -1;

    table.clear_all();

    const FunctionCatalog& catalog = table.get_catalog();
    std::optional<ReverserMode> reverser_mode;
    std::optional<bool> legacy_switch_mode;
    ThrottleMode throttle_mode = ThrottleMode::Separate;
    int line_no = 1;

    while (std::getline(in, line)) {
        line_no++;
        if (trim(line).empty()) continue;

        auto fields = split_row(line);
        if (static_cast<int>(fields.size()) <= std::max(col["Function"], col["Device"])) {
            std::cerr << "Skipping malformed mapping row " << line_no << "\n";
            continue;
        }
        const std::string& function = fields[col["Function"]];
        const std::string& device = fields[col["Device"]];

        if (function == SENTINEL_REVERSER_MODE) {
            reverser_mode = parse_reverser_mode(device);
            if (!reverser_mode) std::cerr << "Unknown reverser mode '" << device << "'\n";
            continue;
        }
        if (function == SENTINEL_REVERSER_SWITCH_LEGACY) {
            legacy_switch_mode = parse_bool(device);
            continue;
        }
        if (function == SENTINEL_THROTTLE_MODE) {
            auto mode = parse_throttle_mode(device);
            if (mode) {
                throttle_mode = *mode;
            } else {
                std::cerr << "Unknown throttle mode '" << device << "'\n";
            }
            continue;
        }

        auto loc = parse_locator(fields, col["Device"], type_col, index_col, direction_col);
        if (!loc) {
            std::cerr << "Skipping malformed mapping row " << line_no << ": " << line << "\n";
            continue;
        }

        auto pos_it = position_sentinels().find(function);
        if (pos_it != position_sentinels().end()) {
            table.set_reverser_position(pos_it->second, *loc);
            continue;
        }

        if (!catalog.contains(function)) {
            std::cerr << "Skipping mapping for unknown function '" << function << "'\n";
            continue;
        }

        bool reverse = reverse_col >= 0 && reverse_col < static_cast<int>(fields.size()) &&
                       parse_bool(fields[reverse_col]);
        table.set(function, *loc, reverse);
    }

    if (reverser_mode) {
        table.set_reverser_mode(*reverser_mode);
    } else if (legacy_switch_mode) {
        table.set_reverser_mode(*legacy_switch_mode ? ReverserMode::ThreeWay : ReverserMode::Axis);
    } else {
        table.set_reverser_mode(ReverserMode::Axis);
    }
    table.set_throttle_mode(throttle_mode);

    return true;
}

std::string MappingStore::save_to_string(const MappingTable& table) {
    std::ostringstream out;
    out << MAPPING_CSV_HEADER << "\n";

    // Catalog order keeps the file stable between saves
    for (const auto& spec : table.get_catalog().all()) {
        auto it = table.all().find(spec.name);
        if (it == table.all().end()) continue;
        out << write_row(spec.name, it->second.locator, it->second.reverse_axis);
    }

    out << SENTINEL_REVERSER_MODE << "," << reverser_mode_name(table.reverser_mode()) << ",,,,\n";
    out << SENTINEL_THROTTLE_MODE << "," << throttle_mode_name(table.throttle_mode()) << ",,,,\n";

    for (const auto& [name, position] : position_sentinels()) {
        auto loc = table.reverser_position(position);
        if (loc) out << write_row(name, *loc, false);
    }
    return out.str();
}

bool MappingStore::save(const std::string& path, const MappingTable& table) {
    size_t last_slash = path.find_last_of('/');
    if (last_slash != std::string::npos && last_slash > 0) {
        std::string dir = path.substr(0, last_slash);
        struct stat st;
        if (stat(dir.c_str(), &st) != 0) {
            std::string mkdir_cmd = "mkdir -p \"" + dir + "\"";
            if (system(mkdir_cmd.c_str()) != 0) {
                std::cerr << "Failed to create " << dir << "\n";
                return false;
            }
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        perror(("Failed to write " + path).c_str());
        return false;
    }
    file << save_to_string(table);
    return file.good();
}
