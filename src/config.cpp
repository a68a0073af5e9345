// config.cpp - network, timing and device settings
#include "config.hpp"
#include <arpa/inet.h>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <sys/stat.h>
#include <iostream>

namespace {

std::string home_dir() {
    const char* home = getenv("HOME");
    return home ? std::string(home) : std::string();
}

std::optional<int> to_int(const std::string& text) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

// Get config path from environment or use default
std::string ConfigManager::get_config_path() {
    const char* env_path = getenv("CONDUCTOR_CONFIG");
    if (env_path && *env_path) {
        return std::string(env_path);
    }

    std::string home = home_dir();
    if (home.empty()) {
        return "/etc/run8-conductor/config.json";
    }

    return home + "/.config/run8-conductor/config.json";
}

std::string ConfigManager::default_mappings_path() {
    std::string home = home_dir();
    if (home.empty()) {
        return "/etc/run8-conductor/input_mappings.csv";
    }
    return home + "/.config/run8-conductor/input_mappings.csv";
}

std::string ConfigManager::expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return home_dir() + path.substr(1);
    }
    return path;
}

std::optional<Config> ConfigManager::load(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string json;
    std::string line;
    while (std::getline(file, line)) {
        json += line + "\n";
    }

    Config config;

    auto version_opt = get_json_value(json, "version");
    if (version_opt) {
        auto v = to_int(*version_opt);
        if (v) config.version = *v;
    }

    auto network_opt = get_json_value(json, "network");
    if (network_opt) {
        auto ip_opt = get_json_value(*network_opt, "ip");
        if (ip_opt) config.ip = unescape_json_string(*ip_opt);

        auto port_opt = get_json_value(*network_opt, "port");
        if (port_opt) config.port = to_int(*port_opt).value_or(-1);

        auto audio_opt = get_json_value(*network_opt, "audio_flag");
        if (audio_opt) config.audio_flag = (*audio_opt == "true");
    }

    auto timing_opt = get_json_value(json, "timing");
    if (timing_opt) {
        auto poll_opt = get_json_value(*timing_opt, "poll_interval_ms");
        if (poll_opt) config.poll_interval_ms = to_int(*poll_opt).value_or(-1);

        auto send_opt = get_json_value(*timing_opt, "send_interval_ms");
        if (send_opt) config.send_interval_ms = to_int(*send_opt).value_or(-1);
    }

    auto mappings_opt = get_json_value(json, "mappings_file");
    if (mappings_opt) {
        config.mappings_file = expand_home(unescape_json_string(*mappings_opt));
    }

    auto devices_opt = get_json_value(json, "devices");
    if (devices_opt) {
        config.devices = parse_string_array(*devices_opt);
    }

    validate(config);
    return config;
}

bool ConfigManager::validate(Config& config) {
    bool ok = true;
    Config defaults;

    struct in_addr addr;
    if (inet_pton(AF_INET, config.ip.c_str(), &addr) != 1) {
        std::cerr << "WARNING: Invalid network.ip '" << config.ip << "', using " << defaults.ip << "\n";
        config.ip = defaults.ip;
        ok = false;
    }
    if (config.port < 1 || config.port > 65535) {
        std::cerr << "WARNING: Invalid network.port " << config.port << ", using " << defaults.port << "\n";
        config.port = defaults.port;
        ok = false;
    }
    if (config.poll_interval_ms < 1 || config.poll_interval_ms > 1000) {
        std::cerr << "WARNING: Invalid timing.poll_interval_ms, using " << defaults.poll_interval_ms << "\n";
        config.poll_interval_ms = defaults.poll_interval_ms;
        ok = false;
    }
    if (config.send_interval_ms < 1 || config.send_interval_ms > 1000) {
        std::cerr << "WARNING: Invalid timing.send_interval_ms, using " << defaults.send_interval_ms << "\n";
        config.send_interval_ms = defaults.send_interval_ms;
        ok = false;
    }
    if (config.mappings_file.empty()) {
        config.mappings_file = default_mappings_path();
    }
    return ok;
}

bool ConfigManager::save(const std::string& config_path, const Config& config) {
    // Create directory if needed
    size_t last_slash = config_path.find_last_of('/');
    if (last_slash != std::string::npos) {
        std::string dir = config_path.substr(0, last_slash);
        struct stat st;
        if (stat(dir.c_str(), &st) != 0) {
            std::string mkdir_cmd = "mkdir -p \"" + dir + "\"";
            if (system(mkdir_cmd.c_str()) != 0) {
                return false;
            }
        }
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        return false;
    }

    file << "{\n";
    file << "  \"version\": " << config.version << ",\n";

    file << "  \"network\": {\n";
    file << "    \"ip\": \"" << escape_json_string(config.ip) << "\",\n";
    file << "    \"port\": " << config.port << ",\n";
    file << "    \"audio_flag\": " << (config.audio_flag ? "true" : "false") << "\n";
    file << "  },\n";

    file << "  \"timing\": {\n";
    file << "    \"poll_interval_ms\": " << config.poll_interval_ms << ",\n";
    file << "    \"send_interval_ms\": " << config.send_interval_ms << "\n";
    file << "  },\n";

    file << "  \"mappings_file\": \"" << escape_json_string(config.mappings_file) << "\",\n";

    file << "  \"devices\": [";
    for (size_t i = 0; i < config.devices.size(); i++) {
        file << (i == 0 ? "\n" : ",\n");
        file << "    \"" << escape_json_string(config.devices[i]) << "\"";
    }
    file << (config.devices.empty() ? "]\n" : "\n  ]\n");

    file << "}\n";

    return file.good();
}

std::vector<std::string> ConfigManager::parse_string_array(const std::string& json) {
    std::vector<std::string> out;
    std::string arr = json;
    if (!arr.empty() && arr.front() == '[' && arr.back() == ']') {
        arr = arr.substr(1, arr.length() - 2);
    }

    size_t pos = 0;
    while (pos < arr.length()) {
        size_t start = arr.find('"', pos);
        if (start == std::string::npos) break;

        size_t end = start + 1;
        while (end < arr.length() && !(arr[end] == '"' && arr[end - 1] != '\\')) {
            end++;
        }
        if (end >= arr.length()) break;

        out.push_back(unescape_json_string(arr.substr(start + 1, end - start - 1)));
        pos = end + 1;
    }
    return out;
}

std::string ConfigManager::escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 10);

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }

    return result;
}

std::string ConfigManager::unescape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\\' && i + 1 < str.size()) {
            switch (str[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case 't': result += '\t'; ++i; break;
                default: result += str[i]; break;
            }
        } else {
            result += str[i];
        }
    }

    return result;
}

std::optional<std::string> ConfigManager::get_json_value(const std::string& json, std::string_view key) {
    std::string search_key = "\"";
    search_key += key;
    search_key += "\"";

    size_t key_pos = json.find(search_key);
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t colon_pos = json.find(':', key_pos);
    if (colon_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t value_start = json.find_first_not_of(" \t", colon_pos + 1);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    // Handle object/array values
    if (value_start < json.size() && (json[value_start] == '[' || json[value_start] == '{')) {
        const char open = json[value_start];
        const char close = (open == '[') ? ']' : '}';
        int depth = 0;
        bool in_string = false;
        bool escape = false;

        for (size_t i = value_start; i < json.size(); ++i) {
            const char c = json[i];

            if (in_string) {
                if (escape) { escape = false; continue; }
                if (c == '\\') { escape = true; continue; }
                if (c == '"') in_string = false;
                continue;
            }

            if (c == '"') { in_string = true; continue; }
            if (c == open) { depth++; continue; }
            if (c == close) {
                depth--;
                if (depth == 0) {
                    return json.substr(value_start, (i - value_start) + 1);
                }
            }
        }
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        size_t value_end = json.find('"', value_start + 1);
        if (value_end == std::string::npos) {
            return std::nullopt;
        }

        size_t end = value_end;
        while (end + 1 < json.size() && json[end] == '"' && json[end - 1] == '\\') {
            end = json.find('"', end + 1);
            if (end == std::string::npos) break;
        }
        if (end == std::string::npos) {
            end = value_end;
        }

        return json.substr(value_start + 1, end - (value_start + 1));
    } else {
        size_t value_end = json.find_first_of(",}\n", value_start);
        if (value_end == std::string::npos) {
            value_end = json.size();
        }

        std::string value = json.substr(value_start, value_end - value_start);
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        return value;
    }
}
