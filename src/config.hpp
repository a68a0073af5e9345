#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <vector>

constexpr int CONFIG_VERSION = 1;
constexpr const char* DEFAULT_IP = "127.0.0.1";
constexpr int DEFAULT_PORT = 18888;
constexpr int DEFAULT_POLL_INTERVAL_MS = 20;
constexpr int DEFAULT_SEND_INTERVAL_MS = 20;

struct Config {
    int version = CONFIG_VERSION;

    // Simulator endpoint
    std::string ip = DEFAULT_IP;
    int port = DEFAULT_PORT;
    bool audio_flag = true;

    int poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
    int send_interval_ms = DEFAULT_SEND_INTERVAL_MS;

    std::string mappings_file;

    // Enabled joysticks by /dev/input/by-id path; empty enables all
    std::vector<std::string> devices;
};

class ConfigManager {
public:
    static std::string get_config_path();
    static std::string default_mappings_path();
    static std::optional<Config> load(const std::string& config_path);
    static bool save(const std::string& config_path, const Config& config);

    // Replaces out-of-range values with defaults; false if anything was replaced
    static bool validate(Config& config);

    static std::string expand_home(const std::string& path);

private:
    static std::string escape_json_string(const std::string& str);
    static std::string unescape_json_string(const std::string& str);
    static std::optional<std::string> get_json_value(const std::string& json, std::string_view key);
    static std::vector<std::string> parse_string_array(const std::string& json);
};
