#include <catch2/catch.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace {

struct TempDir {
    std::string path;

    TempDir() {
        char tmpl[] = "/tmp/conductor_config_XXXXXX";
        if (mkdtemp(tmpl)) path = tmpl;
    }

    ~TempDir() {
        if (!path.empty()) {
            std::string cmd = "rm -rf \"" + path + "\"";
            if (system(cmd.c_str()) != 0) {
                WARN("could not remove " << path);
            }
        }
    }

    std::string write(const std::string& name, const std::string& text) const {
        std::string file = path + "/" + name;
        std::ofstream out(file);
        out << text;
        return file;
    }
};

} // namespace

TEST_CASE("Missing config file", "[config]") {
    CHECK_FALSE(ConfigManager::load("/nonexistent/run8-conductor/config.json"));
}

TEST_CASE("Config file values are read", "[config]") {
    TempDir dir;
    REQUIRE_FALSE(dir.path.empty());

    auto file = dir.write("config.json", R"({
  "version": 1,
  "network": {
    "ip": "192.168.1.50",
    "port": 19000,
    "audio_flag": false
  },
  "timing": {
    "poll_interval_ms": 10,
    "send_interval_ms": 25
  },
  "mappings_file": "/srv/run8/maps.csv",
  "devices": [
    "/dev/input/by-id/usb-Thrustmaster_T16000M-event-joystick",
    "/dev/input/by-id/usb-Saitek_Yoke-event-joystick"
  ]
}
)");

    auto config = ConfigManager::load(file);
    REQUIRE(config);
    CHECK(config->ip == "192.168.1.50");
    CHECK(config->port == 19000);
    CHECK_FALSE(config->audio_flag);
    CHECK(config->poll_interval_ms == 10);
    CHECK(config->send_interval_ms == 25);
    CHECK(config->mappings_file == "/srv/run8/maps.csv");
    REQUIRE(config->devices.size() == 2);
    CHECK(config->devices[1] == "/dev/input/by-id/usb-Saitek_Yoke-event-joystick");
}

TEST_CASE("Omitted keys keep their defaults", "[config]") {
    TempDir dir;
    auto file = dir.write("config.json", "{ \"version\": 1 }\n");

    auto config = ConfigManager::load(file);
    REQUIRE(config);
    CHECK(config->ip == DEFAULT_IP);
    CHECK(config->port == DEFAULT_PORT);
    CHECK(config->audio_flag);
    CHECK(config->send_interval_ms == DEFAULT_SEND_INTERVAL_MS);
    CHECK(config->devices.empty());
    CHECK_FALSE(config->mappings_file.empty());
}

TEST_CASE("Invalid values fall back to defaults", "[config]") {
    Config config;
    config.ip = "999.1.1.1";
    config.port = 70000;
    config.poll_interval_ms = 0;
    config.send_interval_ms = 5000;

    CHECK_FALSE(ConfigManager::validate(config));
    CHECK(config.ip == DEFAULT_IP);
    CHECK(config.port == DEFAULT_PORT);
    CHECK(config.poll_interval_ms == DEFAULT_POLL_INTERVAL_MS);
    CHECK(config.send_interval_ms == DEFAULT_SEND_INTERVAL_MS);

    Config good;
    good.mappings_file = "/tmp/x.csv";
    CHECK(ConfigManager::validate(good));
}

TEST_CASE("Saved config loads back", "[config]") {
    TempDir dir;
    Config config;
    config.ip = "10.0.0.7";
    config.port = 18889;
    config.audio_flag = false;
    config.mappings_file = dir.path + "/maps \"quoted\".csv";
    config.devices = {"/dev/input/by-id/a-event-joystick"};

    std::string path = dir.path + "/sub/config.json";
    REQUIRE(ConfigManager::save(path, config));

    auto loaded = ConfigManager::load(path);
    REQUIRE(loaded);
    CHECK(loaded->ip == "10.0.0.7");
    CHECK(loaded->port == 18889);
    CHECK_FALSE(loaded->audio_flag);
    CHECK(loaded->mappings_file == config.mappings_file);
    CHECK(loaded->devices == config.devices);
}

TEST_CASE("Home directory expansion", "[config]") {
    const char* home = getenv("HOME");
    if (home) {
        CHECK(ConfigManager::expand_home("~/maps.csv") == std::string(home) + "/maps.csv");
    }
    CHECK(ConfigManager::expand_home("/abs/maps.csv") == "/abs/maps.csv");
}
