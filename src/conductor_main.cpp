#include "config.hpp"
#include "bindings.hpp"
#include "conductor.hpp"
#include "evdev_input_source.hpp"
#include "mapping_store.hpp"
#include "udp_transport.hpp"
#include "version.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>

static volatile sig_atomic_t running = 1;
static volatile sig_atomic_t reload_requested = 0;
static std::atomic<bool> capture_cancel{false};

void signal_handler(int sig) {
    if (sig == SIGHUP) {
        reload_requested = 1;
        return;
    }
    running = 0;
    capture_cancel.store(true);
}

static void install_signal_handlers() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
}

static Config load_config() {
    std::string config_path = ConfigManager::get_config_path();
    auto config_opt = ConfigManager::load(config_path);
    if (!config_opt) {
        std::cout << "No configuration at " << config_path << ", using defaults\n";
        Config config;
        ConfigManager::validate(config);
        return config;
    }
    return *config_opt;
}

static ConductorSettings settings_from(const Config& config) {
    ConductorSettings settings;
    settings.audio_flag = config.audio_flag;
    settings.poll_interval_ms = config.poll_interval_ms;
    settings.send_interval_ms = config.send_interval_ms;
    return settings;
}

static void print_devices(const InputSource& input) {
    auto devices = input.describe_devices();
    if (devices.empty()) {
        std::cout << "No joysticks found under " << INPUT_BY_ID_DIR << "\n";
        return;
    }
    for (const auto& d : devices) {
        std::cout << "  [" << d.id << "] " << d.name
                  << "  buttons=" << d.buttons << " axes=" << d.axes << " hats=" << d.hats
                  << (d.online ? "" : "  OFFLINE")
                  << (d.enabled ? "" : "  (disabled)") << "\n";
        std::cout << "      " << d.by_id << "\n";
    }
}

static void print_mappings(const MappingTable& table) {
    const auto& catalog = table.get_catalog();
    for (const auto& category : catalog.categories()) {
        std::cout << "  -- " << category << " --\n";
        for (const auto& spec : catalog.in_category(category)) {
            auto mapping = table.get(spec.name);
            std::cout << "    " << std::left << std::setw(28) << spec.name
                      << std::setw(10) << behavior_name(spec.behavior);
            if (mapping) {
                std::cout << describe_locator(mapping->locator);
                if (mapping->reverse_axis) std::cout << " (reversed)";
            } else {
                std::cout << "(unmapped)";
            }
            std::cout << "\n";
        }
    }
    std::cout << "  Reverser mode: " << reverser_mode_name(table.reverser_mode()) << "\n";
    for (const auto& [position, loc] : table.reverser_positions()) {
        std::cout << "    " << position_name(position) << ": " << describe_locator(loc) << "\n";
    }
    std::cout << "  Throttle mode: " << throttle_mode_name(table.throttle_mode()) << "\n";
}

static CollisionChoice ask_collision(const std::vector<std::string>& others, const InputLocator& locator) {
    std::cout << describe_locator(locator) << " is already mapped to:\n";
    for (const auto& name : others) {
        std::cout << "  " << name << "\n";
    }
    std::cout << "[o] Remove other mapping  [k] Keep both  [c] Cancel: ";
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer) || answer.empty()) {
        return CollisionChoice::Cancel;
    }
    switch (answer[0]) {
        case 'o': case 'O': return CollisionChoice::ClearOther;
        case 'k': case 'K': return CollisionChoice::KeepBoth;
        default:            return CollisionChoice::Cancel;
    }
}

int diagnostics_mode(const Config& config, Conductor& conductor, EvdevInputSource& input, bool mappings_loaded) {
    std::cout << "=== Run8 Conductor Diagnostics ===\n\n";
    std::cout << "Version: " << CONDUCTOR_VERSION << "\n";
    std::cout << "Config file: " << ConfigManager::get_config_path() << "\n";
    std::cout << "Destination: " << config.ip << ":" << config.port
              << " (audio flag " << (config.audio_flag ? "on" : "off") << ")\n";
    std::cout << "Poll interval: " << config.poll_interval_ms << "ms, send interval: "
              << config.send_interval_ms << "ms\n";
    std::cout << "Mappings file: " << config.mappings_file
              << (mappings_loaded ? "" : " (not found)") << "\n\n";

    std::cout << "Devices:\n";
    print_devices(input);
    std::cout << "\nMappings:\n";
    print_mappings(conductor.get_table());

    int unreachable = 0;
    auto online = input.list_devices();
    for (const auto& [name, mapping] : conductor.get_table().all()) {
        bool found = false;
        for (int id : online) {
            if (id == mapping.locator.device_id) found = true;
        }
        if (!found) {
            std::cout << "WARNING: " << name << " is mapped to device " << mapping.locator.device_id
                      << " which is not available\n";
            unreachable++;
        }
    }
    std::cout << "\n" << conductor.get_table().all().size() << " mappings, " << unreachable
              << " on unavailable devices\n";
    return 0;
}

int monitor_mode(Conductor& conductor, EvdevInputSource& input) {
    std::cout << "\n=== Live Input Stream ===\n";
    std::cout << "Move controls or press buttons to see activity (Ctrl+C to quit)...\n\n";

    const auto& table = conductor.get_table();
    while (running) {
        for (const auto& s : input.poll_all()) {
            std::cout << "[" << input.device_name(s.device_id) << "] ";
            switch (s.kind) {
                case InputKind::Button:
                    std::cout << "Button " << s.index << (s.pressed ? " [PRESSED]" : " [RELEASED]");
                    break;
                case InputKind::Axis:
                    std::cout << "Axis " << s.index << " " << std::fixed << std::setprecision(3) << s.axis;
                    break;
                case InputKind::Hat:
                    std::cout << "Hat " << s.index << " (" << s.hat.x << "," << s.hat.y << ")";
                    break;
            }
            auto mapped = table.find_by_source(s.device_id, s.kind, s.index);
            if (mapped.empty()) {
                std::cout << " -> [UNMAPPED]";
            }
            for (const auto& m : mapped) {
                std::cout << " -> " << m.function;
            }
            std::cout << "\n";
        }
        std::cout.flush();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return 0;
}

int capture_mode(Conductor& conductor, const CaptureTarget& target, const std::string& mappings_file) {
    std::cout << "Actuate the control for " << target.label() << " (5 seconds)...\n";
    std::cout.flush();

    CaptureResult result = conductor.capture(target, ask_collision, capture_cancel);
    switch (result.status) {
        case CaptureStatus::Detected:
            std::cout << "Mapped " << result.message << "\n";
            if (!conductor.save_mappings(mappings_file)) {
                std::cerr << "Failed to save " << mappings_file << "\n";
                return 1;
            }
            return 0;
        case CaptureStatus::Timeout:
            std::cout << "No input detected\n";
            return 0;
        default:
            std::cerr << "Capture " << capture_status_name(result.status);
            if (!result.message.empty()) std::cerr << ": " << result.message;
            std::cerr << "\n";
            return 1;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTION]\n";
    std::cout << "Run8 Conductor - joystick to Run8 train simulator bridge\n\n";
    std::cout << "Options:\n";
    std::cout << "  --list-devices                 List joysticks and their indexes\n";
    std::cout << "  --diagnostics                  Report configuration, devices and mappings\n";
    std::cout << "  --monitor                      Print live input and the functions it drives\n";
    std::cout << "  --capture \"<Function>\"         Map a function to the next control actuated\n";
    std::cout << "  --capture-reverser <position>  Map forward, neutral or reverse for switch reversers\n";
    std::cout << "  --clear \"<Function>\"           Remove the mapping for a function\n";
    std::cout << "  --reverse \"<Function>\" on|off  Reverse a lever axis\n";
    std::cout << "  --reverser-mode axis|2way|3way Set how the reverser is driven\n";
    std::cout << "  --throttle-mode separate|toggle|split\n";
    std::cout << "                                 Set the combined throttle/dynamic brake mode\n";
    std::cout << "  --help                         Show this help message\n\n";
    std::cout << "When run without options, the conductor polls the mapped controls and sends\n";
    std::cout << "changes to the simulator until interrupted. SIGHUP reloads the mapping file.\n";
}

static int run_mode(Conductor& conductor, const Config& config) {
    std::cout << "Sending to " << config.ip << ":" << config.port << " every "
              << config.send_interval_ms << "ms, polling every " << config.poll_interval_ms << "ms\n";

    int rc = conductor.run_loop([&]() {
        if (reload_requested) {
            reload_requested = 0;
            std::cout << "Reloading " << config.mappings_file << "\n";
            if (!conductor.load_mappings(config.mappings_file)) {
                std::cerr << "Reload failed, keeping current mappings\n";
            }
        }
        return running != 0;
    });

    std::cout << "Exiting...\n";
    return rc;
}

int main(int argc, char* argv[]) {
    // Check for help option first, before any other operations
    if (argc >= 2 && (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0)) {
        print_usage(argv[0]);
        return 0;
    }

    install_signal_handlers();

#ifdef CONDUCTOR_DEBUG
    const char* debug_env = getenv("CONDUCTOR_DEBUG");
    debug_log_enabled = (debug_env && strcmp(debug_env, "1") == 0);
    if (debug_log_enabled) {
        printf("Debug logging enabled\n");
    }
#endif

    try {
        Config config = load_config();
        std::string mode = argc >= 2 ? argv[1] : "";
        std::string arg1 = argc >= 3 ? argv[2] : "";
        std::string arg2 = argc >= 4 ? argv[3] : "";

        EvdevInputSource input(config.devices);

        if (mode == "--list-devices") {
            print_devices(input);
            return 0;
        }

        UdpTransport transport(config.ip, static_cast<uint16_t>(config.port));
        Conductor conductor(input, transport, settings_from(config));
        bool mappings_loaded = conductor.load_mappings(config.mappings_file);
        if (!mappings_loaded) {
            std::cout << "No mappings at " << config.mappings_file << "\n";
        }

        const FunctionCatalog& catalog = conductor.get_catalog();
        auto require_function = [&](const std::string& name) {
            if (!catalog.contains(name)) {
                std::cerr << "Unknown function '" << name << "'. Known functions:\n";
                for (const auto& spec : catalog.all()) std::cerr << "  " << spec.name << "\n";
                return false;
            }
            return true;
        };
        auto save = [&]() {
            if (!conductor.save_mappings(config.mappings_file)) {
                std::cerr << "Failed to save " << config.mappings_file << "\n";
                return 1;
            }
            std::cout << "Saved " << config.mappings_file << "\n";
            return 0;
        };

        if (mode == "--diagnostics") {
            return diagnostics_mode(config, conductor, input, mappings_loaded);
        }
        if (mode == "--monitor") {
            return monitor_mode(conductor, input);
        }
        if (mode == "--capture") {
            if (!require_function(arg1)) return 1;
            return capture_mode(conductor, CaptureTarget::for_function(arg1), config.mappings_file);
        }
        if (mode == "--capture-reverser") {
            auto position = parse_position(arg1);
            if (!position) {
                std::cerr << "Expected forward, neutral or reverse\n";
                return 1;
            }
            return capture_mode(conductor, CaptureTarget::for_position(*position), config.mappings_file);
        }
        if (mode == "--clear") {
            if (!require_function(arg1)) return 1;
            if (!conductor.get_table().clear(arg1)) {
                std::cout << arg1 << " was not mapped\n";
                return 0;
            }
            return save();
        }
        if (mode == "--reverse") {
            if (!require_function(arg1)) return 1;
            if (arg2 != "on" && arg2 != "off") {
                std::cerr << "Expected on or off\n";
                return 1;
            }
            if (!conductor.get_table().set_reverse(arg1, arg2 == "on")) {
                std::cerr << arg1 << " is not mapped\n";
                return 1;
            }
            return save();
        }
        if (mode == "--reverser-mode") {
            auto m = parse_reverser_mode(arg1);
            if (!m) {
                std::cerr << "Expected axis, 2way or 3way\n";
                return 1;
            }
            if (!conductor.set_reverser_mode(*m)) {
                std::cerr << "Mode cannot change while a capture is running\n";
                return 1;
            }
            return save();
        }
        if (mode == "--throttle-mode") {
            auto m = parse_throttle_mode(arg1);
            if (!m) {
                std::cerr << "Expected separate, toggle or split\n";
                return 1;
            }
            if (!conductor.set_throttle_mode(*m)) {
                std::cerr << "Mode cannot change while a capture is running\n";
                return 1;
            }
            return save();
        }
        if (!mode.empty()) {
            std::cerr << "Unknown option " << mode << "\n";
            print_usage(argv[0]);
            return 1;
        }

        if (input.list_devices().empty()) {
            std::cout << "WARNING: No enabled joysticks available yet, waiting for reconnect\n";
        }
        if (!transport.initialize()) {
            return 1;
        }
        return run_mode(conductor, config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
