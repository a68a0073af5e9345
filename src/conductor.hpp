#pragma once

#include "bindings.hpp"
#include "capture.hpp"
#include "command_queue.hpp"
#include "function_catalog.hpp"
#include "input_source.hpp"
#include "udp_transport.hpp"
#include "value_engine.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

constexpr auto HEARTBEAT_TWO_WAY = std::chrono::milliseconds(250);
constexpr auto HEARTBEAT_THREE_WAY = std::chrono::milliseconds(500);

struct ConductorSettings {
    bool audio_flag = true;
    int poll_interval_ms = 20;
    int send_interval_ms = 20;
};

enum class ConductorState {
    Stopped,
    Running,
    Capturing
};

const char* conductor_state_name(ConductorState state);

// Owns the mapping table and engine and drives them from the input source to the transport.
//
// Ticks, capture and table edits all touch the same state. They must happen on one
// thread, or with the loop stopped first.
class Conductor {
public:
    using SendObserver = std::function<void(uint16_t function_id, uint8_t value, bool ok)>;

    Conductor(InputSource& input, Transport& transport, ConductorSettings settings = ConductorSettings());

    Conductor(const Conductor&) = delete;
    Conductor& operator=(const Conductor&) = delete;

    const FunctionCatalog& get_catalog() const { return catalog; }
    MappingTable& get_table() { return table; }
    const MappingTable& get_table() const { return table; }
    ValueEngine& get_engine() { return engine; }
    CommandQueue& get_queue() { return queue; }
    MappingCapture& get_capture() { return mapping_capture; }
    InputSource& get_input() { return input; }

    ConductorState state() const;
    bool start();
    void stop();

    // Snapshot of the input devices, safe to call while the loop runs on another thread
    std::vector<DeviceDescriptor> devices() const;

    void poll_tick();
    void send_tick(std::chrono::steady_clock::time_point now);

    // Runs poll and send ticks until keep_running returns false or stop() is called.
    // keep_running is checked between ticks on the loop thread.
    int run_loop(const std::function<bool()>& keep_running);

    // Refused with Busy unless stopped
    CaptureResult capture(const CaptureTarget& target, const MappingCapture::CollisionResolver& resolver,
                          const std::atomic<bool>& cancel);

    bool load_mappings(const std::string& path);
    bool save_mappings(const std::string& path) const;

    bool set_reverser_mode(ReverserMode mode);
    bool set_throttle_mode(ThrottleMode mode);

    void set_send_observer(SendObserver obs) { observer = std::move(obs); }

private:
    InputSource& input;
    Transport& transport;
    ConductorSettings settings;

    FunctionCatalog catalog;
    MappingTable table;
    ValueEngine engine;
    CommandQueue queue;
    MappingCapture mapping_capture;

    mutable std::mutex state_mutex;
    mutable std::mutex input_mutex;
    ConductorState current;

    bool reverser_sent;
    std::chrono::steady_clock::time_point last_reverser_send;
    SendObserver observer;

    bool editable() const;
};
