#include "conductor.hpp"
#include "epoll_loop.hpp"
#include "mapping_store.hpp"
#include <iostream>

const char* conductor_state_name(ConductorState state) {
    switch (state) {
        case ConductorState::Stopped:   return "stopped";
        case ConductorState::Running:   return "running";
        case ConductorState::Capturing: return "capturing";
    }
    return "unknown";
}

Conductor::Conductor(InputSource& input, Transport& transport, ConductorSettings settings)
    : input(input), transport(transport), settings(settings),
      table(catalog), engine(catalog, table), mapping_capture(input, table),
      current(ConductorState::Stopped), reverser_sent(false) {}

ConductorState Conductor::state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return current;
}

bool Conductor::editable() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return current != ConductorState::Capturing;
}

bool Conductor::start() {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (current != ConductorState::Stopped) {
        return false;
    }
    current = ConductorState::Running;
    reverser_sent = false;
    return true;
}

void Conductor::stop() {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (current == ConductorState::Running) {
        current = ConductorState::Stopped;
    }
}

std::vector<DeviceDescriptor> Conductor::devices() const {
    std::lock_guard<std::mutex> lock(input_mutex);
    return input.describe_devices();
}

void Conductor::poll_tick() {
    std::vector<RawSample> samples;
    {
        std::lock_guard<std::mutex> lock(input_mutex);
        samples = input.poll_all();
    }
    if (!samples.empty()) {
        engine.run_tick(samples, queue);
    }
}

void Conductor::send_tick(std::chrono::steady_clock::time_point now) {
    const uint16_t reverser_id = catalog.by_name(FN_REVERSER).id;
    ReverserMode mode = table.reverser_mode();

    if (mode != ReverserMode::Axis) {
        auto interval = mode == ReverserMode::TwoWay ? HEARTBEAT_TWO_WAY : HEARTBEAT_THREE_WAY;
        if (!reverser_sent || now - last_reverser_send >= interval) {
            queue.push(reverser_id, engine.reverser_value());
        }
    }

    for (const auto& [id, value] : queue.drain()) {
        bool ok = transport.send(id, value, settings.audio_flag);
        if (!ok) {
            std::cerr << "Failed to send function " << id << " value " << static_cast<int>(value) << "\n";
        }
        if (id == reverser_id) {
            reverser_sent = true;
            last_reverser_send = now;
        }
        if (observer) {
            observer(id, value, ok);
        }
    }
}

int Conductor::run_loop(const std::function<bool()>& keep_running) {
    if (!start()) {
        std::cerr << "Cannot start while " << conductor_state_name(state()) << "\n";
        return 1;
    }

    EpollLoop loop;
    if (!loop.initialize()) {
        stop();
        return 1;
    }
    if (loop.add_timer(settings.poll_interval_ms, [this] { poll_tick(); }) < 0 ||
        loop.add_timer(settings.send_interval_ms, [this] { send_tick(std::chrono::steady_clock::now()); }) < 0) {
        stop();
        return 1;
    }

    int rc = 0;
    while (state() == ConductorState::Running && keep_running()) {
        if (loop.run_once(100) < 0) {
            rc = 1;
            break;
        }
    }

    stop();
    return rc;
}

CaptureResult Conductor::capture(const CaptureTarget& target, const MappingCapture::CollisionResolver& resolver,
                                 const std::atomic<bool>& cancel) {
    if (!target.position) {
        catalog.by_name(target.function);
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (current != ConductorState::Stopped) {
            CaptureResult busy;
            busy.status = CaptureStatus::Busy;
            busy.message = current == ConductorState::Running ? "Stop the conductor before mapping"
                                                              : "A capture is already in progress";
            return busy;
        }
        current = ConductorState::Capturing;
    }

    // Back to Stopped even when the resolver or the capture throws
    struct Restore {
        Conductor& self;
        ~Restore() {
            std::lock_guard<std::mutex> lock(self.state_mutex);
            self.current = ConductorState::Stopped;
        }
    } restore{*this};

    return mapping_capture.run(target, resolver, cancel);
}

bool Conductor::load_mappings(const std::string& path) {
    if (!editable()) return false;
    if (!MappingStore::load(path, table)) {
        return false;
    }
    std::cout << "Loaded " << table.all().size() << " mappings from " << path
              << " (reverser " << reverser_mode_name(table.reverser_mode())
              << ", throttle " << throttle_mode_name(table.throttle_mode()) << ")\n";
    return true;
}

bool Conductor::save_mappings(const std::string& path) const {
    return MappingStore::save(path, table);
}

bool Conductor::set_reverser_mode(ReverserMode mode) {
    if (!editable()) return false;
    table.set_reverser_mode(mode);
    return true;
}

bool Conductor::set_throttle_mode(ThrottleMode mode) {
    if (!editable()) return false;
    table.set_throttle_mode(mode);
    return true;
}
