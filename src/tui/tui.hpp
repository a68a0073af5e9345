#pragma once

#include "tui_common.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

// Main TUI class
class TUI {
private:
    bool running;
    ViewType current_view;
    std::vector<std::unique_ptr<View>> views;
    Config config;
    std::unique_ptr<EvdevInputSource> input;
    std::unique_ptr<UdpTransport> transport;
    std::unique_ptr<Conductor> conductor;
    bool config_modified;
    bool mappings_modified;
    std::string status_message;
    int status_color;

    // Conductor loop runs on its own thread while the Monitor is started
    std::thread loop_thread;
    std::atomic<bool> loop_stop;
    std::atomic<bool> loop_alive;

    mutable std::mutex sent_mutex;
    std::map<uint16_t, SentValue> sent_values;
    uint64_t sent_total;
    uint64_t failed_total;

    // UI state
    int screen_height, screen_width;
    std::unique_ptr<Window> header_win;
    std::unique_ptr<Window> main_win;
    std::unique_ptr<Window> status_win;

    // stdout/stderr logging is collected here while curses owns the terminal
    std::ostringstream log_buffer;
    std::streambuf* saved_cout;
    std::streambuf* saved_cerr;

    void record_sent(uint16_t function_id, uint8_t value, bool ok);
    std::string last_log_line();

public:
    TUI();
    ~TUI();

    void init_ncurses();
    void create_windows();
    void load_config();
    void save_config();
    void create_views();
    void rescan_devices();
    void draw_header();
    void draw_status();
    void run();
    void handle_global_input(int ch);
    void show_help();

    bool start_conductor();
    void stop_conductor();
    bool is_conductor_running() const;

    // Stops the loop if it is running; returns whether it was
    bool pause_conductor();
    void resume_conductor(bool was_running);

    std::map<uint16_t, SentValue> get_sent_values() const;
    uint64_t get_sent_total() const;
    uint64_t get_failed_total() const;
    void reset_sent();

    // Getters
    Config& get_config() { return config; }
    EvdevInputSource& get_input() { return *input; }
    Conductor& get_conductor() { return *conductor; }
    int get_screen_width() const { return screen_width; }
    int get_screen_height() const { return screen_height; }
    Window* get_main_win() { return main_win.get(); }
    void mark_modified() { config_modified = true; }
    void mark_mappings_modified() { mappings_modified = true; }
    bool is_modified() const { return config_modified || mappings_modified; }
    void set_view(ViewType view) { current_view = view; }
    void set_status(const std::string& message, int color = CP_DEFAULT) {
        status_message = message;
        status_color = color;
    }
};
