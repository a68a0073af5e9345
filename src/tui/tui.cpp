#include "tui.hpp"
#include "../version.hpp"
#include "device_dashboard.hpp"
#include "mappings_view.hpp"
#include "live_monitor.hpp"

TUI::TUI() : running(true), current_view(ViewType::DASHBOARD),
        config_modified(false), mappings_modified(false), status_color(CP_DEFAULT),
        loop_stop(false), loop_alive(false), sent_total(0), failed_total(0),
        screen_height(0), screen_width(0), saved_cout(nullptr), saved_cerr(nullptr) {
    saved_cout = std::cout.rdbuf(log_buffer.rdbuf());
    saved_cerr = std::cerr.rdbuf(log_buffer.rdbuf());

    load_config();
    input = std::make_unique<EvdevInputSource>(config.devices);
    transport = std::make_unique<UdpTransport>(config.ip, static_cast<uint16_t>(config.port));

    ConductorSettings settings;
    settings.audio_flag = config.audio_flag;
    settings.poll_interval_ms = config.poll_interval_ms;
    settings.send_interval_ms = config.send_interval_ms;
    conductor = std::make_unique<Conductor>(*input, *transport, settings);
    conductor->set_send_observer([this](uint16_t id, uint8_t value, bool ok) { record_sent(id, value, ok); });

    if (!conductor->load_mappings(config.mappings_file)) {
        set_status("No mappings yet at " + config.mappings_file, CP_WARNING);
    }

    init_ncurses();
    create_views();
    create_windows();
}

TUI::~TUI() {
    stop_conductor();
    endwin();
    std::cout.rdbuf(saved_cout);
    std::cerr.rdbuf(saved_cerr);
}

void TUI::init_ncurses() {
    initscr();
    cbreak();
    noecho();
    noqiflush();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(100); // 100ms timeout for getch

    // Disable XON/XOFF flow control so Ctrl+S reaches the app
    struct termios term;
    tcgetattr(STDIN_FILENO, &term);
    term.c_iflag &= ~(IXON | IXOFF);
    tcsetattr(STDIN_FILENO, TCSANOW, &term);

    if (has_colors()) {
        start_color();
        use_default_colors();

        init_pair(CP_DEFAULT, COLOR_WHITE, -1);
        init_pair(CP_HEADER, COLOR_CYAN, -1);
        init_pair(CP_HIGHLIGHT, COLOR_BLACK, COLOR_CYAN);
        init_pair(CP_ONLINE, COLOR_GREEN, -1);
        init_pair(CP_OFFLINE, COLOR_RED, -1);
        init_pair(CP_WARNING, COLOR_YELLOW, -1);
        init_pair(CP_ERROR, COLOR_RED, -1);
        init_pair(CP_SUCCESS, COLOR_GREEN, -1);
        init_pair(CP_BINDING, COLOR_MAGENTA, -1);
        init_pair(CP_AXIS, COLOR_BLUE, -1);
        init_pair(CP_BUTTON, COLOR_YELLOW, -1);
        init_pair(CP_SELECTED, COLOR_BLACK, COLOR_WHITE);
        init_pair(CP_BORDER, COLOR_WHITE, -1);
    }

    getmaxyx(stdscr, screen_height, screen_width);
}

void TUI::create_windows() {
    header_win = std::make_unique<Window>(3, screen_width, 0, 0, "", false);
    main_win = std::make_unique<Window>(screen_height - 5, screen_width, 3, 0, "", false);
    status_win = std::make_unique<Window>(2, screen_width, screen_height - 2, 0, "", false);
}

void TUI::load_config() {
    auto loaded = ConfigManager::load(ConfigManager::get_config_path());
    if (loaded) {
        config = *loaded;
    } else {
        config = Config();
        ConfigManager::validate(config);
    }
}

void TUI::save_config() {
    bool ok = true;
    if (config_modified) {
        config.devices = input->enabled_by_id();
        if (ConfigManager::save(ConfigManager::get_config_path(), config)) {
            config_modified = false;
        } else {
            ok = false;
        }
    }
    if (mappings_modified) {
        if (conductor->save_mappings(config.mappings_file)) {
            mappings_modified = false;
        } else {
            ok = false;
        }
    }
    if (ok) {
        set_status("Saved", CP_SUCCESS);
    } else {
        set_status("Save failed", CP_ERROR);
    }
}

void TUI::rescan_devices() {
    bool was_running = pause_conductor();
    input->scan();
    conductor->get_engine().reset();
    resume_conductor(was_running);
}

void TUI::record_sent(uint16_t function_id, uint8_t value, bool ok) {
    std::lock_guard<std::mutex> lock(sent_mutex);
    SentValue& sv = sent_values[function_id];
    sv.value = value;
    sv.ok = ok;
    sv.count++;
    sv.at = std::chrono::steady_clock::now();
    sent_total++;
    if (!ok) failed_total++;
}

std::map<uint16_t, SentValue> TUI::get_sent_values() const {
    std::lock_guard<std::mutex> lock(sent_mutex);
    return sent_values;
}

uint64_t TUI::get_sent_total() const {
    std::lock_guard<std::mutex> lock(sent_mutex);
    return sent_total;
}

uint64_t TUI::get_failed_total() const {
    std::lock_guard<std::mutex> lock(sent_mutex);
    return failed_total;
}

void TUI::reset_sent() {
    std::lock_guard<std::mutex> lock(sent_mutex);
    sent_values.clear();
    sent_total = 0;
    failed_total = 0;
}

std::string TUI::last_log_line() {
    std::string text = log_buffer.str();
    while (!text.empty() && text.back() == '\n') text.pop_back();
    size_t nl = text.find_last_of('\n');
    return nl == std::string::npos ? text : text.substr(nl + 1);
}

bool TUI::start_conductor() {
    if (is_conductor_running()) {
        return true;
    }
    // Loop may have exited on its own after an error
    if (loop_thread.joinable()) {
        loop_thread.join();
    }
    if (!transport->is_ready() && !transport->initialize()) {
        set_status("Could not open UDP socket to " + config.ip, CP_ERROR);
        return false;
    }
    loop_stop = false;
    loop_alive = true;
    loop_thread = std::thread([this]() {
        if (conductor->run_loop([this]() { return !loop_stop.load(); }) != 0) {
            std::cerr << "Conductor loop stopped with an error\n";
        }
        loop_alive = false;
    });
    return true;
}

void TUI::stop_conductor() {
    if (!loop_thread.joinable()) {
        return;
    }
    loop_stop = true;
    conductor->stop();
    loop_thread.join();
}

bool TUI::is_conductor_running() const {
    return loop_alive;
}

bool TUI::pause_conductor() {
    bool was_running = loop_alive;
    stop_conductor();
    return was_running;
}

void TUI::resume_conductor(bool was_running) {
    if (was_running) {
        start_conductor();
    }
}

void TUI::draw_header() {
    header_win->clear();

    wattron(header_win->get(), COLOR_PAIR(CP_HEADER) | A_BOLD);
    mvwprintw(header_win->get(), 0, 2, "Run8 Conductor - %s:%d", config.ip.c_str(), config.port);
    wattroff(header_win->get(), COLOR_PAIR(CP_HEADER) | A_BOLD);

    std::string status = std::string(is_conductor_running() ? " [RUNNING]" : " [STOPPED]") +
                         (is_modified() ? " [MODIFIED]" : "");
    wattron(header_win->get(), COLOR_PAIR(is_modified() ? CP_WARNING : CP_DEFAULT));
    mvwprintw(header_win->get(), 0, screen_width - status.length() - 2, "%s", status.c_str());
    wattroff(header_win->get(), COLOR_PAIR(is_modified() ? CP_WARNING : CP_DEFAULT));

    const char* tabs[] = {"[F1] Devices", "[F2] Mappings", "[F3] Monitor"};
    ViewType tab_views[] = {ViewType::DASHBOARD, ViewType::MAPPINGS, ViewType::MONITOR};
    int x = 2;
    for (int i = 0; i < 3; i++) {
        if (tab_views[i] == current_view) {
            wattron(header_win->get(), COLOR_PAIR(CP_HIGHLIGHT));
            mvwprintw(header_win->get(), 2, x, "%s", tabs[i]);
            wattroff(header_win->get(), COLOR_PAIR(CP_HIGHLIGHT));
        } else {
            mvwprintw(header_win->get(), 2, x, "%s", tabs[i]);
        }
        x += strlen(tabs[i]) + 4;
    }

    mvwhline(header_win->get(), 1, 0, ACS_HLINE, screen_width);

    header_win->refresh();
}

void TUI::draw_status() {
    status_win->clear();

    std::string message = status_message;
    int color = status_color;
    if (message.empty() && !is_conductor_running()) {
        message = last_log_line();
        color = CP_DEFAULT;
    }
    if (!message.empty()) {
        wattron(status_win->get(), COLOR_PAIR(color));
        mvwprintw(status_win->get(), 0, 2, "%s", truncate_to(message, screen_width - 30).c_str());
        wattroff(status_win->get(), COLOR_PAIR(color));
    }

    auto devices = conductor->devices();
    int active = static_cast<int>(std::count_if(devices.begin(), devices.end(),
        [](const DeviceDescriptor& d) { return d.enabled && d.online; }));
    std::string dev_status = std::to_string(active) + "/" + std::to_string(devices.size()) + " devices active";
    mvwprintw(status_win->get(), 0, screen_width - dev_status.length() - 2, "%s", dev_status.c_str());

    wattron(status_win->get(), COLOR_PAIR(CP_DEFAULT) | A_DIM);
    mvwprintw(status_win->get(), 1, 2, "Tab: Switch Views | Enter: Select | q: Quit | h: Help | Ctrl+S: Save");
    std::string ver = "v" + std::string(CONDUCTOR_VERSION);
    mvwprintw(status_win->get(), 1, screen_width - ver.length() - 2, "%s", ver.c_str());
    wattroff(status_win->get(), COLOR_PAIR(CP_DEFAULT) | A_DIM);

    status_win->refresh();
}

void TUI::run() {
    clear();
    ::refresh();
    if (static_cast<size_t>(current_view) < views.size()) {
        views[static_cast<int>(current_view)]->refresh();
    }

    ViewType last_view = current_view;

    while (running) {
        if (current_view != last_view) {
            if (static_cast<size_t>(current_view) < views.size()) {
                views[static_cast<int>(current_view)]->refresh();
            }
            last_view = current_view;
        }

        draw_header();
        draw_status();

        if (static_cast<size_t>(current_view) < views.size()) {
            views[static_cast<int>(current_view)]->draw();
        }

        int ch = getch();
        if (ch != ERR) {
            handle_global_input(ch);
        }
    }
}

void TUI::handle_global_input(int ch) {
    const std::vector<ViewType> view_order = {
        ViewType::DASHBOARD,
        ViewType::MAPPINGS,
        ViewType::MONITOR
    };

    switch (ch) {
        case KEY_F(1): current_view = ViewType::DASHBOARD; break;
        case KEY_F(2): current_view = ViewType::MAPPINGS; break;
        case KEY_F(3): current_view = ViewType::MONITOR; break;
        case 9: // Tab
        case KEY_RIGHT: {
            int current_idx = 0;
            for (size_t i = 0; i < view_order.size(); i++) {
                if (view_order[i] == current_view) {
                    current_idx = i;
                    break;
                }
            }
            current_view = view_order[(current_idx + 1) % view_order.size()];
            break;
        }
        case KEY_BTAB:
        case KEY_LEFT: {
            int current_idx = 0;
            for (size_t i = 0; i < view_order.size(); i++) {
                if (view_order[i] == current_view) {
                    current_idx = i;
                    break;
                }
            }
            current_view = view_order[(current_idx - 1 + view_order.size()) % view_order.size()];
            break;
        }
        case 'q':
        case 'Q':
            if (is_modified()) {
                int h = 7, w = 45;
                int starty = (screen_height - h) / 2;
                int startx = (screen_width - w) / 2;

                Window dialog(h, w, starty, startx, " Unsaved Changes ");
                dialog.print(2, 2, "Save changes before quitting?");
                dialog.print(4, 2, "[y] Save & Quit  [n] Discard  [ESC] Cancel", A_DIM);
                dialog.refresh();

                int confirm;
                while ((confirm = getch()) != 'y' && confirm != 'Y' &&
                       confirm != 'n' && confirm != 'N' && confirm != 27) {}

                if (confirm == 'y' || confirm == 'Y') {
                    save_config();
                    running = false;
                } else if (confirm == 'n' || confirm == 'N') {
                    running = false;
                }
                if (static_cast<size_t>(current_view) < views.size()) {
                    views[static_cast<int>(current_view)]->refresh();
                }
            } else {
                running = false;
            }
            break;
        case 0x13: // Ctrl+S
            save_config();
            break;
        case 'h':
        case 'H':
        case '?':
            show_help();
            break;
        default:
            if (static_cast<size_t>(current_view) < views.size()) {
                views[static_cast<int>(current_view)]->handle_input(ch);
            }
            break;
    }
}

void TUI::show_help() {
    int h = 22, w = 60;
    int starty = (screen_height - h) / 2;
    int startx = (screen_width - w) / 2;

    Window help_win(h, w, starty, startx, " Help ");

    help_win.print(2, 2, "Global Keys:", COLOR_PAIR(CP_HEADER) | A_BOLD);
    help_win.print(3, 4, "F1-F3       Switch between views");
    help_win.print(4, 4, "Tab/←→      Next/Previous view");
    help_win.print(5, 4, "Ctrl+S      Save configuration and mappings");
    help_win.print(6, 4, "q           Quit application");

    help_win.print(8, 2, "Devices:", COLOR_PAIR(CP_HEADER) | A_BOLD);
    help_win.print(9, 4, "Space       Enable/disable device");
    help_win.print(10, 4, "d           Rescan devices");

    help_win.print(12, 2, "Mappings:", COLOR_PAIR(CP_HEADER) | A_BOLD);
    help_win.print(13, 4, "Enter       Capture input (ESC cancels)");
    help_win.print(14, 4, "c / r       Clear mapping / reverse lever axis");
    help_win.print(15, 4, "m / t       Cycle reverser / throttle mode");

    help_win.print(17, 2, "Monitor:", COLOR_PAIR(CP_HEADER) | A_BOLD);
    help_win.print(18, 4, "Space       Start/stop sending to the simulator");

    help_win.print(20, 2, "Press any key to close...", COLOR_PAIR(CP_WARNING));

    help_win.refresh();
    while (getch() == ERR) {}
    if (static_cast<size_t>(current_view) < views.size()) {
        views[static_cast<int>(current_view)]->refresh();
    }
}

void TUI::create_views() {
    views.push_back(std::make_unique<DeviceDashboard>(this));
    views.push_back(std::make_unique<MappingsView>(this));
    views.push_back(std::make_unique<LiveMonitor>(this));
}
