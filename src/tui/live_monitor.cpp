#include "live_monitor.hpp"

LiveMonitor::LiveMonitor(TUI* parent) : View(parent, ViewType::MONITOR) {}

void LiveMonitor::draw_values_panel(Window* win, int start_col, int panel_width, int start_row, int max_row) {
    const auto& catalog = tui->get_conductor().get_catalog();
    auto sent = tui->get_sent_values();
    auto now = std::chrono::steady_clock::now();

    int label_width = std::max(20, (panel_width - 16) * 45 / 100);
    int col_bar = start_col + label_width;
    int bar_width = std::max(10, panel_width - label_width - 12);
    int col_value = col_bar + bar_width + 1;

    win->print(start_row - 1, start_col - 2, "Sent Values", A_BOLD | A_UNDERLINE);

    if (sent.empty()) {
        win->print(start_row, start_col, "Nothing sent yet", A_DIM);
        return;
    }

    int row = start_row;
    for (const auto& [id, sv] : sent) {
        if (row >= max_row) break;

        const FunctionSpec* spec = catalog.by_id(id);
        std::string name = spec ? spec->name : ("#" + std::to_string(id));
        mvwprintw(win->get(), row, start_col, "%-*s", label_width,
                  truncate_to(name, label_width - 2).c_str());

        win->draw_bar(row, col_bar, bar_width, sv.value / 255.0f);

        // Recent sends stand out
        bool fresh = now - sv.at < std::chrono::milliseconds(500);
        int attrs = !sv.ok ? COLOR_PAIR(CP_ERROR) : (fresh ? COLOR_PAIR(CP_ONLINE) | A_BOLD : 0);
        if (attrs) wattron(win->get(), attrs);
        mvwprintw(win->get(), row, col_value, "%4d%s", sv.value, sv.ok ? "" : " !");
        if (attrs) wattroff(win->get(), attrs);
        row++;
    }
}

void LiveMonitor::draw_switches_panel(Window* win, int start_col, int start_row) {
    auto& conductor = tui->get_conductor();
    const auto& table = conductor.get_table();

    win->print(start_row - 1, start_col - 1, "Controls", A_BOLD | A_UNDERLINE);

    int row = start_row;
    win->print(row++, start_col, std::string("Reverser mode: ") + reverser_mode_name(table.reverser_mode()));
    win->print(row++, start_col, std::string("Throttle mode: ") + throttle_mode_name(table.throttle_mode()));
    row++;

    if (table.reverser_mode() != ReverserMode::Axis) {
        win->print(row++, start_col, std::string("Reverser: ") +
                   position_name(conductor.get_engine().reverser().position()), COLOR_PAIR(CP_BINDING));
    }
    if (table.throttle_mode() != ThrottleMode::Separate) {
        const auto& lever = conductor.get_engine().lever();
        win->print(row++, start_col, "Notch: " + std::to_string(lever.throttle_notch()));
        win->print(row++, start_col, "Dyn brake: " + std::to_string(lever.dyn_brake()));
        if (table.throttle_mode() == ThrottleMode::Toggle) {
            win->print(row++, start_col, std::string("Lever drives: ") +
                       (lever.dyn_selected() ? "dyn brake" : "throttle"), COLOR_PAIR(CP_BINDING));
        }
    }
}

void LiveMonitor::draw() {
    auto* main_win = tui->get_main_win();
    int height = main_win->get_height();
    int width = main_win->get_width();
    const auto& config = tui->get_config();

    main_win->clear();

    main_win->print(1, 2, "Simulator Link", COLOR_PAIR(CP_HEADER) | A_BOLD);

    bool running = tui->is_conductor_running();
    main_win->print(2, 2, "Status: ", 0);
    wattron(main_win->get(), COLOR_PAIR(running ? CP_ONLINE : CP_OFFLINE));
    wprintw(main_win->get(), "%s", running ? "SENDING" : "STOPPED");
    wattroff(main_win->get(), COLOR_PAIR(running ? CP_ONLINE : CP_OFFLINE));

    char line[160];
    snprintf(line, sizeof(line), "  to %s:%d  sent %llu  failed %llu", config.ip.c_str(), config.port,
             static_cast<unsigned long long>(tui->get_sent_total()),
             static_cast<unsigned long long>(tui->get_failed_total()));
    wprintw(main_win->get(), "%s", line);

    int divider = width * 2 / 3;
    int max_row = height - 4;

    draw_values_panel(main_win, 4, divider - 6, 5, max_row);

    for (int r = 4; r < height - 3; r++)
        mvwaddch(main_win->get(), r, divider - 1, ACS_VLINE | COLOR_PAIR(CP_BORDER) | A_DIM);

    // Engine state is only read while the loop thread is stopped
    if (!running) {
        draw_switches_panel(main_win, divider + 2, 5);
    } else {
        main_win->print(5, divider + 2, "Stop to inspect controls", A_DIM);
    }

    main_win->print(height - 2, 2, running ? "[SPACE] Stop  [x] Reset counters" : "[SPACE] Start  [x] Reset counters", A_DIM);

    main_win->refresh();
    needs_redraw = true;
}

void LiveMonitor::handle_input(int ch) {
    switch (ch) {
        case ' ':
            if (tui->is_conductor_running()) {
                tui->stop_conductor();
                tui->set_status("Stopped sending", CP_DEFAULT);
            } else if (tui->start_conductor()) {
                tui->set_status("Sending to " + tui->get_config().ip + ":" +
                                std::to_string(tui->get_config().port), CP_SUCCESS);
            }
            needs_redraw = true;
            break;

        case 'x':
        case 'X':
            tui->reset_sent();
            needs_redraw = true;
            break;
    }
}
