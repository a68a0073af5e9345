#include "device_dashboard.hpp"

DeviceDashboard::DeviceDashboard(TUI* parent) : View(parent, ViewType::DASHBOARD), scroll_offset(0) {}

void DeviceDashboard::draw() {
    // Online state changes under us while the conductor runs
    devices = tui->get_conductor().devices();

    auto* main_win = tui->get_main_win();
    int height = main_win->get_height();
    int width = main_win->get_width();

    main_win->clear();

    main_win->print(1, 2, "Joysticks", COLOR_PAIR(CP_HEADER) | A_BOLD);

    int usable = width - 4;
    int col_id = 2;
    int col_enabled = col_id + 5;
    int col_name = col_enabled + 11;
    int col_controls = col_name + std::max(24, usable * 45 / 100);
    int col_status = col_controls + 22;
    int name_width = col_controls - col_name - 2;

    char hdr[256];
    snprintf(hdr, sizeof(hdr), "%-*s%-*s%-*s%-*s%s",
             col_enabled - col_id, "Id",
             col_name - col_enabled, "Enabled",
             col_controls - col_name, "Name",
             col_status - col_controls, "Btn/Axis/Hat",
             "Status");
    main_win->print(3, 2, hdr);
    main_win->print(4, 2, std::string(width - 4, '-'));

    if (devices.empty()) {
        main_win->print(6, 4, "No joysticks found under " + std::string(INPUT_BY_ID_DIR), COLOR_PAIR(CP_WARNING));
        main_win->print(7, 4, "Plug one in and press [d] to rescan", A_DIM);
    }

    if (selected_item >= static_cast<int>(devices.size())) {
        selected_item = std::max(0, static_cast<int>(devices.size()) - 1);
    }

    int row = 5;
    for (size_t i = scroll_offset; i < devices.size() && row < height - 4; i++) {
        const auto& dev = devices[i];
        int attrs = (i == static_cast<size_t>(selected_item)) ? COLOR_PAIR(CP_SELECTED) : 0;

        if (attrs) wattron(main_win->get(), attrs);

        mvwprintw(main_win->get(), row, col_id, "%-*d", col_enabled - col_id, dev.id);
        mvwprintw(main_win->get(), row, col_enabled, "%-*s", col_name - col_enabled, dev.enabled ? "[x]" : "[ ]");
        mvwprintw(main_win->get(), row, col_name, "%-*s", col_controls - col_name,
                  truncate_to(dev.name, name_width).c_str());

        char counts[32];
        snprintf(counts, sizeof(counts), "%d/%d/%d", dev.buttons, dev.axes, dev.hats);
        mvwprintw(main_win->get(), row, col_controls, "%-*s", col_status - col_controls, counts);

        if (attrs) wattroff(main_win->get(), attrs);

        int color = dev.online ? CP_ONLINE : CP_OFFLINE;
        wattron(main_win->get(), COLOR_PAIR(color));
        mvwprintw(main_win->get(), row, col_status, "%s", get_connection_status(dev.online).c_str());
        wattroff(main_win->get(), COLOR_PAIR(color));

        row++;
    }

    main_win->print(height - 3, 2, "Actions:", COLOR_PAIR(CP_HEADER) | A_BOLD);
    main_win->print(height - 2, 4, "[Space] Enable/Disable  [d] Rescan  [Enter] Details");

    main_win->refresh();
    needs_redraw = false;
}

void DeviceDashboard::handle_input(int ch) {
    switch (ch) {
        case KEY_UP:
        case 'k':
            if (selected_item > 0) {
                selected_item--;
                if (selected_item < scroll_offset) scroll_offset = selected_item;
                needs_redraw = true;
            }
            break;

        case KEY_DOWN:
        case 'j':
            if (selected_item < static_cast<int>(devices.size()) - 1) {
                selected_item++;
                int visible = tui->get_screen_height() - 14;
                if (selected_item >= scroll_offset + visible) {
                    scroll_offset = selected_item - visible + 1;
                }
                needs_redraw = true;
            }
            break;

        case 'd':
        case 'D':
            tui->rescan_devices();
            tui->set_status("Rescanned " + std::string(INPUT_BY_ID_DIR), CP_SUCCESS);
            selected_item = 0;
            scroll_offset = 0;
            needs_redraw = true;
            break;

        case ' ':
        case 'e':
        case 'E':
            if (selected_item >= 0 && selected_item < static_cast<int>(devices.size())) {
                toggle_enabled(devices[selected_item]);
            }
            break;

        case '\n':
        case '\r':
        case KEY_ENTER:
            if (selected_item >= 0 && selected_item < static_cast<int>(devices.size())) {
                show_device_details(devices[selected_item]);
            }
            break;
    }
}

void DeviceDashboard::toggle_enabled(const DeviceDescriptor& dev) {
    bool was_running = tui->pause_conductor();
    auto& input = tui->get_input();
    bool ok = dev.enabled ? input.disable_device(dev.id) : input.enable_device(dev.id);
    // Values from a device that just joined or left must be re-sent
    tui->get_conductor().get_engine().reset();
    tui->resume_conductor(was_running);

    if (ok) {
        tui->get_config().devices = input.enabled_by_id();
        tui->mark_modified();
        tui->set_status(std::string(dev.enabled ? "Disabled " : "Enabled ") + dev.name, CP_SUCCESS);
    } else {
        tui->set_status("Could not change " + dev.name, CP_ERROR);
    }
    needs_redraw = true;
}

void DeviceDashboard::show_device_details(const DeviceDescriptor& dev) {
    int h = 13, w = 64;
    int starty = (tui->get_screen_height() - h) / 2;
    int startx = (tui->get_screen_width() - w) / 2;

    Window detail_win(h, w, starty, startx, " Device Details ");

    detail_win.print(2, 2, "Id: " + std::to_string(dev.id));
    detail_win.print(3, 2, "Name: " + truncate_to(dev.name, w - 10));
    detail_win.print(4, 2, "By ID: " + truncate_to(dev.by_id, w - 11));
    detail_win.print(5, 2, std::string("Enabled: ") + (dev.enabled ? "yes" : "no"));

    int color = dev.online ? CP_ONLINE : CP_OFFLINE;
    detail_win.print(6, 2, "Status: ", 0);
    wattron(detail_win.get(), COLOR_PAIR(color));
    wprintw(detail_win.get(), "%s", dev.online ? "ONLINE" : "OFFLINE");
    wattroff(detail_win.get(), COLOR_PAIR(color));

    detail_win.print(7, 2, "Buttons: " + std::to_string(dev.buttons));
    detail_win.print(8, 2, "Axes: " + std::to_string(dev.axes));
    detail_win.print(9, 2, "Hats: " + std::to_string(dev.hats));

    detail_win.print(11, 2, "Press any key to close...", COLOR_PAIR(CP_WARNING));

    detail_win.refresh();
    flushinp();
    while (getch() == ERR) {}
    needs_redraw = true;
}
