#include "mappings_view.hpp"

std::vector<MappingsView::DisplayRow> MappingsView::build_display_list() const {
    std::vector<DisplayRow> rows;
    auto& conductor = tui->get_conductor();
    const auto& catalog = conductor.get_catalog();
    const auto& table = conductor.get_table();

    for (const auto& category : catalog.categories()) {
        rows.push_back({true, "-- " + category + " --", CaptureTarget()});
        for (const auto& spec : catalog.in_category(category)) {
            rows.push_back({false, spec.name, CaptureTarget::for_function(spec.name)});
        }
    }

    if (table.reverser_mode() != ReverserMode::Axis) {
        rows.push_back({true, "-- Reverser Switch --", CaptureTarget()});
        std::vector<ReverserPosition> positions = {ReverserPosition::Forward, ReverserPosition::Neutral,
                                                   ReverserPosition::Reverse};
        for (auto pos : positions) {
            if (pos == ReverserPosition::Neutral && table.reverser_mode() == ReverserMode::TwoWay) continue;
            auto target = CaptureTarget::for_position(pos);
            rows.push_back({false, target.label(), target});
        }
    }

    return rows;
}

const MappingsView::DisplayRow* MappingsView::selected(const std::vector<DisplayRow>& display) const {
    if (selected_row < 0 || selected_row >= static_cast<int>(display.size())) return nullptr;
    if (display[selected_row].is_header) return nullptr;
    return &display[selected_row];
}

std::string MappingsView::source_text(const CaptureTarget& target) const {
    const auto& table = tui->get_conductor().get_table();
    if (target.position) {
        auto loc = table.reverser_position(*target.position);
        return loc ? describe_locator(*loc) : "";
    }
    auto mapping = table.get(target.function);
    return mapping ? describe_locator(mapping->locator) : "";
}

std::string MappingsView::settings_text(const CaptureTarget& target) const {
    auto& conductor = tui->get_conductor();
    if (target.position) {
        return "Switch";
    }
    const auto& spec = conductor.get_catalog().by_name(target.function);
    std::string info = std::string(behavior_name(spec.behavior)) + " #" + std::to_string(spec.id);
    auto mapping = conductor.get_table().get(target.function);
    if (mapping && mapping->reverse_axis) {
        info += ", Reversed";
    }
    return info;
}

MappingsView::MappingsView(TUI* parent) : View(parent, ViewType::MAPPINGS),
                             scroll_offset(0), selected_row(1) {}

void MappingsView::draw() {
    if (!needs_redraw) return;

    auto* main_win = tui->get_main_win();
    int height = main_win->get_height();
    int width = main_win->get_width();
    auto display = build_display_list();
    const auto& table = tui->get_conductor().get_table();

    if (selected_row >= static_cast<int>(display.size())) {
        selected_row = static_cast<int>(display.size()) - 1;
    }

    main_win->clear();

    main_win->print(1, 2, "Function Mappings", COLOR_PAIR(CP_HEADER) | A_BOLD);
    char modes[128];
    snprintf(modes, sizeof(modes), "Reverser: %s   Throttle: %s",
             reverser_mode_name(table.reverser_mode()), throttle_mode_name(table.throttle_mode()));
    main_win->print(2, 2, modes, COLOR_PAIR(CP_DEFAULT) | A_DIM);

    int usable = width - 4;
    int col_function = 2;
    int col_source = col_function + std::max(26, usable * 35 / 100);
    int col_settings = col_source + std::max(22, usable * 30 / 100);
    int function_width = col_source - col_function - 4;
    int source_width = col_settings - col_source - 2;

    char hdr[256];
    snprintf(hdr, sizeof(hdr), "%-*s%-*s%s",
             col_source - col_function, "Function",
             col_settings - col_source, "Source",
             "Settings");
    main_win->print(4, 2, hdr, A_BOLD);
    main_win->print(5, 2, std::string(width - 4, '-'));

    int row = 6;
    for (size_t i = scroll_offset; i < display.size() && row < height - 4; i++) {
        const auto& drow = display[i];

        if (drow.is_header) {
            main_win->print(row, 2, drow.text, COLOR_PAIR(CP_HEADER) | A_BOLD);
        } else {
            int attrs = (static_cast<int>(i) == selected_row) ? COLOR_PAIR(CP_SELECTED) : 0;
            if (attrs) wattron(main_win->get(), attrs);

            mvwprintw(main_win->get(), row, col_function + 2, "%-*s", col_source - col_function - 2,
                      truncate_to(drow.text, function_width).c_str());

            std::string source = source_text(drow.target);
            if (source.empty()) {
                if (!attrs) wattron(main_win->get(), A_DIM);
                mvwprintw(main_win->get(), row, col_source, "%-*s", col_settings - col_source, "(unmapped)");
                if (!attrs) wattroff(main_win->get(), A_DIM);
            } else {
                mvwprintw(main_win->get(), row, col_source, "%-*s", col_settings - col_source,
                          truncate_to(source, source_width).c_str());
            }

            mvwprintw(main_win->get(), row, col_settings, "%s",
                      truncate_to(settings_text(drow.target), width - col_settings - 2).c_str());

            if (attrs) wattroff(main_win->get(), attrs);
        }

        row++;
    }

    main_win->print(height - 3, 2, "Actions:", COLOR_PAIR(CP_HEADER) | A_BOLD);
    main_win->print(height - 2, 4, "[Enter] Capture  [c] Clear  [r] Reverse axis  [m] Reverser mode  [t] Throttle mode");

    main_win->refresh();
    needs_redraw = false;
}

void MappingsView::handle_input(int ch) {
    auto display = build_display_list();
    int total = static_cast<int>(display.size());

    auto find_selectable = [&](int from, int dir) -> int {
        int pos = from + dir;
        while (pos >= 0 && pos < total) {
            if (!display[pos].is_header) return pos;
            pos += dir;
        }
        return from;
    };

    const DisplayRow* current = selected(display);

    switch (ch) {
        case KEY_UP:
        case 'k':
            if (selected_row > 0) {
                selected_row = find_selectable(selected_row, -1);
                if (selected_row < scroll_offset) scroll_offset = std::max(0, selected_row - 1);
                needs_redraw = true;
            }
            break;

        case KEY_DOWN:
        case 'j':
            if (selected_row < total - 1) {
                selected_row = find_selectable(selected_row, 1);
                int visible = tui->get_screen_height() - 16;
                if (selected_row >= scroll_offset + visible) {
                    scroll_offset = selected_row - visible + 1;
                }
                needs_redraw = true;
            }
            break;

        case KEY_PPAGE:
            selected_row = 1;
            scroll_offset = 0;
            needs_redraw = true;
            break;

        case '\n':
        case '\r':
        case KEY_ENTER:
            if (current) show_capture_dialog(current->target);
            break;

        case 'c':
        case 'C':
        case KEY_DC:
            if (current) clear_selected(current->target);
            break;

        case 'r':
        case 'R':
            if (current) toggle_reverse(current->target);
            break;

        case 'm':
        case 'M':
            cycle_reverser_mode();
            break;

        case 't':
        case 'T':
            cycle_throttle_mode();
            break;
    }
}

void MappingsView::show_capture_dialog(const CaptureTarget& target) {
    auto& conductor = tui->get_conductor();

    int h = 10, w = 56;
    int starty = (tui->get_screen_height() - h) / 2;
    int startx = (tui->get_screen_width() - w) / 2;

    // Capture needs the conductor stopped and the input source to itself
    bool was_running = tui->pause_conductor();

    std::atomic<bool> cancel(false);
    std::mutex request_mutex;
    CollisionRequest* pending = nullptr;

    MappingCapture::CollisionResolver resolver =
        [&](const std::vector<std::string>& others, const InputLocator& locator) {
            CollisionRequest request;
            request.others = others;
            request.locator = locator;
            auto reply = request.reply.get_future();
            {
                std::lock_guard<std::mutex> lock(request_mutex);
                pending = &request;
            }
            return reply.get();
        };

    std::promise<CaptureResult> done;
    auto result_future = done.get_future();
    std::thread worker([&]() {
        try {
            done.set_value(conductor.capture(target, resolver, cancel));
        } catch (...) {
            done.set_exception(std::current_exception());
        }
    });

    auto started = std::chrono::steady_clock::now();
    flushinp();

    while (result_future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        CollisionRequest* request = nullptr;
        {
            std::lock_guard<std::mutex> lock(request_mutex);
            std::swap(request, pending);
        }
        if (request) {
            request->reply.set_value(show_collision_dialog(request->others, request->locator));
            continue;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started);
        long remaining = std::max(0L, static_cast<long>(
            std::chrono::duration_cast<std::chrono::seconds>(CAPTURE_TIMEOUT).count() - elapsed.count()));

        Window dialog(h, w, starty, startx, " Capture " + truncate_to(target.label(), w - 14) + " ");
        dialog.print(2, 2, "Move or press the control to use...", COLOR_PAIR(CP_HEADER) | A_BOLD);
        dialog.print(4, 2, "It will be mapped to:", A_DIM);
        dialog.print(5, 4, target.label(), COLOR_PAIR(CP_SUCCESS) | A_BOLD);
        dialog.print(h - 2, 2, "[ESC] Cancel", A_DIM);
        dialog.print(h - 2, w - 16, "Timeout in " + std::to_string(remaining) + "s", A_DIM);
        dialog.refresh();

        int ch = getch();
        if (ch == 27) {
            cancel = true;
        }
    }

    worker.join();
    CaptureResult result = result_future.get();

    if (result.status == CaptureStatus::Detected) {
        tui->mark_mappings_modified();
    }
    show_result_dialog(target, result);

    tui->resume_conductor(was_running);
    needs_redraw = true;
}

CollisionChoice MappingsView::show_collision_dialog(const std::vector<std::string>& others,
                                                    const InputLocator& locator) {
    int h = 10 + static_cast<int>(others.size()), w = 56;
    int starty = (tui->get_screen_height() - h) / 2;
    int startx = (tui->get_screen_width() - w) / 2;

    Window dialog(h, w, starty, startx, " Already Mapped ");
    dialog.print(2, 2, describe_locator(locator), COLOR_PAIR(CP_WARNING) | A_BOLD);
    dialog.print(3, 2, "is already mapped to:", COLOR_PAIR(CP_WARNING));
    int row = 4;
    for (const auto& other : others) {
        dialog.print(row++, 4, truncate_to(other, w - 8));
    }
    dialog.print(h - 3, 2, "[o] Clear other  [k] Keep both", A_DIM);
    dialog.print(h - 2, 2, "[c/ESC] Cancel", A_DIM);
    dialog.refresh();

    flushinp();
    int ch;
    while ((ch = getch()) != 'o' && ch != 'O' && ch != 'k' && ch != 'K' &&
           ch != 'c' && ch != 'C' && ch != 27) {}

    if (ch == 'o' || ch == 'O') return CollisionChoice::ClearOther;
    if (ch == 'k' || ch == 'K') return CollisionChoice::KeepBoth;
    return CollisionChoice::Cancel;
}

void MappingsView::show_result_dialog(const CaptureTarget& target, const CaptureResult& result) {
    int h = 9, w = 56;
    int starty = (tui->get_screen_height() - h) / 2;
    int startx = (tui->get_screen_width() - w) / 2;

    bool ok = result.status == CaptureStatus::Detected;
    Window dialog(h, w, starty, startx, ok ? " Input Captured " : " Not Mapped ");

    if (ok && result.locator) {
        dialog.print(2, 2, "Captured: " + describe_locator(*result.locator), COLOR_PAIR(CP_SUCCESS) | A_BOLD);
        dialog.print(3, 2, "Mapped to: " + truncate_to(target.label(), w - 15));
        tui->set_status(target.label() + " mapped to " + describe_locator(*result.locator), CP_SUCCESS);
    } else {
        std::string message = result.message.empty() ? capture_status_name(result.status) : result.message;
        dialog.print(2, 2, truncate_to(message, w - 4), COLOR_PAIR(CP_WARNING));
        tui->set_status(target.label() + ": " + message, CP_WARNING);
    }
    dialog.print(h - 2, 2, "Press any key to close...", A_DIM);
    dialog.refresh();

    flushinp();
    while (getch() == ERR) {}
}

void MappingsView::clear_selected(const CaptureTarget& target) {
    auto& table = tui->get_conductor().get_table();

    bool was_running = tui->pause_conductor();
    bool cleared = target.position ? table.clear_reverser_position(*target.position)
                                   : table.clear(target.function);
    tui->resume_conductor(was_running);

    if (cleared) {
        tui->mark_mappings_modified();
        tui->set_status("Cleared " + target.label(), CP_SUCCESS);
    }
    needs_redraw = true;
}

void MappingsView::toggle_reverse(const CaptureTarget& target) {
    auto& conductor = tui->get_conductor();
    if (target.position || conductor.get_catalog().by_name(target.function).behavior != Behavior::Lever) {
        tui->set_status("Only lever axes can be reversed", CP_WARNING);
        return;
    }

    auto mapping = conductor.get_table().get(target.function);
    if (!mapping) {
        tui->set_status(target.function + " is not mapped", CP_WARNING);
        return;
    }
    if (mapping->locator.kind != InputKind::Axis) {
        tui->set_status(target.function + " is not mapped to an axis", CP_WARNING);
        return;
    }

    bool was_running = tui->pause_conductor();
    conductor.get_table().set_reverse(target.function, !mapping->reverse_axis);
    tui->resume_conductor(was_running);

    tui->mark_mappings_modified();
    tui->set_status(target.function + (mapping->reverse_axis ? " normal" : " reversed"), CP_SUCCESS);
    needs_redraw = true;
}

void MappingsView::cycle_reverser_mode() {
    auto& conductor = tui->get_conductor();
    ReverserMode next = ReverserMode::Axis;
    switch (conductor.get_table().reverser_mode()) {
        case ReverserMode::Axis:     next = ReverserMode::TwoWay; break;
        case ReverserMode::TwoWay:   next = ReverserMode::ThreeWay; break;
        case ReverserMode::ThreeWay: next = ReverserMode::Axis; break;
    }

    bool was_running = tui->pause_conductor();
    bool ok = conductor.set_reverser_mode(next);
    tui->resume_conductor(was_running);

    if (ok) {
        tui->mark_mappings_modified();
        tui->set_status(std::string("Reverser mode: ") + reverser_mode_name(next), CP_SUCCESS);
    }
    needs_redraw = true;
}

void MappingsView::cycle_throttle_mode() {
    auto& conductor = tui->get_conductor();
    ThrottleMode next = ThrottleMode::Separate;
    switch (conductor.get_table().throttle_mode()) {
        case ThrottleMode::Separate: next = ThrottleMode::Toggle; break;
        case ThrottleMode::Toggle:   next = ThrottleMode::Split; break;
        case ThrottleMode::Split:    next = ThrottleMode::Separate; break;
    }

    bool was_running = tui->pause_conductor();
    bool ok = conductor.set_throttle_mode(next);
    tui->resume_conductor(was_running);

    if (ok) {
        tui->mark_mappings_modified();
        tui->set_status(std::string("Throttle mode: ") + throttle_mode_name(next), CP_SUCCESS);
    }
    needs_redraw = true;
}
