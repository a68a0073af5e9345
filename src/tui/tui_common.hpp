#pragma once

/**
 * Run8 Conductor - ncurses interface
 *
 * Views:
 * - Devices: enable or disable joysticks
 * - Mappings: capture, clear and reverse function mappings; reverser and throttle modes
 * - Monitor: run the conductor and watch the values sent to the simulator
 */

#include "config.hpp"
#include "bindings.hpp"
#include "conductor.hpp"
#include "evdev_input_source.hpp"
#include <ncurses.h>
#include <unistd.h>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <chrono>
#include <thread>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <termios.h>

// Color pairs
enum ColorPairs {
    CP_DEFAULT = 1,
    CP_HEADER,
    CP_HIGHLIGHT,
    CP_ONLINE,
    CP_OFFLINE,
    CP_WARNING,
    CP_ERROR,
    CP_SUCCESS,
    CP_BINDING,
    CP_AXIS,
    CP_BUTTON,
    CP_SELECTED,
    CP_BORDER
};

// View types
enum class ViewType {
    DASHBOARD,
    MAPPINGS,
    MONITOR
};

// Forward declarations
class TUI;
class View;
class DeviceDashboard;
class MappingsView;
class LiveMonitor;

inline std::string get_connection_status(bool online) {
    return online ? "● ONLINE" : "○ OFFLINE";
}

inline std::string truncate_to(const std::string& text, int width) {
    if (width <= 3 || static_cast<int>(text.length()) <= width) return text;
    return text.substr(0, width - 3) + "...";
}

// Window management helper
class Window {
private:
    WINDOW* win;
    int x, y, width, height;
    std::string title;
    bool has_border;

public:
    Window(int h, int w, int starty, int startx, const std::string& t = "", bool border = true)
        : win(newwin(h, w, starty, startx)), x(startx), y(starty),
          width(w), height(h), title(t), has_border(border) {
        if (has_border) {
            box(win, 0, 0);
            if (!title.empty()) {
                wattron(win, COLOR_PAIR(CP_BORDER) | A_BOLD);
                mvwprintw(win, 0, 2, " %s ", title.c_str());
                wattroff(win, COLOR_PAIR(CP_BORDER) | A_BOLD);
            }
        }
    }

    ~Window() {
        if (win) delwin(win);
    }

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    WINDOW* get() { return win; }

    void refresh() { wrefresh(win); }
    void clear() { werase(win); if (has_border) box(win, 0, 0); }

    void print(int row, int col, const std::string& text, int attrs = 0) {
        if (attrs) wattron(win, attrs);
        mvwprintw(win, row, col, "%s", text.c_str());
        if (attrs) wattroff(win, attrs);
    }

    void draw_bar(int row, int col, int bar_width, float percent) {
        int filled = std::clamp(static_cast<int>(bar_width * percent), 0, bar_width);
        std::string bar(filled, '#');
        bar += std::string(bar_width - filled, '-');

        wattron(win, COLOR_PAIR(CP_AXIS));
        mvwprintw(win, row, col, "%s", bar.c_str());
        wattroff(win, COLOR_PAIR(CP_AXIS));
    }

    int get_height() const { return height; }
    int get_width() const { return width; }
};

// Last value the send tick delivered for one function
struct SentValue {
    uint8_t value = 0;
    bool ok = true;
    uint64_t count = 0;
    std::chrono::steady_clock::time_point at;
};

// Base View class
class View {
protected:
    TUI* tui;
    ViewType type;
    int selected_item;
    bool needs_redraw;

public:
    View(TUI* parent, ViewType t) : tui(parent), type(t), selected_item(0), needs_redraw(true) {}
    virtual ~View() = default;

    virtual void draw() = 0;
    virtual void handle_input(int ch) = 0;
    virtual void refresh() { needs_redraw = true; }
};
