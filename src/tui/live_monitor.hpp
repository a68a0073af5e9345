#pragma once

#include "tui.hpp"

class LiveMonitor : public View {
private:
    void draw_values_panel(Window* win, int start_col, int panel_width, int start_row, int max_row);
    void draw_switches_panel(Window* win, int start_col, int start_row);

public:
    LiveMonitor(TUI* parent);

    void draw() override;
    void handle_input(int ch) override;
};
