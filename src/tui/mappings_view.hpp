#pragma once

#include "tui.hpp"
#include <future>
#include <optional>

class MappingsView : public View {
private:
    int scroll_offset;
    int selected_row;

    // Section header, catalog function or reverser switch position
    struct DisplayRow {
        bool is_header;
        std::string text;
        CaptureTarget target;
    };

    // Handed from the capture thread to the UI thread when a locator is already bound
    struct CollisionRequest {
        std::vector<std::string> others;
        InputLocator locator;
        std::promise<CollisionChoice> reply;
    };

    std::vector<DisplayRow> build_display_list() const;
    const DisplayRow* selected(const std::vector<DisplayRow>& display) const;
    std::string source_text(const CaptureTarget& target) const;
    std::string settings_text(const CaptureTarget& target) const;

public:
    MappingsView(TUI* parent);

    void draw() override;
    void handle_input(int ch) override;

private:
    void show_capture_dialog(const CaptureTarget& target);
    CollisionChoice show_collision_dialog(const std::vector<std::string>& others, const InputLocator& locator);
    void show_result_dialog(const CaptureTarget& target, const CaptureResult& result);
    void clear_selected(const CaptureTarget& target);
    void toggle_reverse(const CaptureTarget& target);
    void cycle_reverser_mode();
    void cycle_throttle_mode();
};
