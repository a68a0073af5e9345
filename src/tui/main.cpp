#include "tui.hpp"
#include "../version.hpp"

// Main entry point
int main(int argc, char* argv[]) {
    ViewType start_view = ViewType::DASHBOARD;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--mappings") == 0 || strcmp(argv[i], "-m") == 0) {
            start_view = ViewType::MAPPINGS;
        } else if (strcmp(argv[i], "--monitor") == 0) {
            start_view = ViewType::MONITOR;
        } else if (strcmp(argv[i], "--version") == 0) {
            printf("run8_conductor_tui %s\n", CONDUCTOR_VERSION);
            return 0;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            printf("Run8 Conductor TUI\n\n");
            printf("Usage: %s [options]\n\n", argv[0]);
            printf("Options:\n");
            printf("  -m, --mappings     Start in the mappings view\n");
            printf("      --monitor      Start in the monitor view\n");
            printf("      --version      Print the version\n");
            printf("  -h, --help         Show this help message\n");
            printf("\nViews (switch with F1-F3 or Tab):\n");
            printf("  F1 - Devices\n");
            printf("  F2 - Mappings\n");
            printf("  F3 - Monitor\n");
            printf("\nConfig: %s\n", ConfigManager::get_config_path().c_str());
            return 0;
        } else {
            fprintf(stderr, "Unknown option: %s (try --help)\n", argv[i]);
            return 1;
        }
    }

#ifdef CONDUCTOR_DEBUG
    const char* debug_env = getenv("CONDUCTOR_DEBUG");
    debug_log_enabled = debug_env && strcmp(debug_env, "1") == 0;
#endif

    try {
        TUI tui;
        tui.set_view(start_view);
        tui.run();
    } catch (const std::exception& e) {
        endwin();
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
