#pragma once

#include "livemap/analysis/log_scan.hpp"
#include "livemap/config.hpp"
#include "livemap/data/diagnostic_log.hpp"
#include "livemap/views/imgui_surface.hpp"
#include "livemap/views/replay.hpp"

#include <memory>
#include <string>
#include <vector>

namespace livemap {

/// Bar chart data for one categorical counter.
struct BarSeries {
    std::string title;
    std::vector<std::string> labels;
    std::vector<const char *> label_ptrs;
    std::vector<double> positions;
    std::vector<double> counts;
};

/// Offline viewer: scans the raw log, prints the statistics report, then
/// replays the vehicle history frame by frame in a Hello ImGui window.
class App {
  public:
    explicit App(Config config);
    ~App();

    /// Run the scan and the replay window.
    /// Returns exit code (0 = success). Throws std::runtime_error if the
    /// log cannot be opened.
    int run(int argc, char *argv[]);

  private:
    void scan_log();

    /// UI rendering functions (called each frame).
    void render_map();
    void render_statistics();
    void render_status();

    Config config_;
    data::DiagnosticLog diagnostics_;
    std::unique_ptr<analysis::LogScanner> scanner_;
    std::unique_ptr<views::ReplayCursor> cursor_;
    views::ImGuiSurface surface_;
    std::vector<BarSeries> charts_;
};

} // namespace livemap
