#include "livemap/app.hpp"

#include <GLFW/glfw3.h>
#include <hello_imgui/hello_imgui.h>
#include <imgui.h>
#include <immapp/immapp.h>
#include <implot/implot.h>

#include <cstdio>
#include <cstdlib>
#include <utility>

namespace livemap {

namespace {

template <typename T>
BarSeries make_series(const std::string &title, const data::Counter<T> &counter) {
    BarSeries series;
    series.title = title;
    double position = 0.0;
    for (const auto &[key, n] : counter.sorted()) {
        series.labels.push_back(analysis::bucket_label(key));
        series.positions.push_back(position);
        series.counts.push_back(static_cast<double>(n));
        position += 1.0;
    }
    // Pointers are taken after the label vector stops growing.
    for (const auto &label : series.labels) {
        series.label_ptrs.push_back(label.c_str());
    }
    return series;
}

} // namespace

App::App(Config config) : config_(std::move(config)), surface_(config_.frame_delay) {}
App::~App() = default;

void App::scan_log() {
    data::RawLogReader reader(config_.log_path);
    scanner_ = std::make_unique<analysis::LogScanner>(diagnostics_);
    scanner_->scan(reader);

    const auto &history = scanner_->history();
    analysis::print_summary(scanner_->summary(), history.size(), stdout);
    analysis::print_report(scanner_->statistics(), stdout);

    const size_t bound = views::ReplayCursor::resolve_bound(config_.wrap_bound, history);
    cursor_ = std::make_unique<views::ReplayCursor>(bound);
    std::printf("[LiveMap] Replaying %zu vehicles over %zu frames\n", history.size(), bound);

    const auto &stats = scanner_->statistics();
    charts_.clear();
    charts_.push_back(make_series("states", stats.states));
    charts_.push_back(make_series("ride_states", stats.ride_states));
    charts_.push_back(make_series("delays", stats.delays));
}

int App::run(int /*argc*/, char * /*argv*/[]) {
    scan_log();

    glfwSetErrorCallback([](int error, const char *description) {
        std::fprintf(stderr, "[GLFW Error %d] %s\n", error, description);
    });

    // Force X11 on WSL2/WSLg, its Wayland EGL is unreliable.
    if (std::getenv("WSL_DISTRO_NAME") != nullptr && std::getenv("GLFW_PLATFORM") == nullptr) {
        unsetenv("WAYLAND_DISPLAY");
    }

    HelloImGui::RunnerParams runner_params;
    runner_params.appWindowParams.windowTitle = "LiveMap Replay";
    runner_params.appWindowParams.windowGeometry.size = {1024, 1024};

    runner_params.imGuiWindowParams.defaultImGuiWindowType =
        HelloImGui::DefaultImGuiWindowType::ProvideFullScreenDockSpace;
    runner_params.imGuiWindowParams.showMenuBar = false;
    runner_params.imGuiWindowParams.showStatusBar = true;

    // Replay advances once per rendered frame
    runner_params.fpsIdling.enableIdling = false;

    //  ___________________________________________
    //  |                             |           |
    //  |        Map                  | Statistics|
    //  |     (MainDockSpace)         | (25%)     |
    //  -------------------------------------------
    HelloImGui::DockingSplit split_right;
    split_right.initialDock = "MainDockSpace";
    split_right.newDock = "StatisticsSpace";
    split_right.direction = ImGuiDir_Right;
    split_right.ratio = 0.25f;
    runner_params.dockingParams.dockingSplits = {split_right};

    HelloImGui::DockableWindow map_window;
    map_window.label = "Map";
    map_window.dockSpaceName = "MainDockSpace";
    map_window.GuiFunction = [this] { render_map(); };

    HelloImGui::DockableWindow statistics_window;
    statistics_window.label = "Statistics";
    statistics_window.dockSpaceName = "StatisticsSpace";
    statistics_window.GuiFunction = [this] { render_statistics(); };

    runner_params.dockingParams.dockableWindows = {map_window, statistics_window};
    runner_params.callbacks.ShowStatus = [this] { render_status(); };

    ImmApp::AddOnsParams addons;
    addons.withImplot = true;
    ImmApp::Run(runner_params, addons);

    return 0;
}

void App::render_map() {
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    ImVec2 size = ImGui::GetContentRegionAvail();
    if (size.x < 1.0f || size.y < 1.0f) {
        return;
    }

    surface_.begin(ImGui::GetWindowDrawList(), origin, size);
    views::replay_tick(scanner_->history(), *cursor_, surface_);

    // Reserve the drawn region so the window layout accounts for it
    ImGui::Dummy(size);
}

void App::render_statistics() {
    const auto &stats = scanner_->statistics();
    ImGui::Text("%zu trains decoded", stats.trains);
    ImGui::Separator();

    for (const auto &series : charts_) {
        if (series.counts.empty()) {
            continue;
        }
        ImGui::PushID(series.title.c_str());
        if (ImPlot::BeginPlot(series.title.c_str(), ImVec2(-1.0f, 220.0f))) {
            ImPlot::SetupAxes(nullptr, "count", ImPlotAxisFlags_NoGridLines,
                              ImPlotAxisFlags_AutoFit);
            ImPlot::SetupAxisTicks(ImAxis_X1, series.positions.data(),
                                   static_cast<int>(series.positions.size()),
                                   series.label_ptrs.data());
            ImPlot::PlotBars("##counts", series.counts.data(),
                             static_cast<int>(series.counts.size()));
            ImPlot::EndPlot();
        }
        ImGui::PopID();
    }
}

void App::render_status() {
    const auto &history = scanner_->history();
    ImGui::Text("frame %zu / %zu", cursor_->frame(), cursor_->bound());
    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();
    ImGui::Text("%zu vehicles", history.size());
    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();
    ImGui::Text("%s", config_.log_path.c_str());
}

} // namespace livemap
