#pragma once

#include "livemap/views/replay.hpp"

#include <imgui.h>

#include <chrono>

namespace livemap::views {

/// DrawSurface backed by an ImGui draw list. The region is re-bound every
/// frame with begin(); yielding happens when the GUI callback returns, so
/// next_frame() only applies the fixed per-frame delay.
class ImGuiSurface : public DrawSurface {
  public:
    explicit ImGuiSurface(std::chrono::milliseconds frame_delay = kFrameDelay)
        : frame_delay_(frame_delay) {}

    void begin(ImDrawList *draw_list, ImVec2 origin, ImVec2 size);

    [[nodiscard]] float width() const override { return size_.x; }
    [[nodiscard]] float height() const override { return size_.y; }

    void clear(const protocol::Color &color) override;
    void draw_circle(Point center, float radius, const protocol::Color &color) override;
    void next_frame() override;

  private:
    static ImU32 to_imgui(const protocol::Color &color);

    std::chrono::milliseconds frame_delay_;
    ImDrawList *draw_list_ = nullptr;
    ImVec2 origin_{0.0f, 0.0f};
    ImVec2 size_{0.0f, 0.0f};
};

} // namespace livemap::views
