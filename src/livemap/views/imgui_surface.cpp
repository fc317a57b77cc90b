#include "livemap/views/imgui_surface.hpp"

#include <thread>

namespace livemap::views {

void ImGuiSurface::begin(ImDrawList *draw_list, ImVec2 origin, ImVec2 size) {
    draw_list_ = draw_list;
    origin_ = origin;
    size_ = size;
}

void ImGuiSurface::clear(const protocol::Color &color) {
    if (draw_list_ == nullptr) {
        return;
    }
    draw_list_->AddRectFilled(origin_, ImVec2(origin_.x + size_.x, origin_.y + size_.y),
                              to_imgui(color));
}

void ImGuiSurface::draw_circle(Point center, float radius, const protocol::Color &color) {
    if (draw_list_ == nullptr) {
        return;
    }
    draw_list_->AddCircleFilled(ImVec2(origin_.x + center.x, origin_.y + center.y), radius,
                                to_imgui(color));
}

void ImGuiSurface::next_frame() {
    if (frame_delay_.count() > 0) {
        std::this_thread::sleep_for(frame_delay_);
    }
}

ImU32 ImGuiSurface::to_imgui(const protocol::Color &color) {
    return ImGui::ColorConvertFloat4ToU32(ImVec4(color.r, color.g, color.b, color.a));
}

} // namespace livemap::views
