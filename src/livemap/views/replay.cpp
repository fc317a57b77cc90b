#include "livemap/views/replay.hpp"

#include <algorithm>

namespace livemap::views {

Point project(const protocol::Coordinate &position, float width, float height,
              const MapBounds &bounds) {
    return Point{
        map_range(static_cast<float>(position.longitude), static_cast<float>(bounds.lon_min),
                  static_cast<float>(bounds.lon_max), 0.0f, width),
        map_range(static_cast<float>(position.latitude), static_cast<float>(bounds.lat_min),
                  static_cast<float>(bounds.lat_max), height, 0.0f),
    };
}

size_t render_frame(const data::VehicleHistory &history, size_t frame, DrawSurface &surface,
                    const MapBounds &bounds) {
    const float width = surface.width();
    const float height = surface.height();

    size_t drawn = 0;
    for (const auto &[number, vehicle] : history.vehicles()) {
        const protocol::Record *record = vehicle.at(frame);
        if (record == nullptr) {
            continue;
        }
        surface.draw_circle(project(record->position, width, height, bounds), kVehicleRadius,
                            record->line_color);
        ++drawn;
    }
    return drawn;
}

size_t ReplayCursor::resolve_bound(size_t configured, const data::VehicleHistory &history) {
    if (configured > 0) {
        return configured;
    }
    return std::max<size_t>(history.longest_timeline(), 1);
}

void replay_tick(const data::VehicleHistory &history, ReplayCursor &cursor,
                 DrawSurface &surface, const MapBounds &bounds) {
    surface.clear(protocol::color_from_rgb(kBackgroundRgb));
    render_frame(history, cursor.frame(), surface, bounds);
    surface.next_frame();
    cursor.advance();
}

} // namespace livemap::views
