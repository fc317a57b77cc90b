#pragma once

#include "livemap/data/vehicle_history.hpp"
#include "livemap/protocol/color.hpp"
#include "livemap/protocol/trajectory.hpp"

#include <chrono>
#include <cstddef>

namespace livemap::views {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

/// Drawing capability the replay renders into, once per tick.
class DrawSurface {
  public:
    virtual ~DrawSurface() = default;

    [[nodiscard]] virtual float width() const = 0;
    [[nodiscard]] virtual float height() const = 0;

    virtual void clear(const protocol::Color &color) = 0;
    virtual void draw_circle(Point center, float radius, const protocol::Color &color) = 0;

    /// Yield until the next tick.
    virtual void next_frame() = 0;
};

inline constexpr float kVehicleRadius = 5.0f;
inline constexpr unsigned int kBackgroundRgb = 0x9E9E9E;
inline constexpr std::chrono::milliseconds kFrameDelay{20};

/// Geographic window drawn onto the surface.
struct MapBounds {
    double lon_min = 11.0;
    double lon_max = 12.0;
    double lat_min = 47.5;
    double lat_max = 48.5;
};

/// Linear map of value from [a_min, a_max] onto [b_min, b_max].
inline float map_range(float value, float a_min, float a_max, float b_min, float b_max) {
    return b_min + (value - a_min) / (a_max - a_min) * (b_max - b_min);
}

/// Longitude maps to [0, width], latitude to [height, 0] (y axis flipped).
Point project(const protocol::Coordinate &position, float width, float height,
              const MapBounds &bounds = {});

/// Draw every vehicle whose timeline has a record at frame. Shorter
/// timelines are skipped; nothing is interpolated.
/// Returns the number of vehicles drawn.
size_t render_frame(const data::VehicleHistory &history, size_t frame, DrawSurface &surface,
                    const MapBounds &bounds = {});

/// Logical replay tick. Advances once per rendered frame and wraps to zero
/// at the bound, independent of wall-clock time.
class ReplayCursor {
  public:
    /// bound == 0 means "derive": use the longest timeline in history.
    static size_t resolve_bound(size_t configured, const data::VehicleHistory &history);

    explicit ReplayCursor(size_t bound) : bound_(bound == 0 ? 1 : bound) {}

    [[nodiscard]] size_t frame() const { return frame_; }
    [[nodiscard]] size_t bound() const { return bound_; }

    void advance() {
        ++frame_;
        if (frame_ >= bound_) {
            frame_ = 0;
        }
    }

    void reset() { frame_ = 0; }

  private:
    size_t bound_;
    size_t frame_ = 0;
};

/// One replay tick: clear, draw the current frame, advance the cursor.
void replay_tick(const data::VehicleHistory &history, ReplayCursor &cursor,
                 DrawSurface &surface, const MapBounds &bounds = {});

} // namespace livemap::views
