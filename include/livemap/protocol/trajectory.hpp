#pragma once

#include "livemap/protocol/color.hpp"
#include "livemap/protocol/envelope.hpp"
#include "livemap/protocol/extract.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace livemap::protocol {

struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const Coordinate &) const = default;
};

/// Transit line metadata as carried in the "line" property.
struct Line {
    std::string color;
    int64_t id = 0;
    std::string name;
    std::string stroke;
    std::string text_color;

    bool operator==(const Line &) const = default;
};

/// Full property set of a trajectory_schematic feature (statistics projection).
struct Train {
    std::optional<std::string> delay;
    bool has_journey = false;
    bool has_realtime = false;
    bool has_realtime_journey = false;
    std::optional<Line> line;
    std::string operator_provides_realtime_journey;
    std::optional<std::string> original_line;
    std::optional<std::string> original_rake;
    std::optional<std::string> rake;
    std::optional<Coordinate> raw_coordinates;
    std::optional<std::string> ride_state;
    std::optional<std::string> state;
    std::string tenant;
    std::string train_id;
    std::optional<int64_t> train_number;
    std::optional<std::string> transmitting_vehicle;
    std::optional<std::string> vehicle_number;
};

enum class RideState { Driving, Boarding };

/// "DRIVING" maps to Driving, every other state to Boarding.
RideState ride_state_from_string(const std::string &state);

/// Minimal positional sample used by the replay (replay projection).
struct Record {
    double timestamp = 0.0;
    Coordinate position;
    std::string line;
    Color line_color;
    RideState state = RideState::Boarding;
    std::string vehicle_number;
    int64_t train_number = 0;
};

/// Decode a [longitude, latitude] pair.
/// Throws IncorrectType for a non-array or non-numeric entry,
/// MissingItems(2, n) for any other length.
Coordinate decode_coordinate(const nlohmann::json &value);

/// Throws IncorrectType for a non-object, MissingProperty / IncorrectValueType
/// for its fields.
Line decode_line(const nlohmann::json &value);

/// Statistics projection of a trajectory_schematic envelope.
Train decode_train(const Envelope &envelope);

/// Replay projection of a trajectory_schematic envelope. Color conversion
/// failures surface as DecodeError(IncorrectType, "Color", ...).
Record decode_record(const Envelope &envelope);

/// Properties of a single trajectory_schematic feature, or throws IncorrectType.
const nlohmann::json &trajectory_properties(const Envelope &envelope);

template <> struct FieldExtractor<Line> {
    static Line missing(const std::string &name) { throw DecodeError::missing_property(name); }
    static Line present(const std::string & /*name*/, const nlohmann::json &value) {
        return decode_line(value);
    }
};

template <> struct FieldExtractor<Coordinate> {
    static Coordinate missing(const std::string &name) {
        throw DecodeError::missing_property(name);
    }
    static Coordinate present(const std::string & /*name*/, const nlohmann::json &value) {
        return decode_coordinate(value);
    }
};

} // namespace livemap::protocol

namespace std {

template <> struct hash<livemap::protocol::Line> {
    size_t operator()(const livemap::protocol::Line &line) const noexcept {
        size_t seed = std::hash<std::string>{}(line.color);
        auto combine = [&seed](size_t h) { seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2); };
        combine(std::hash<int64_t>{}(line.id));
        combine(std::hash<std::string>{}(line.name));
        combine(std::hash<std::string>{}(line.stroke));
        combine(std::hash<std::string>{}(line.text_color));
        return seed;
    }
};

} // namespace std
