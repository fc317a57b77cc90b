#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace livemap::protocol {

// --- GeoJSON ---

/// A bare geometry object (Point, LineString, ...), kept as raw JSON.
struct Geometry {
    nlohmann::json value;

    bool operator==(const Geometry &) const = default;
};

/// A single feature. Only a feature with a properties object can be
/// projected further into trains and records.
struct Feature {
    nlohmann::json geometry;
    std::optional<nlohmann::json> properties;
    std::optional<nlohmann::json> id;

    bool operator==(const Feature &) const = default;
};

struct FeatureCollection {
    std::vector<Feature> features;

    bool operator==(const FeatureCollection &) const = default;
};

using GeoJson = std::variant<Geometry, Feature, FeatureCollection>;

// --- Content variants, one per discriminator ---

struct TrajectorySchematic {
    GeoJson geo;
    bool operator==(const TrajectorySchematic &) const = default;
};

struct Trajectory {
    GeoJson geo;
    bool operator==(const Trajectory &) const = default;
};

struct StationSchematic {
    GeoJson geo;
    bool operator==(const StationSchematic &) const = default;
};

struct Station {
    GeoJson geo;
    bool operator==(const Station &) const = default;
};

struct DeletedVehiclesSchematic {
    std::optional<std::string> vehicle;
    bool operator==(const DeletedVehiclesSchematic &) const = default;
};

struct DeletedVehicles {
    std::optional<std::string> vehicle;
    bool operator==(const DeletedVehicles &) const = default;
};

struct WebsocketStatus {
    std::string status;
    bool operator==(const WebsocketStatus &) const = default;
};

struct WebsocketPong {
    std::string text;
    bool operator==(const WebsocketPong &) const = default;
};

struct Websocket {
    std::variant<WebsocketStatus, WebsocketPong> message;
    bool operator==(const Websocket &) const = default;
};

struct ExtraGeom {
    std::string type;
    std::string ref;
    bool operator==(const ExtraGeom &) const = default;
};

struct ExtraGeoms {
    std::optional<ExtraGeom> geom;
    bool operator==(const ExtraGeoms &) const = default;
};

struct Healthcheck {
    std::string service;
    bool healthy = false;
    std::optional<std::string> tenant;
    bool operator==(const Healthcheck &) const = default;
};

struct NewsTickerMessage {
    std::string title;
    std::vector<std::string> lines;
    std::string content;
    std::string updated;
    bool operator==(const NewsTickerMessage &) const = default;
};

struct SbmNewsTicker {
    std::optional<bool> incident_program;
    std::vector<NewsTickerMessage> messages;
    bool operator==(const SbmNewsTicker &) const = default;
};

/// Any discriminator not listed above. Kept so upstream schema growth
/// never turns into a decode failure.
struct Unrecognized {
    std::string source;
    nlohmann::json content;
    bool operator==(const Unrecognized &) const = default;
};

using Content =
    std::variant<TrajectorySchematic, Trajectory, StationSchematic, Station,
                 DeletedVehiclesSchematic, DeletedVehicles, Websocket, ExtraGeoms, Healthcheck,
                 SbmNewsTicker, Unrecognized>;

/// One decoded log line.
/// Example: {"source": "deleted_vehicles_schematic", "content": "sbm_140404727073712",
///           "timestamp": 1697454536271.5, "client_reference": null}
struct Envelope {
    Content content;
    double timestamp = 0.0;
    std::optional<int8_t> client_reference;

    bool operator==(const Envelope &) const = default;
};

/// Discriminator string for the active content variant.
std::string source_of(const Content &content);

/// Stage 1 decode. Throws DecodeError(Parse) on malformed JSON or a payload
/// that does not match the shape its discriminator requires.
Envelope parse_envelope(std::string_view line);

/// Same as parse_envelope() for an already parsed JSON value.
Envelope decode_envelope(const nlohmann::json &msg);

/// Inverse of parse_envelope.
nlohmann::json encode_envelope(const Envelope &envelope);

GeoJson parse_geojson(const nlohmann::json &value);
nlohmann::json encode_geojson(const GeoJson &geo);

} // namespace livemap::protocol
