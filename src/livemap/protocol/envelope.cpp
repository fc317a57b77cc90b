#include "livemap/protocol/envelope.hpp"
#include "livemap/protocol/errors.hpp"

#include <array>
#include <limits>

namespace livemap::protocol {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr std::array<const char *, 7> kGeometryTypes = {
    "Point",        "MultiPoint",   "LineString",        "MultiLineString",
    "Polygon",      "MultiPolygon", "GeometryCollection",
};

const nlohmann::json &require(const nlohmann::json &obj, const char *key, const char *context) {
    const auto it = obj.find(key);
    if (it == obj.end()) {
        throw DecodeError::parse(std::string(context) + " missing '" + key + "'");
    }
    return *it;
}

std::string require_string(const nlohmann::json &obj, const char *key, const char *context) {
    const auto &value = require(obj, key, context);
    if (!value.is_string()) {
        throw DecodeError::parse(std::string(context) + " field '" + key + "' is not a string");
    }
    return value.get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json &obj, const char *key,
                                           const char *context) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw DecodeError::parse(std::string(context) + " field '" + key + "' is not a string");
    }
    return it->get<std::string>();
}

void require_object(const nlohmann::json &value, const char *context) {
    if (!value.is_object()) {
        throw DecodeError::parse(std::string(context) + " must be an object, found " +
                                 value.type_name());
    }
}

Feature parse_feature(const nlohmann::json &value) {
    require_object(value, "feature");
    Feature feature;
    if (auto it = value.find("geometry"); it != value.end()) {
        feature.geometry = *it;
    }
    if (auto it = value.find("properties"); it != value.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw DecodeError::parse("feature 'properties' must be an object or null");
        }
        feature.properties = *it;
    }
    if (auto it = value.find("id"); it != value.end() && !it->is_null()) {
        if (!it->is_string() && !it->is_number()) {
            throw DecodeError::parse("feature 'id' must be a string or number");
        }
        feature.id = *it;
    }
    return feature;
}

nlohmann::json encode_feature(const Feature &feature) {
    nlohmann::json out;
    out["type"] = "Feature";
    out["geometry"] = feature.geometry;
    out["properties"] = feature.properties.value_or(nlohmann::json());
    if (feature.id.has_value()) {
        out["id"] = feature.id.value();
    }
    return out;
}

std::optional<std::string> parse_optional_string_content(const nlohmann::json &content,
                                                         const char *source) {
    if (content.is_null()) {
        return std::nullopt;
    }
    if (!content.is_string()) {
        throw DecodeError::parse(std::string(source) + " content must be a string or null");
    }
    return content.get<std::string>();
}

Websocket parse_websocket(const nlohmann::json &content) {
    if (content.is_string()) {
        return Websocket{WebsocketPong{content.get<std::string>()}};
    }
    if (content.is_object()) {
        return Websocket{WebsocketStatus{require_string(content, "status", "websocket")}};
    }
    throw DecodeError::parse("websocket content must be a status object or a string");
}

ExtraGeoms parse_extra_geoms(const nlohmann::json &content) {
    if (content.is_null()) {
        return ExtraGeoms{};
    }
    require_object(content, "extra_geoms");
    const auto &props = require(content, "properties", "extra_geoms");
    require_object(props, "extra_geoms properties");
    return ExtraGeoms{ExtraGeom{require_string(content, "type", "extra_geoms"),
                                require_string(props, "ref", "extra_geoms properties")}};
}

Healthcheck parse_healthcheck(const nlohmann::json &content) {
    require_object(content, "healthcheck");
    Healthcheck hc;
    hc.service = require_string(content, "service", "healthcheck");
    const auto &healthy = require(content, "healthy", "healthcheck");
    if (!healthy.is_boolean()) {
        throw DecodeError::parse("healthcheck field 'healthy' is not a boolean");
    }
    hc.healthy = healthy.get<bool>();
    hc.tenant = optional_string(content, "tenant", "healthcheck");
    return hc;
}

SbmNewsTicker parse_news_ticker(const nlohmann::json &content) {
    require_object(content, "sbm_newsticker");
    SbmNewsTicker ticker;
    if (auto it = content.find("incident_program"); it != content.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            throw DecodeError::parse("sbm_newsticker 'incident_program' is not a boolean");
        }
        ticker.incident_program = it->get<bool>();
    }

    const auto &messages = require(content, "messages", "sbm_newsticker");
    if (!messages.is_array()) {
        throw DecodeError::parse("sbm_newsticker 'messages' is not an array");
    }
    for (const auto &m : messages) {
        require_object(m, "news ticker message");
        NewsTickerMessage msg;
        msg.title = require_string(m, "title", "news ticker message");
        msg.content = require_string(m, "content", "news ticker message");
        msg.updated = require_string(m, "updated", "news ticker message");
        const auto &lines = require(m, "lines", "news ticker message");
        if (!lines.is_array()) {
            throw DecodeError::parse("news ticker message 'lines' is not an array");
        }
        for (const auto &line : lines) {
            if (!line.is_string()) {
                throw DecodeError::parse("news ticker message line is not a string");
            }
            msg.lines.push_back(line.get<std::string>());
        }
        ticker.messages.push_back(std::move(msg));
    }
    return ticker;
}

Content parse_content(const std::string &source, const nlohmann::json &content) {
    if (source == "trajectory_schematic") {
        return TrajectorySchematic{parse_geojson(content)};
    }
    if (source == "trajectory") {
        return Trajectory{parse_geojson(content)};
    }
    if (source == "station_schematic") {
        return StationSchematic{parse_geojson(content)};
    }
    if (source == "station") {
        return Station{parse_geojson(content)};
    }
    if (source == "deleted_vehicles_schematic") {
        return DeletedVehiclesSchematic{
            parse_optional_string_content(content, "deleted_vehicles_schematic")};
    }
    if (source == "deleted_vehicles") {
        return DeletedVehicles{parse_optional_string_content(content, "deleted_vehicles")};
    }
    if (source == "websocket") {
        return parse_websocket(content);
    }
    if (source == "extra_geoms") {
        return parse_extra_geoms(content);
    }
    if (source == "healthcheck") {
        return parse_healthcheck(content);
    }
    if (source == "sbm_newsticker") {
        return parse_news_ticker(content);
    }
    return Unrecognized{source, content};
}

nlohmann::json optional_to_json(const std::optional<std::string> &value) {
    if (value.has_value()) {
        return value.value();
    }
    return nullptr;
}

nlohmann::json encode_content(const Content &content) {
    return std::visit(
        overloaded{
            [](const TrajectorySchematic &c) { return encode_geojson(c.geo); },
            [](const Trajectory &c) { return encode_geojson(c.geo); },
            [](const StationSchematic &c) { return encode_geojson(c.geo); },
            [](const Station &c) { return encode_geojson(c.geo); },
            [](const DeletedVehiclesSchematic &c) { return optional_to_json(c.vehicle); },
            [](const DeletedVehicles &c) { return optional_to_json(c.vehicle); },
            [](const Websocket &c) {
                if (const auto *status = std::get_if<WebsocketStatus>(&c.message)) {
                    return nlohmann::json{{"status", status->status}};
                }
                return nlohmann::json(std::get<WebsocketPong>(c.message).text);
            },
            [](const ExtraGeoms &c) {
                if (!c.geom.has_value()) {
                    return nlohmann::json();
                }
                return nlohmann::json{{"type", c.geom->type},
                                      {"properties", {{"ref", c.geom->ref}}}};
            },
            [](const Healthcheck &c) {
                nlohmann::json out{{"service", c.service}, {"healthy", c.healthy}};
                out["tenant"] = optional_to_json(c.tenant);
                return out;
            },
            [](const SbmNewsTicker &c) {
                nlohmann::json out;
                out["incident_program"] = c.incident_program.has_value()
                                              ? nlohmann::json(c.incident_program.value())
                                              : nlohmann::json();
                out["messages"] = nlohmann::json::array();
                for (const auto &m : c.messages) {
                    out["messages"].push_back({{"title", m.title},
                                               {"lines", m.lines},
                                               {"content", m.content},
                                               {"updated", m.updated}});
                }
                return out;
            },
            [](const Unrecognized &c) { return c.content; },
        },
        content);
}

} // namespace

std::string source_of(const Content &content) {
    return std::visit(overloaded{
                          [](const TrajectorySchematic &) -> std::string {
                              return "trajectory_schematic";
                          },
                          [](const Trajectory &) -> std::string { return "trajectory"; },
                          [](const StationSchematic &) -> std::string {
                              return "station_schematic";
                          },
                          [](const Station &) -> std::string { return "station"; },
                          [](const DeletedVehiclesSchematic &) -> std::string {
                              return "deleted_vehicles_schematic";
                          },
                          [](const DeletedVehicles &) -> std::string {
                              return "deleted_vehicles";
                          },
                          [](const Websocket &) -> std::string { return "websocket"; },
                          [](const ExtraGeoms &) -> std::string { return "extra_geoms"; },
                          [](const Healthcheck &) -> std::string { return "healthcheck"; },
                          [](const SbmNewsTicker &) -> std::string { return "sbm_newsticker"; },
                          [](const Unrecognized &c) -> std::string { return c.source; },
                      },
                      content);
}

GeoJson parse_geojson(const nlohmann::json &value) {
    require_object(value, "geojson");
    const std::string type = require_string(value, "type", "geojson");

    if (type == "Feature") {
        return parse_feature(value);
    }
    if (type == "FeatureCollection") {
        const auto &features = require(value, "features", "feature collection");
        if (!features.is_array()) {
            throw DecodeError::parse("feature collection 'features' is not an array");
        }
        FeatureCollection collection;
        for (const auto &f : features) {
            collection.features.push_back(parse_feature(f));
        }
        return collection;
    }
    for (const char *geometry_type : kGeometryTypes) {
        if (type == geometry_type) {
            return Geometry{value};
        }
    }
    throw DecodeError::parse("unknown geojson type '" + type + "'");
}

nlohmann::json encode_geojson(const GeoJson &geo) {
    return std::visit(overloaded{
                          [](const Geometry &g) { return g.value; },
                          [](const Feature &f) { return encode_feature(f); },
                          [](const FeatureCollection &c) {
                              nlohmann::json out;
                              out["type"] = "FeatureCollection";
                              out["features"] = nlohmann::json::array();
                              for (const auto &f : c.features) {
                                  out["features"].push_back(encode_feature(f));
                              }
                              return out;
                          },
                      },
                      geo);
}

Envelope parse_envelope(std::string_view line) {
    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded()) {
        throw DecodeError::parse("malformed JSON");
    }
    return decode_envelope(msg);
}

Envelope decode_envelope(const nlohmann::json &msg) {
    require_object(msg, "envelope");

    const std::string source = require_string(msg, "source", "envelope");

    const auto &timestamp = require(msg, "timestamp", "envelope");
    if (!timestamp.is_number()) {
        throw DecodeError::parse("envelope 'timestamp' is not a number");
    }

    Envelope envelope;
    envelope.timestamp = timestamp.get<double>();

    if (auto it = msg.find("client_reference"); it != msg.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            throw DecodeError::parse("envelope 'client_reference' is not an integer");
        }
        const bool too_large =
            it->is_number_unsigned() &&
            it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int8_t>::max());
        const auto ref = too_large ? int64_t{0} : it->get<int64_t>();
        if (too_large || ref < std::numeric_limits<int8_t>::min() ||
            ref > std::numeric_limits<int8_t>::max()) {
            throw DecodeError::parse("envelope 'client_reference' out of range");
        }
        envelope.client_reference = static_cast<int8_t>(ref);
    }

    const auto content_it = msg.find("content");
    const nlohmann::json content = content_it != msg.end() ? *content_it : nlohmann::json();
    envelope.content = parse_content(source, content);
    return envelope;
}

nlohmann::json encode_envelope(const Envelope &envelope) {
    nlohmann::json out;
    out["source"] = source_of(envelope.content);
    out["content"] = encode_content(envelope.content);
    out["timestamp"] = envelope.timestamp;
    if (envelope.client_reference.has_value()) {
        out["client_reference"] = static_cast<int>(envelope.client_reference.value());
    } else {
        out["client_reference"] = nullptr;
    }
    return out;
}

} // namespace livemap::protocol
