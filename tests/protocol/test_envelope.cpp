#include "livemap/protocol/envelope.hpp"
#include "livemap/protocol/errors.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace livemap::protocol;

namespace {

DecodeErrorKind parse_error_kind(const std::string &line) {
    try {
        parse_envelope(line);
    } catch (const DecodeError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a DecodeError for: " << line;
    return DecodeErrorKind::MissingItems;
}

Feature make_feature() {
    Feature feature;
    feature.geometry = nlohmann::json::parse(
        R"({"type": "LineString", "coordinates": [[1282376.3, 6131534.5], [1282400.1, 6131540.2]]})");
    feature.properties = nlohmann::json::parse(
        R"({"train_id": "sbm_1", "raw_coordinates": [11.58, 48.14], "train_number": 6412})");
    return feature;
}

} // namespace

TEST(EnvelopeParser, DeletedVehiclesSchematic) {
    auto env = parse_envelope(
        R"({"source": "deleted_vehicles_schematic", "content": "sbm_140404727073712",
            "timestamp": 1697454536271.5, "client_reference": null})");

    const auto *deleted = std::get_if<DeletedVehiclesSchematic>(&env.content);
    ASSERT_NE(deleted, nullptr);
    ASSERT_TRUE(deleted->vehicle.has_value());
    EXPECT_EQ(deleted->vehicle.value(), "sbm_140404727073712");
    EXPECT_DOUBLE_EQ(env.timestamp, 1697454536271.5);
    EXPECT_FALSE(env.client_reference.has_value());
}

TEST(EnvelopeParser, TrajectoryFeature) {
    auto env = parse_envelope(R"({
        "source": "trajectory_schematic",
        "content": {"type": "Feature", "geometry": null,
                    "properties": {"train_id": "sbm_1"}},
        "timestamp": 1697454536000,
        "client_reference": 3
    })");

    const auto *trajectory = std::get_if<TrajectorySchematic>(&env.content);
    ASSERT_NE(trajectory, nullptr);
    const auto *feature = std::get_if<Feature>(&trajectory->geo);
    ASSERT_NE(feature, nullptr);
    ASSERT_TRUE(feature->properties.has_value());
    EXPECT_EQ((*feature->properties)["train_id"], "sbm_1");
    ASSERT_TRUE(env.client_reference.has_value());
    EXPECT_EQ(env.client_reference.value(), 3);
}

TEST(EnvelopeParser, WebsocketStatusAndPong) {
    auto status = parse_envelope(
        R"({"source": "websocket", "content": {"status": "open"}, "timestamp": 1.0})");
    const auto *ws = std::get_if<Websocket>(&status.content);
    ASSERT_NE(ws, nullptr);
    ASSERT_TRUE(std::holds_alternative<WebsocketStatus>(ws->message));
    EXPECT_EQ(std::get<WebsocketStatus>(ws->message).status, "open");

    auto pong = parse_envelope(R"({"source": "websocket", "content": "PONG", "timestamp": 2.0})");
    ws = std::get_if<Websocket>(&pong.content);
    ASSERT_NE(ws, nullptr);
    ASSERT_TRUE(std::holds_alternative<WebsocketPong>(ws->message));
    EXPECT_EQ(std::get<WebsocketPong>(ws->message).text, "PONG");
}

TEST(EnvelopeParser, UnknownSourceIsUnrecognized) {
    auto env = parse_envelope(
        R"({"source": "buses_schematic", "content": {"anything": [1, 2]}, "timestamp": 5.0})");

    const auto *unknown = std::get_if<Unrecognized>(&env.content);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->source, "buses_schematic");
    EXPECT_EQ(unknown->content["anything"][1], 2);
    EXPECT_EQ(source_of(env.content), "buses_schematic");
}

TEST(EnvelopeParser, MalformedJson) {
    EXPECT_EQ(parse_error_kind(R"({"source": "trajectory", "content": )"), DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind("not json"), DecodeErrorKind::Parse);
}

TEST(EnvelopeParser, UnparseableShapes) {
    EXPECT_EQ(parse_error_kind(R"([1, 2, 3])"), DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind(R"({"content": null, "timestamp": 1.0})"), DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind(R"({"source": "healthcheck", "content": {}})"),
              DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind(R"({"source": "websocket", "content": 5, "timestamp": 1.0})"),
              DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind(
                  R"({"source": "station", "content": {"type": "Blob"}, "timestamp": 1.0})"),
              DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind(
                  R"({"source": "station", "content": null, "timestamp": 1.0, "client_reference": 300})"),
              DecodeErrorKind::Parse);
}

TEST(EnvelopeParser, ClientReferenceRange) {
    EXPECT_EQ(parse_error_kind(
                  R"({"source": "deleted_vehicles", "content": null, "timestamp": 1.0, "client_reference": 18446744073709551615})"),
              DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind(
                  R"({"source": "deleted_vehicles", "content": null, "timestamp": 1.0, "client_reference": 128})"),
              DecodeErrorKind::Parse);
    EXPECT_EQ(parse_error_kind(
                  R"({"source": "deleted_vehicles", "content": null, "timestamp": 1.0, "client_reference": -129})"),
              DecodeErrorKind::Parse);

    auto low = parse_envelope(
        R"({"source": "deleted_vehicles", "content": null, "timestamp": 1.0, "client_reference": -128})");
    EXPECT_EQ(low.client_reference, std::optional<int8_t>(-128));
    auto high = parse_envelope(
        R"({"source": "deleted_vehicles", "content": null, "timestamp": 1.0, "client_reference": 127})");
    EXPECT_EQ(high.client_reference, std::optional<int8_t>(127));
}

TEST(EnvelopeParser, EncodeThenDecodeKnownSources) {
    Feature feature = make_feature();

    FeatureCollection collection;
    collection.features = {feature, feature};

    SbmNewsTicker ticker;
    ticker.incident_program = true;
    ticker.messages.push_back(
        NewsTickerMessage{"Stammstrecke", {"S1", "S2"}, "Signal fault", "2023-10-16T10:00:00"});

    const std::vector<Envelope> envelopes = {
        {TrajectorySchematic{feature}, 1697454536271.5, std::nullopt},
        {Trajectory{Geometry{feature.geometry}}, 1697454536272.0, 1},
        {StationSchematic{collection}, 1697454536273.25, std::nullopt},
        {Station{feature}, 1697454536274.0, -2},
        {DeletedVehiclesSchematic{"sbm_140404727073712"}, 1697454536275.0, std::nullopt},
        {DeletedVehicles{std::nullopt}, 1697454536276.0, std::nullopt},
        {Websocket{WebsocketStatus{"open"}}, 1.0, std::nullopt},
        {Websocket{WebsocketPong{"PONG"}}, 2.0, std::nullopt},
        {ExtraGeoms{ExtraGeom{"Feature", "stammstrecke"}}, 3.0, std::nullopt},
        {ExtraGeoms{std::nullopt}, 4.0, std::nullopt},
        {Healthcheck{"realtime", true, "sbm"}, 5.0, std::nullopt},
        {ticker, 6.0, std::nullopt},
    };

    for (const auto &original : envelopes) {
        const std::string line = encode_envelope(original).dump();
        const Envelope decoded = parse_envelope(line);
        EXPECT_EQ(decoded, original) << line;
        EXPECT_EQ(source_of(decoded.content), source_of(original.content));
    }
}

TEST(GeoJsonParser, FeatureCollection) {
    auto geo = parse_geojson(nlohmann::json::parse(R"({
        "type": "FeatureCollection",
        "features": [
            {"type": "Feature", "geometry": null, "properties": {"name": "Ostbahnhof"}},
            {"type": "Feature", "geometry": null, "properties": null, "id": 7}
        ]
    })"));

    const auto *collection = std::get_if<FeatureCollection>(&geo);
    ASSERT_NE(collection, nullptr);
    ASSERT_EQ(collection->features.size(), 2u);
    EXPECT_TRUE(collection->features[0].properties.has_value());
    EXPECT_FALSE(collection->features[1].properties.has_value());
    ASSERT_TRUE(collection->features[1].id.has_value());
    EXPECT_EQ(collection->features[1].id.value(), 7);
}

TEST(GeoJsonParser, BareGeometry) {
    auto geo = parse_geojson(nlohmann::json::parse(R"({"type": "Point", "coordinates": [1, 2]})"));
    ASSERT_TRUE(std::holds_alternative<Geometry>(geo));
}
