#include "livemap/protocol/trajectory.hpp"
#include "livemap/protocol/errors.hpp"

namespace livemap::protocol {

RideState ride_state_from_string(const std::string &state) {
    return state == "DRIVING" ? RideState::Driving : RideState::Boarding;
}

Coordinate decode_coordinate(const nlohmann::json &value) {
    if (!value.is_array()) {
        throw DecodeError::incorrect_type("array", value.type_name());
    }
    if (value.size() != 2) {
        throw DecodeError::missing_items(2, value.size());
    }
    for (const auto &item : value) {
        if (!item.is_number()) {
            throw DecodeError::incorrect_type("number", item.type_name());
        }
    }

    // Upstream order is [longitude, latitude].
    Coordinate coord;
    coord.longitude = value[0].get<double>();
    coord.latitude = value[1].get<double>();
    return coord;
}

Line decode_line(const nlohmann::json &value) {
    if (!value.is_object()) {
        throw DecodeError::incorrect_type("object", value.type_name());
    }
    Line line;
    line.color = extract<std::string>(value, "color");
    line.id = extract<int64_t>(value, "id");
    line.name = extract<std::string>(value, "name");
    line.stroke = extract<std::string>(value, "stroke");
    line.text_color = extract<std::string>(value, "text_color");
    return line;
}

const nlohmann::json &trajectory_properties(const Envelope &envelope) {
    const auto *trajectory = std::get_if<TrajectorySchematic>(&envelope.content);
    if (trajectory == nullptr) {
        throw DecodeError::incorrect_type("trajectory_schematic", source_of(envelope.content));
    }

    const auto *feature = std::get_if<Feature>(&trajectory->geo);
    if (feature == nullptr) {
        const char *actual =
            std::holds_alternative<FeatureCollection>(trajectory->geo) ? "FeatureCollection"
                                                                       : "Geometry";
        throw DecodeError::incorrect_type("Feature", actual);
    }

    if (!feature->properties.has_value()) {
        throw DecodeError::incorrect_type("properties", "null");
    }
    return feature->properties.value();
}

Train decode_train(const Envelope &envelope) {
    const auto &props = trajectory_properties(envelope);

    Train train;
    train.delay = extract<std::optional<std::string>>(props, "delay");
    train.has_journey = extract<bool>(props, "has_journey");
    train.has_realtime = extract<bool>(props, "has_realtime");
    train.has_realtime_journey = extract<bool>(props, "has_realtime_journey");
    train.line = extract<std::optional<Line>>(props, "line");
    train.operator_provides_realtime_journey =
        extract<std::string>(props, "operator_provides_realtime_journey");
    train.original_line = extract<std::optional<std::string>>(props, "original_line");
    train.original_rake = extract<std::optional<std::string>>(props, "original_rake");
    train.rake = extract<std::optional<std::string>>(props, "rake");
    train.raw_coordinates = extract<std::optional<Coordinate>>(props, "raw_coordinates");
    train.ride_state = extract<std::optional<std::string>>(props, "ride_state");
    train.state = extract<std::optional<std::string>>(props, "state");
    train.tenant = extract<std::string>(props, "tenant");
    train.train_id = extract<std::string>(props, "train_id");
    train.train_number = extract<std::optional<int64_t>>(props, "train_number");
    train.transmitting_vehicle = extract<std::optional<std::string>>(props, "transmitting_vehicle");
    train.vehicle_number = extract<std::optional<std::string>>(props, "vehicle_number");
    return train;
}

Record decode_record(const Envelope &envelope) {
    const auto &props = trajectory_properties(envelope);

    const auto line_it = props.find("line");
    if (line_it == props.end()) {
        throw DecodeError::missing_property("line");
    }
    if (!line_it->is_object()) {
        throw DecodeError::incorrect_type("object", line_it->type_name());
    }

    Record record;
    record.timestamp = envelope.timestamp;
    record.position = extract<Coordinate>(props, "raw_coordinates");
    record.line = extract<std::string>(*line_it, "name");

    const auto color = extract<std::string>(*line_it, "color");
    try {
        record.line_color = parse_hex_color(color);
    } catch (const ColorConversionError &e) {
        throw DecodeError::incorrect_type("Color", e.what());
    }

    record.state = ride_state_from_string(extract<std::string>(props, "state"));
    record.vehicle_number = extract<std::string>(props, "vehicle_number");
    record.train_number = extract<int64_t>(props, "train_number");
    return record;
}

} // namespace livemap::protocol
