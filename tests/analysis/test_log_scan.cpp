#include "livemap/analysis/log_scan.hpp"
#include "livemap/data/raw_log.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

using namespace livemap::analysis;
using namespace livemap::data;

namespace {

std::string trajectory_line(const std::string &vehicle, double lon, double lat,
                            bool with_train_id = true) {
    nlohmann::json props = {
        {"has_journey", true},
        {"line",
         {{"color", "#1A2B3C"},
          {"id", 4},
          {"name", "S4"},
          {"stroke", "#1A2B3C"},
          {"text_color", "#FFFFFF"}}},
        {"operator_provides_realtime_journey", "yes"},
        {"raw_coordinates", {lon, lat}},
        {"ride_state", "NORMAL"},
        {"state", "DRIVING"},
        {"tenant", "sbm"},
        {"train_number", 6412},
        {"vehicle_number", vehicle},
    };
    if (with_train_id) {
        props["train_id"] = "sbm_" + vehicle;
    }

    nlohmann::json msg = {
        {"source", "trajectory_schematic"},
        {"content", {{"type", "Feature"}, {"geometry", nullptr}, {"properties", props}}},
        {"timestamp", 1697454536271.5},
        {"client_reference", nullptr},
    };
    return msg.dump();
}

} // namespace

TEST(LogScanner, MalformedLineDoesNotAbortScan) {
    DiagnosticLog log(100, false);
    LogScanner scanner(log);

    scanner.process_line(trajectory_line("423 101", 11.5, 48.1), 1);
    scanner.process_line(R"({"source": "trajectory_schematic", "content": {)", 2);
    scanner.process_line(trajectory_line("423 102", 11.6, 48.2), 3);

    const auto &summary = scanner.summary();
    EXPECT_EQ(summary.lines, 3u);
    EXPECT_EQ(summary.envelopes, 2u);
    EXPECT_EQ(summary.parse_errors, 1u);
    EXPECT_EQ(summary.trains, 2u);
    EXPECT_EQ(summary.records, 2u);
    EXPECT_EQ(scanner.statistics().trains, 2u);
    EXPECT_EQ(scanner.history().size(), 2u);
    EXPECT_NE(scanner.history().find("423 101"), nullptr);
    EXPECT_NE(scanner.history().find("423 102"), nullptr);

    ASSERT_EQ(log.total(DiagnosticType::Warning), 1u);
    EXPECT_NE(log.entries().back().message.find("line 2"), std::string::npos);
}

TEST(LogScanner, MissingTrainIdSkipsStatisticsOnly) {
    DiagnosticLog log(100, false);
    LogScanner scanner(log);

    scanner.process_line(trajectory_line("423 101", 11.5, 48.1, false), 1);

    EXPECT_EQ(scanner.summary().train_errors, 1u);
    EXPECT_EQ(scanner.summary().trains, 0u);
    EXPECT_EQ(scanner.statistics().trains, 0u);
    EXPECT_EQ(scanner.summary().records, 1u);
    EXPECT_EQ(scanner.history().size(), 1u);
}

TEST(LogScanner, OtherContentIsIgnored) {
    DiagnosticLog log(100, false);
    LogScanner scanner(log);

    scanner.process_line(R"({"source": "websocket", "content": "PONG", "timestamp": 1.0})", 1);
    scanner.process_line(R"({"source": "buses", "content": {}, "timestamp": 2.0})", 2);
    scanner.process_line("", 3);

    const auto &summary = scanner.summary();
    EXPECT_EQ(summary.lines, 3u);
    EXPECT_EQ(summary.blank_lines, 1u);
    EXPECT_EQ(summary.envelopes, 2u);
    EXPECT_EQ(summary.unrecognized, 1u);
    EXPECT_EQ(summary.parse_errors, 0u);
    EXPECT_EQ(summary.trains, 0u);
    EXPECT_TRUE(scanner.history().empty());
    EXPECT_TRUE(log.empty());
}

TEST(LogScanner, EveryKnownNonSchematicSourceIsIgnored) {
    DiagnosticLog log(100, false);
    LogScanner scanner(log);

    auto live = nlohmann::json::parse(trajectory_line("423 101", 11.5, 48.1));
    live["source"] = "trajectory";

    const std::vector<std::string> lines = {
        live.dump(),
        R"({"source": "station_schematic", "content": {"type": "Point", "coordinates": [1, 2]}, "timestamp": 1.0})",
        R"({"source": "station", "content": {"type": "Point", "coordinates": [1, 2]}, "timestamp": 1.0})",
        R"({"source": "deleted_vehicles_schematic", "content": "sbm_1", "timestamp": 1.0})",
        R"({"source": "deleted_vehicles", "content": null, "timestamp": 1.0})",
        R"({"source": "websocket", "content": {"status": "open"}, "timestamp": 1.0})",
        R"({"source": "extra_geoms", "content": null, "timestamp": 1.0})",
        R"({"source": "healthcheck", "content": {"service": "realtime", "healthy": true}, "timestamp": 1.0})",
        R"({"source": "sbm_newsticker", "content": {"messages": []}, "timestamp": 1.0})",
    };
    for (size_t i = 0; i < lines.size(); ++i) {
        scanner.process_line(lines[i], i + 1);
    }

    const auto &summary = scanner.summary();
    EXPECT_EQ(summary.envelopes, lines.size());
    EXPECT_EQ(summary.parse_errors, 0u);
    EXPECT_EQ(summary.unrecognized, 0u);
    EXPECT_EQ(summary.trains + summary.train_errors, 0u);
    EXPECT_EQ(summary.records + summary.record_errors, 0u);
    EXPECT_TRUE(scanner.history().empty());
    EXPECT_TRUE(log.empty());
}

TEST(LogScanner, ScansRawLogInOrder) {
    const auto path =
        (std::filesystem::temp_directory_path() / "livemap_scan_order.jsonl").string();
    std::filesystem::remove(path);
    {
        RawLogWriter writer(path);
        writer.append(trajectory_line("423 101", 11.50, 48.10));
        writer.append("garbage");
        writer.append(trajectory_line("423 101", 11.51, 48.11));
        writer.append(trajectory_line("423 101", 11.52, 48.12));
    }

    DiagnosticLog log(100, false);
    LogScanner scanner(log);
    RawLogReader reader(path);
    scanner.scan(reader);

    const auto *vehicle = scanner.history().find("423 101");
    ASSERT_NE(vehicle, nullptr);
    ASSERT_EQ(vehicle->size(), 3u);
    EXPECT_DOUBLE_EQ(vehicle->timeline()[0].position.longitude, 11.50);
    EXPECT_DOUBLE_EQ(vehicle->timeline()[1].position.longitude, 11.51);
    EXPECT_DOUBLE_EQ(vehicle->timeline()[2].position.longitude, 11.52);
    EXPECT_EQ(scanner.summary().parse_errors, 1u);
    std::filesystem::remove(path);
}
