#include "livemap/analysis/log_scan.hpp"
#include "livemap/protocol/errors.hpp"
#include "livemap/protocol/trajectory.hpp"

#include <variant>

namespace livemap::analysis {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string describe(size_t line_number, const char *what, const protocol::DecodeError &e) {
    return "line " + std::to_string(line_number) + ": " + what + " [" +
           protocol::to_string(e.kind()) + "] " + e.what();
}

} // namespace

LogScanner::LogScanner(data::DiagnosticLog &log) : log_(log) {}

void LogScanner::scan(data::RawLogReader &reader) {
    std::string line;
    while (reader.next(line)) {
        process_line(line, reader.line_number());
    }
}

void LogScanner::process_line(const std::string &line, size_t line_number) {
    ++summary_.lines;
    if (line.empty()) {
        ++summary_.blank_lines;
        return;
    }

    protocol::Envelope envelope;
    try {
        envelope = protocol::parse_envelope(line);
    } catch (const protocol::DecodeError &e) {
        ++summary_.parse_errors;
        log_.add(data::DiagnosticType::Warning, describe(line_number, "unable to parse", e), line);
        return;
    }
    ++summary_.envelopes;

    std::visit(overloaded{
                   [&](const protocol::TrajectorySchematic &) {
                       process_trajectory(envelope, line, line_number);
                   },
                   [&](const protocol::Unrecognized &) { ++summary_.unrecognized; },
                   // Known content that carries no vehicle positions.
                   [](const protocol::Trajectory &) {},
                   [](const protocol::StationSchematic &) {},
                   [](const protocol::Station &) {},
                   [](const protocol::DeletedVehiclesSchematic &) {},
                   [](const protocol::DeletedVehicles &) {},
                   [](const protocol::Websocket &) {},
                   [](const protocol::ExtraGeoms &) {},
                   [](const protocol::Healthcheck &) {},
                   [](const protocol::SbmNewsTicker &) {},
               },
               envelope.content);
}

void LogScanner::process_trajectory(const protocol::Envelope &envelope, const std::string &line,
                                    size_t line_number) {
    // The two projections are independent: one failing never blocks the other.
    try {
        statistics_.add(protocol::decode_train(envelope));
        ++summary_.trains;
    } catch (const protocol::DecodeError &e) {
        ++summary_.train_errors;
        log_.add(data::DiagnosticType::Warning, describe(line_number, "should be train", e), line);
    }

    try {
        history_.insert(protocol::decode_record(envelope));
        ++summary_.records;
    } catch (const protocol::DecodeError &e) {
        ++summary_.record_errors;
        log_.add(data::DiagnosticType::Info, describe(line_number, "should be record", e));
    }
}

void print_summary(const ScanSummary &summary, size_t vehicles, FILE *out) {
    std::fprintf(out, "lines:         %zu (%zu blank)\n", summary.lines, summary.blank_lines);
    std::fprintf(out, "envelopes:     %zu (%zu unparseable, %zu unrecognized)\n",
                 summary.envelopes, summary.parse_errors, summary.unrecognized);
    std::fprintf(out, "trains:        %zu (%zu rejected)\n", summary.trains,
                 summary.train_errors);
    std::fprintf(out, "records:       %zu (%zu rejected)\n", summary.records,
                 summary.record_errors);
    std::fprintf(out, "vehicles:      %zu\n", vehicles);
}

} // namespace livemap::analysis
