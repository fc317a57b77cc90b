#pragma once

#include "livemap/analysis/statistics.hpp"
#include "livemap/data/diagnostic_log.hpp"
#include "livemap/data/raw_log.hpp"
#include "livemap/data/vehicle_history.hpp"
#include "livemap/protocol/envelope.hpp"

#include <cstddef>
#include <cstdio>
#include <string>

namespace livemap::analysis {

struct ScanSummary {
    size_t lines = 0;
    size_t blank_lines = 0;
    size_t envelopes = 0;
    size_t parse_errors = 0;
    size_t unrecognized = 0;
    size_t trains = 0;
    size_t train_errors = 0;
    size_t records = 0;
    size_t record_errors = 0;
};

/// Offline pass over a raw log: decode each line, count trains into the
/// statistics and append replay records to the vehicle history.
/// A failure on one line or one projection is reported and skipped; the
/// scan always continues.
class LogScanner {
  public:
    explicit LogScanner(data::DiagnosticLog &log);

    /// Scan every remaining line of the reader.
    void scan(data::RawLogReader &reader);

    /// Process a single raw line.
    void process_line(const std::string &line, size_t line_number);

    [[nodiscard]] const ScanSummary &summary() const { return summary_; }
    [[nodiscard]] const TrainStatistics &statistics() const { return statistics_; }
    [[nodiscard]] const data::VehicleHistory &history() const { return history_; }

  private:
    void process_trajectory(const protocol::Envelope &envelope, const std::string &line,
                            size_t line_number);

    data::DiagnosticLog &log_;
    ScanSummary summary_;
    TrainStatistics statistics_;
    data::VehicleHistory history_;
};

void print_summary(const ScanSummary &summary, size_t vehicles, FILE *out);

} // namespace livemap::analysis
