#pragma once

#include "livemap/data/counter.hpp"
#include "livemap/protocol/trajectory.hpp"

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>

namespace livemap::analysis {

/// Diagnostic frequency counts over decoded trains.
struct TrainStatistics {
    size_t trains = 0;
    data::Counter<std::string> delays;
    data::Counter<std::string> states;
    data::Counter<std::string> ride_states;
    data::Counter<std::string> original_lines;
    data::Counter<protocol::Line> lines;

    void add(const protocol::Train &train);
};

/// Bucket label for reports; the no-value bucket renders as "<none>".
std::string bucket_label(const std::optional<std::string> &key);
std::string bucket_label(const std::optional<protocol::Line> &key);

/// Print the train count and every counter, most frequent first.
void print_report(const TrainStatistics &stats, FILE *out);

} // namespace livemap::analysis
