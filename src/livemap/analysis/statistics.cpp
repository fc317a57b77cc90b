#include "livemap/analysis/statistics.hpp"

namespace livemap::analysis {

namespace {

template <typename T>
void print_counter(const char *title, const data::Counter<T> &counter, FILE *out) {
    std::fprintf(out, "%s:\n", title);
    for (const auto &[key, n] : counter.sorted()) {
        std::fprintf(out, "  %-40s %zu\n", bucket_label(key).c_str(), n);
    }
}

} // namespace

void TrainStatistics::add(const protocol::Train &train) {
    ++trains;
    delays.insert(train.delay);
    states.insert(train.state);
    ride_states.insert(train.ride_state);
    original_lines.insert(train.original_line);
    lines.insert(train.line);
}

std::string bucket_label(const std::optional<std::string> &key) {
    if (!key.has_value()) {
        return "<none>";
    }
    return "\"" + key.value() + "\"";
}

std::string bucket_label(const std::optional<protocol::Line> &key) {
    if (!key.has_value()) {
        return "<none>";
    }
    const auto &line = key.value();
    return line.name + " (id " + std::to_string(line.id) + ", " + line.color + ")";
}

void print_report(const TrainStatistics &stats, FILE *out) {
    std::fprintf(out, "trains: %zu\n", stats.trains);
    print_counter("delays", stats.delays, out);
    print_counter("states", stats.states, out);
    print_counter("ride_states", stats.ride_states, out);
    print_counter("original_lines", stats.original_lines, out);
    print_counter("lines", stats.lines, out);
}

} // namespace livemap::analysis
