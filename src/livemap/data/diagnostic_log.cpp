#include "livemap/data/diagnostic_log.hpp"

#include <algorithm>
#include <cstdio>

namespace livemap::data {

DiagnosticLog::DiagnosticLog(size_t max_entries, bool echo)
    : max_entries_(std::max<size_t>(max_entries, 1)), echo_(echo),
      start_time_(std::chrono::steady_clock::now()) {}

void DiagnosticLog::add(DiagnosticType type, const std::string &message,
                        const std::string &detail) {
    if (entries_.size() >= max_entries_) {
        entries_.pop_front();
    }

    entries_.push_back(DiagnosticEntry{
        .type = type,
        .message = message,
        .detail = detail,
        .wall_time = elapsed(),
    });
    ++totals_[static_cast<size_t>(type)];

    if (!echo_) {
        return;
    }

    // Mirror to terminal
    FILE *out = (type == DiagnosticType::Error || type == DiagnosticType::Warning) ? stderr : stdout;
    if (detail.empty()) {
        std::fprintf(out, "[%s] %s\n", prefix(type), message.c_str());
    } else {
        std::fprintf(out, "[%s] %s\n\t%s\n", prefix(type), message.c_str(), detail.c_str());
    }
}

const std::deque<DiagnosticEntry> &DiagnosticLog::entries() const { return entries_; }

size_t DiagnosticLog::size() const { return entries_.size(); }

bool DiagnosticLog::empty() const { return entries_.empty(); }

size_t DiagnosticLog::total(DiagnosticType type) const {
    return totals_[static_cast<size_t>(type)];
}

void DiagnosticLog::clear() { entries_.clear(); }

double DiagnosticLog::elapsed() const {
    const auto now = std::chrono::steady_clock::now();
    const auto delta = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_time_);
    return delta.count();
}

const char *DiagnosticLog::prefix(DiagnosticType type) {
    switch (type) {
    case DiagnosticType::Info:
        return "INF";
    case DiagnosticType::Session:
        return "SES";
    case DiagnosticType::Warning:
        return "WRN";
    case DiagnosticType::Error:
        return "ERR";
    }
    return "INF";
}

} // namespace livemap::data
