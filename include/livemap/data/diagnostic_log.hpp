#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace livemap::data {

/// Types of diagnostic entries for filtering and terminal prefixes.
enum class DiagnosticType {
    Info,
    Session,
    Warning,
    Error,
};

/// A single entry in the diagnostic log.
struct DiagnosticEntry {
    DiagnosticType type = DiagnosticType::Info;
    std::string message;
    std::string detail;
    double wall_time = 0.0;
};

/// Rolling log of skipped lines, rejected records and session events.
/// Every entry is mirrored to the terminal unless echo is switched off.
class DiagnosticLog {
  public:
    static constexpr size_t kDefaultMaxEntries = 1000;

    explicit DiagnosticLog(size_t max_entries = kDefaultMaxEntries, bool echo = true);

    void add(DiagnosticType type, const std::string &message, const std::string &detail = "");

    [[nodiscard]] const std::deque<DiagnosticEntry> &entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    /// Number of entries of a type added since construction, including
    /// entries already rolled out of the buffer.
    [[nodiscard]] size_t total(DiagnosticType type) const;

    void set_echo(bool echo) { echo_ = echo; }
    void clear();
    [[nodiscard]] double elapsed() const;

    static const char *prefix(DiagnosticType type);

  private:
    size_t max_entries_ = kDefaultMaxEntries;
    bool echo_ = true;
    std::deque<DiagnosticEntry> entries_;
    size_t totals_[4] = {};
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace livemap::data
