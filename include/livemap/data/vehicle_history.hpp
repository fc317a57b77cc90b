#pragma once

#include "livemap/protocol/trajectory.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace livemap::data {

/// One vehicle's timeline: decoded records in arrival order.
/// Append-only; never reordered by embedded timestamp.
class Vehicle {
  public:
    explicit Vehicle(protocol::Record first);

    void append(protocol::Record record);

    [[nodiscard]] const std::string &number() const { return number_; }
    [[nodiscard]] const std::vector<protocol::Record> &timeline() const { return records_; }
    [[nodiscard]] size_t size() const { return records_.size(); }

    /// Record at a replay frame, or nullptr if the timeline is shorter.
    [[nodiscard]] const protocol::Record *at(size_t frame) const;

  private:
    std::string number_;
    std::vector<protocol::Record> records_;
};

/// All vehicles seen during an analysis run, keyed by vehicle number.
/// Grows monotonically; nothing is evicted.
class VehicleHistory {
  public:
    /// Append to the vehicle's timeline, creating it on first sight.
    void insert(protocol::Record record);

    /// Returns nullptr if the vehicle has not been seen.
    [[nodiscard]] const Vehicle *find(const std::string &vehicle_number) const;

    [[nodiscard]] const std::unordered_map<std::string, Vehicle> &vehicles() const {
        return vehicles_;
    }

    [[nodiscard]] size_t size() const { return vehicles_.size(); }
    [[nodiscard]] bool empty() const { return vehicles_.empty(); }

    /// Total records over all vehicles.
    [[nodiscard]] size_t record_count() const { return record_count_; }

    /// Length of the longest vehicle timeline.
    [[nodiscard]] size_t longest_timeline() const { return longest_timeline_; }

  private:
    std::unordered_map<std::string, Vehicle> vehicles_;
    size_t record_count_ = 0;
    size_t longest_timeline_ = 0;
};

} // namespace livemap::data
