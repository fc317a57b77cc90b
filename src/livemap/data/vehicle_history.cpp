#include "livemap/data/vehicle_history.hpp"

#include <algorithm>
#include <utility>

namespace livemap::data {

Vehicle::Vehicle(protocol::Record first) : number_(first.vehicle_number) {
    records_.push_back(std::move(first));
}

void Vehicle::append(protocol::Record record) { records_.push_back(std::move(record)); }

const protocol::Record *Vehicle::at(size_t frame) const {
    if (frame >= records_.size()) {
        return nullptr;
    }
    return &records_[frame];
}

void VehicleHistory::insert(protocol::Record record) {
    auto it = vehicles_.find(record.vehicle_number);
    if (it == vehicles_.end()) {
        std::string key = record.vehicle_number;
        it = vehicles_.emplace(std::move(key), Vehicle(std::move(record))).first;
    } else {
        it->second.append(std::move(record));
    }
    ++record_count_;
    longest_timeline_ = std::max(longest_timeline_, it->second.size());
}

const Vehicle *VehicleHistory::find(const std::string &vehicle_number) const {
    auto it = vehicles_.find(vehicle_number);
    if (it != vehicles_.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace livemap::data
