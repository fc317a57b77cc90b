#include "livemap/data/raw_log.hpp"

#include <stdexcept>

namespace livemap::data {

RawLogWriter::RawLogWriter(const std::string &path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {
    if (!out_.is_open()) {
        throw std::runtime_error("Cannot open log '" + path + "' for appending");
    }
}

void RawLogWriter::append(std::string_view frame) {
    out_ << frame << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write to log '" + path_ + "'");
    }
    ++lines_written_;
}

RawLogReader::RawLogReader(const std::string &path) : in_(path) {
    if (!in_.is_open()) {
        throw std::runtime_error("Cannot open log '" + path + "' for reading");
    }
}

bool RawLogReader::next(std::string &line) {
    if (!std::getline(in_, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

} // namespace livemap::data
