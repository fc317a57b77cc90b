#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include <string_view>

namespace livemap::data {

/// Append-only newline-delimited store of raw feed frames.
/// Opened in append mode: repeated runs accumulate, nothing is truncated.
class RawLogWriter {
  public:
    /// Throws std::runtime_error if the file cannot be opened or created.
    explicit RawLogWriter(const std::string &path);

    RawLogWriter(const RawLogWriter &) = delete;
    RawLogWriter &operator=(const RawLogWriter &) = delete;

    /// Write one frame followed by a newline. Throws std::runtime_error on
    /// a failed write.
    void append(std::string_view frame);

    [[nodiscard]] size_t lines_written() const { return lines_written_; }
    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
    std::ofstream out_;
    size_t lines_written_ = 0;
};

/// Sequential reader over a raw log, in log order.
class RawLogReader {
  public:
    /// Throws std::runtime_error if the file cannot be opened.
    explicit RawLogReader(const std::string &path);

    /// Read the next line. Returns false at end of file.
    bool next(std::string &line);

    /// 1-based number of the line last returned by next().
    [[nodiscard]] size_t line_number() const { return line_number_; }

  private:
    std::ifstream in_;
    size_t line_number_ = 0;
};

} // namespace livemap::data
