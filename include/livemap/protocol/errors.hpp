#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace livemap::protocol {

enum class DecodeErrorKind {
    Parse,
    MissingProperty,
    IncorrectType,
    IncorrectValueType,
    MissingItems,
};

/// Raised by every decode stage. A decode either yields a complete value or
/// throws one of these; callers skip the offending line or record.
class DecodeError : public std::runtime_error {
  public:
    static DecodeError parse(const std::string &message);
    static DecodeError missing_property(const std::string &field);
    static DecodeError incorrect_type(const std::string &expected, const std::string &actual);
    static DecodeError incorrect_value_type(const std::string &expected,
                                            const std::string &actual_value,
                                            const std::string &actual_kind);
    static DecodeError missing_items(size_t expected, size_t actual);

    [[nodiscard]] DecodeErrorKind kind() const { return kind_; }

    /// MissingProperty: the field name.
    [[nodiscard]] const std::string &field() const { return field_; }

    /// IncorrectType / IncorrectValueType.
    [[nodiscard]] const std::string &expected() const { return expected_; }
    [[nodiscard]] const std::string &actual() const { return actual_; }
    [[nodiscard]] const std::string &actual_value() const { return actual_value_; }

    /// MissingItems.
    [[nodiscard]] size_t expected_items() const { return expected_items_; }
    [[nodiscard]] size_t actual_items() const { return actual_items_; }

  private:
    DecodeError(DecodeErrorKind kind, const std::string &message);

    DecodeErrorKind kind_;
    std::string field_;
    std::string expected_;
    std::string actual_;
    std::string actual_value_;
    size_t expected_items_ = 0;
    size_t actual_items_ = 0;
};

enum class ColorErrorKind { WrongPrefix, ParseInt };

class ColorConversionError : public std::runtime_error {
  public:
    ColorConversionError(ColorErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ColorErrorKind kind() const { return kind_; }

  private:
    ColorErrorKind kind_;
};

const char *to_string(DecodeErrorKind kind);

} // namespace livemap::protocol
