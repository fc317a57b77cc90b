#include "livemap/protocol/errors.hpp"

namespace livemap::protocol {

DecodeError::DecodeError(DecodeErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind) {}

DecodeError DecodeError::parse(const std::string &message) {
    return DecodeError(DecodeErrorKind::Parse, message);
}

DecodeError DecodeError::missing_property(const std::string &field) {
    DecodeError err(DecodeErrorKind::MissingProperty, "missing property: '" + field + "'");
    err.field_ = field;
    return err;
}

DecodeError DecodeError::incorrect_type(const std::string &expected, const std::string &actual) {
    DecodeError err(DecodeErrorKind::IncorrectType, "expected value to be of type '" + expected +
                                                        "', but found '" + actual + "'");
    err.expected_ = expected;
    err.actual_ = actual;
    return err;
}

DecodeError DecodeError::incorrect_value_type(const std::string &expected,
                                              const std::string &actual_value,
                                              const std::string &actual_kind) {
    DecodeError err(DecodeErrorKind::IncorrectValueType,
                    "expected value " + actual_value + " to be of type '" + expected +
                        "', but found it to be of type '" + actual_kind + "'");
    err.expected_ = expected;
    err.actual_ = actual_kind;
    err.actual_value_ = actual_value;
    return err;
}

DecodeError DecodeError::missing_items(size_t expected, size_t actual) {
    DecodeError err(DecodeErrorKind::MissingItems, "expected " + std::to_string(expected) +
                                                       " items, but found " +
                                                       std::to_string(actual) + " instead");
    err.expected_items_ = expected;
    err.actual_items_ = actual;
    return err;
}

const char *to_string(DecodeErrorKind kind) {
    switch (kind) {
    case DecodeErrorKind::Parse:
        return "ParseError";
    case DecodeErrorKind::MissingProperty:
        return "MissingProperty";
    case DecodeErrorKind::IncorrectType:
        return "IncorrectType";
    case DecodeErrorKind::IncorrectValueType:
        return "IncorrectValueType";
    case DecodeErrorKind::MissingItems:
        return "MissingItems";
    }
    return "Unknown";
}

} // namespace livemap::protocol
