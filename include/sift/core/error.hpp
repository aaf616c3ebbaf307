#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sift {

enum class ErrorCode : std::uint8_t {
    /// The field or relation was never populated on the record.
    FieldNotLoaded,
    /// Ordering on a non-orderable kind, or a membership set of an unsupported element type.
    UnsupportedComparisonType,
    /// A record is not an instance of the requested schema.
    SchemaAssignability,
    /// The schema has no field of that name.
    UnknownField,
    /// A value's kind does not match the declared or requested kind.
    FieldType,
};

/// Error payload carried through std::expected in the evaluation layers.
struct Error {
    ErrorCode code = ErrorCode::FieldNotLoaded;
    std::string message;
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

/// Base class of every exception raised by the public API.
class SiftError : public std::runtime_error {
   public:
    SiftError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }

   private:
    ErrorCode code_;
};

class FieldNotLoadedError final : public SiftError {
   public:
    explicit FieldNotLoadedError(const std::string& message)
        : SiftError(ErrorCode::FieldNotLoaded, message) {}
};

class UnsupportedComparisonTypeError final : public SiftError {
   public:
    explicit UnsupportedComparisonTypeError(const std::string& message)
        : SiftError(ErrorCode::UnsupportedComparisonType, message) {}
};

class SchemaAssignabilityError final : public SiftError {
   public:
    explicit SchemaAssignabilityError(const std::string& message)
        : SiftError(ErrorCode::SchemaAssignability, message) {}
};

class UnknownFieldError final : public SiftError {
   public:
    explicit UnknownFieldError(const std::string& message)
        : SiftError(ErrorCode::UnknownField, message) {}
};

class FieldTypeError final : public SiftError {
   public:
    explicit FieldTypeError(const std::string& message)
        : SiftError(ErrorCode::FieldType, message) {}
};

/// Raise the exception type matching `error.code`.
[[noreturn]] void throw_error(const Error& error);

}  // namespace sift
