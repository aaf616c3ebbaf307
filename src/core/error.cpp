#include <sift/core/error.hpp>

namespace sift {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::FieldNotLoaded:
            return "field not loaded";
        case ErrorCode::UnsupportedComparisonType:
            return "unsupported comparison type";
        case ErrorCode::SchemaAssignability:
            return "schema not assignable";
        case ErrorCode::UnknownField:
            return "unknown field";
        case ErrorCode::FieldType:
            return "field type mismatch";
    }
    return "unknown error";
}

void throw_error(const Error& error) {
    switch (error.code) {
        case ErrorCode::FieldNotLoaded:
            throw FieldNotLoadedError(error.message);
        case ErrorCode::UnsupportedComparisonType:
            throw UnsupportedComparisonTypeError(error.message);
        case ErrorCode::SchemaAssignability:
            throw SchemaAssignabilityError(error.message);
        case ErrorCode::UnknownField:
            throw UnknownFieldError(error.message);
        case ErrorCode::FieldType:
            throw FieldTypeError(error.message);
    }
    throw SiftError(error.code, error.message);
}

}  // namespace sift
