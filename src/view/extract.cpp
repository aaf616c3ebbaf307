#include <sift/view/extract.hpp>

#include <fmt/format.h>

namespace sift::view {

auto extract_error(ValueKind from, ValueKind to) -> Error {
    return Error{
        .code = ErrorCode::FieldType,
        .message = fmt::format("cannot read a {} value as {}", kind_name(from), kind_name(to)),
    };
}

}  // namespace sift::view
