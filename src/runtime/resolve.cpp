#include <sift/runtime/resolve.hpp>

#include <fmt/format.h>

namespace sift::runtime {

namespace {

auto resolve_terminal(const Record& record, const std::string& name)
    -> std::expected<FieldValue, Error> {
    const FieldDef* def = record.schema()->find_field(name);
    if (def == nullptr) {
        return std::unexpected(Error{
            .code = ErrorCode::UnknownField,
            .message = fmt::format("{} has no field '{}'", record.schema()->name(), name),
        });
    }
    if (def->is_relation()) {
        return std::unexpected(Error{
            .code = ErrorCode::FieldType,
            .message = fmt::format("{}.{} is a relation; name a field on {}",
                                   record.schema()->name(), name, def->relation),
        });
    }
    auto value = record.get(name);
    if (!value) {
        return std::unexpected(value.error());
    }
    return FieldValue{.value = std::move(*value), .declared = def->kind};
}

}  // namespace

auto resolve(const Record& record, const FieldRef& field) -> std::expected<FieldValue, Error> {
    if (const auto* direct = std::get_if<DirectField>(&field.node())) {
        return resolve_terminal(record, direct->name);
    }
    const auto& segments = std::get<RelationPath>(field.node()).segments;

    const Record* current = &record;
    RecordPtr hold;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        auto related = current->related(segments[i]);
        if (!related) {
            return std::unexpected(related.error());
        }
        if (*related == nullptr) {
            return FieldValue{.value = Value{}, .declared = std::nullopt};
        }
        hold = std::move(*related);
        current = hold.get();
    }
    return resolve_terminal(*current, segments.back());
}

}  // namespace sift::runtime
