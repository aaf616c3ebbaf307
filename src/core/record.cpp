#include <sift/core/record.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace sift {

Record::Record(SchemaPtr schema) : schema_(std::move(schema)) {
    if (schema_ == nullptr) {
        throw std::invalid_argument("record requires a schema");
    }
    slots_.resize(schema_->size(), Unloaded{});
}

auto Record::lookup(std::string_view field) const -> std::expected<std::size_t, Error> {
    if (auto idx = schema_->field_index(field)) {
        return *idx;
    }
    return std::unexpected(Error{
        .code = ErrorCode::UnknownField,
        .message = fmt::format("{} has no field '{}'", schema_->name(), field),
    });
}

auto Record::lookup_or_throw(std::string_view field) const -> std::size_t {
    auto idx = lookup(field);
    if (!idx) {
        throw_error(idx.error());
    }
    return *idx;
}

void Record::set(std::string_view field, Value value) {
    const std::size_t idx = lookup_or_throw(field);
    const FieldDef& def = schema_->fields()[idx];
    if (def.is_relation()) {
        if (!value.is_null()) {
            throw FieldTypeError(fmt::format("{}.{} is a relation; use set_relation",
                                             schema_->name(), def.name));
        }
        slots_[idx] = RecordPtr{};
        return;
    }
    if (!value.is_null()) {
        const ValueKind kind = *value.kind();
        if (def.kind == ValueKind::Identifier && kind == ValueKind::Text) {
            value = Value{Id{*value.get_if<std::string>()}};
        } else if (kind != def.kind) {
            throw FieldTypeError(fmt::format("{}.{} is {}, cannot hold a {} value",
                                             schema_->name(), def.name, kind_name(def.kind),
                                             kind_name(kind)));
        }
    }
    slots_[idx] = std::move(value);
}

void Record::set_relation(std::string_view field, RecordPtr related) {
    const std::size_t idx = lookup_or_throw(field);
    const FieldDef& def = schema_->fields()[idx];
    if (!def.is_relation()) {
        throw FieldTypeError(
            fmt::format("{}.{} is not a relation", schema_->name(), def.name));
    }
    if (related != nullptr && related->schema()->name() != def.relation) {
        throw SchemaAssignabilityError(fmt::format("{}.{} expects a {} record, got {}",
                                                   schema_->name(), def.name, def.relation,
                                                   related->schema()->name()));
    }
    slots_[idx] = std::move(related);
}

void Record::unset(std::string_view field) {
    slots_[lookup_or_throw(field)] = Unloaded{};
}

auto Record::is_loaded(std::string_view field) const -> bool {
    auto idx = schema_->field_index(field);
    return idx.has_value() && !std::holds_alternative<Unloaded>(slots_[*idx]);
}

auto Record::get(std::string_view field) const -> std::expected<Value, Error> {
    auto idx = lookup(field);
    if (!idx) {
        return std::unexpected(idx.error());
    }
    const Slot& slot = slots_[*idx];
    if (std::holds_alternative<Unloaded>(slot)) {
        return std::unexpected(Error{
            .code = ErrorCode::FieldNotLoaded,
            .message = fmt::format("{}.{} was not loaded", schema_->name(), field),
        });
    }
    if (const auto* value = std::get_if<Value>(&slot)) {
        return *value;
    }
    return std::unexpected(Error{
        .code = ErrorCode::FieldType,
        .message = fmt::format("{}.{} is a relation, not a value", schema_->name(), field),
    });
}

auto Record::related(std::string_view field) const -> std::expected<RecordPtr, Error> {
    auto idx = lookup(field);
    if (!idx) {
        return std::unexpected(idx.error());
    }
    const FieldDef& def = schema_->fields()[*idx];
    if (!def.is_relation()) {
        return std::unexpected(Error{
            .code = ErrorCode::FieldType,
            .message = fmt::format("{}.{} is not a relation", schema_->name(), field),
        });
    }
    const Slot& slot = slots_[*idx];
    if (std::holds_alternative<Unloaded>(slot)) {
        return std::unexpected(Error{
            .code = ErrorCode::FieldNotLoaded,
            .message = fmt::format("{}.{} was not loaded", schema_->name(), field),
        });
    }
    return std::get<RecordPtr>(slot);
}

auto Record::populated_fields() const -> std::vector<const FieldDef*> {
    std::vector<const FieldDef*> out;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!std::holds_alternative<Unloaded>(slots_[i])) {
            out.push_back(&schema_->fields()[i]);
        }
    }
    return out;
}

auto Record::with_fields(const std::vector<std::string>& fields) const
    -> std::expected<RecordPtr, Error> {
    auto copy = std::make_shared<Record>(schema_);
    for (const auto& name : fields) {
        auto idx = lookup(name);
        if (!idx) {
            return std::unexpected(idx.error());
        }
        const Slot& slot = slots_[*idx];
        if (std::holds_alternative<Unloaded>(slot)) {
            return std::unexpected(Error{
                .code = ErrorCode::FieldNotLoaded,
                .message = fmt::format("{}.{} was not loaded", schema_->name(), name),
            });
        }
        copy->slots_[*idx] = slot;
    }
    return copy;
}

auto make_record(SchemaPtr schema,
                 std::initializer_list<std::pair<std::string_view, Value>> fields)
    -> std::shared_ptr<Record> {
    auto record = std::make_shared<Record>(std::move(schema));
    for (const auto& [name, value] : fields) {
        record->set(name, value);
    }
    return record;
}

}  // namespace sift
