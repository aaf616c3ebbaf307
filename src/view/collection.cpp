#include <sift/view/collection.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace sift::view {

namespace {

auto not_assignable(const Record& record, const Schema& schema) -> Error {
    return Error{
        .code = ErrorCode::SchemaAssignability,
        .message = fmt::format("a {} record is not assignable to {}", record.schema()->name(),
                               schema.name()),
    };
}

}  // namespace

auto Collection::of(std::vector<RecordPtr> records, SchemaPtr schema) -> Collection {
    for (const auto& record : records) {
        if (record == nullptr) {
            throw std::invalid_argument("collection records must not be null");
        }
        if (schema != nullptr && !record->schema()->is_assignable_to(*schema)) {
            throw_error(not_assignable(*record, *schema));
        }
    }
    return Collection(std::move(records), std::move(schema));
}

void Collection::check_assignable(const Record& record) const {
    if (schema_ != nullptr && !record.schema()->is_assignable_to(*schema_)) {
        throw_error(not_assignable(record, *schema_));
    }
}

auto Collection::filter(const match::Predicate& predicate) const -> Collection {
    std::vector<RecordPtr> kept;
    for (const auto& record : records_) {
        auto matched = predicate.evaluate(*record);
        if (!matched) {
            throw_error(matched.error());
        }
        if (*matched) {
            kept.push_back(record);
        }
    }
    spdlog::debug("filter: kept {} of {} records", kept.size(), records_.size());
    return Collection(std::move(kept), schema_);
}

auto Collection::remove(const match::Predicate& predicate) const -> Collection {
    return filter(predicate.negate());
}

auto Collection::find(const match::Predicate& predicate) const -> RecordPtr {
    for (const auto& record : records_) {
        if (predicate.matches(*record)) {
            return record;
        }
    }
    return nullptr;
}

auto Collection::map_all(const Transform& transform) const -> Collection {
    std::vector<RecordPtr> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        auto mapped = transform(record);
        if (mapped == nullptr) {
            throw std::invalid_argument("map transform returned a null record");
        }
        check_assignable(*mapped);
        out.push_back(std::move(mapped));
    }
    return Collection(std::move(out), schema_);
}

auto Collection::map_some(const match::Predicate& predicate, const Transform& transform) const
    -> Collection {
    std::vector<RecordPtr> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        if (!predicate.matches(*record)) {
            out.push_back(record);
            continue;
        }
        auto mapped = transform(record);
        if (mapped == nullptr) {
            throw std::invalid_argument("map transform returned a null record");
        }
        check_assignable(*mapped);
        out.push_back(std::move(mapped));
    }
    return Collection(std::move(out), schema_);
}

auto Collection::pick(const std::vector<std::string>& fields) const -> Collection {
    std::vector<RecordPtr> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        auto picked = record->with_fields(fields);
        if (!picked) {
            throw_error(picked.error());
        }
        out.push_back(std::move(*picked));
    }
    return Collection(std::move(out), schema_);
}

auto Collection::group_by(const FieldRef& field) const -> Groups {
    Groups groups;
    for (const auto& record : records_) {
        auto resolved = runtime::resolve(*record, field);
        if (!resolved) {
            throw_error(resolved.error());
        }
        groups.append(std::move(resolved->value), record);
    }
    spdlog::debug("group_by {}: {} records in {} groups", field.to_string(), records_.size(),
                  groups.size());
    return groups;
}

auto Collection::pluck(const FieldRef& field) const -> std::vector<Value> {
    std::vector<Value> out;
    out.reserve(records_.size());
    for (const auto& record : records_) {
        auto resolved = runtime::resolve(*record, field);
        if (!resolved) {
            throw_error(resolved.error());
        }
        out.push_back(std::move(resolved->value));
    }
    return out;
}

auto Collection::as_list(const Schema& schema) const -> std::vector<RecordPtr> {
    for (const auto& record : records_) {
        if (!record->schema()->is_assignable_to(schema)) {
            throw_error(not_assignable(*record, schema));
        }
    }
    return records_;
}

auto Collection::as_set() const -> std::unordered_set<RecordPtr> {
    return {records_.begin(), records_.end()};
}

}  // namespace sift::view
