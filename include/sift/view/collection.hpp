#pragma once

#include <sift/core/error.hpp>
#include <sift/core/field_ref.hpp>
#include <sift/core/record.hpp>
#include <sift/core/schema.hpp>
#include <sift/core/value.hpp>
#include <sift/match/predicate.hpp>
#include <sift/runtime/resolve.hpp>
#include <sift/view/extract.hpp>
#include <sift/view/groups.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <ranges>
#include <string>
#include <unordered_set>
#include <vector>

namespace sift::view {

/// An immutable view over a sequence of shared records.
///
/// Every operation builds a new Collection (or a plain sequence); the
/// backing vector of the source is never modified. Records themselves are
/// shared between views, except where pick() and map_*() produce new ones.
/// Errors raised while evaluating abort the whole operation.
class Collection {
   public:
    using Transform = std::function<RecordPtr(const RecordPtr&)>;
    using const_iterator = std::vector<RecordPtr>::const_iterator;

    Collection() = default;

    /// Copy `records` into a new view. When `schema` is given every record must
    /// be assignable to it (SchemaAssignabilityError). Null records are rejected
    /// with std::invalid_argument.
    [[nodiscard]] static auto of(std::vector<RecordPtr> records, SchemaPtr schema = nullptr)
        -> Collection;

    /// View over any range of records, e.g. a std::set or std::unordered_set.
    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, RecordPtr>
    [[nodiscard]] static auto of(const R& records, SchemaPtr schema = nullptr) -> Collection {
        return of(std::vector<RecordPtr>(std::ranges::begin(records), std::ranges::end(records)),
                  std::move(schema));
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return records_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return records_.empty(); }
    [[nodiscard]] auto schema() const noexcept -> const SchemaPtr& { return schema_; }

    [[nodiscard]] auto at(std::size_t idx) const -> const RecordPtr& { return records_.at(idx); }
    [[nodiscard]] auto begin() const noexcept -> const_iterator { return records_.cbegin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return records_.cend(); }

    /// Records matching `predicate`, in order.
    [[nodiscard]] auto filter(const match::Predicate& predicate) const -> Collection;

    /// Records not matching `predicate`, in order.
    [[nodiscard]] auto remove(const match::Predicate& predicate) const -> Collection;

    /// First record matching `predicate`, or nullptr.
    [[nodiscard]] auto find(const match::Predicate& predicate) const -> RecordPtr;

    /// Apply `transform` to every record.
    [[nodiscard]] auto map_all(const Transform& transform) const -> Collection;

    /// Apply `transform` to matching records; others pass through unchanged.
    [[nodiscard]] auto map_some(const match::Predicate& predicate, const Transform& transform) const
        -> Collection;

    /// New records carrying only `fields`; every other field is not loaded.
    [[nodiscard]] auto pick(const std::vector<std::string>& fields) const -> Collection;

    [[nodiscard]] auto group_by(const FieldRef& field) const -> Groups;

    template <Extractable T>
    [[nodiscard]] auto group_by_as(const FieldRef& field) const -> TypedGroups<T> {
        TypedGroups<T> groups;
        for (const auto& record : records_) {
            groups.append(extract_or_throw<T>(*record, field), record);
        }
        return groups;
    }

    /// Field values in view order; nulls are kept.
    [[nodiscard]] auto pluck(const FieldRef& field) const -> std::vector<Value>;

    template <Extractable T>
    [[nodiscard]] auto pluck_as(const FieldRef& field) const -> std::vector<std::optional<T>> {
        std::vector<std::optional<T>> out;
        out.reserve(records_.size());
        for (const auto& record : records_) {
            out.push_back(extract_or_throw<T>(*record, field));
        }
        return out;
    }

    [[nodiscard]] auto pluck_booleans(const FieldRef& field) const
        -> std::vector<std::optional<bool>> {
        return pluck_as<bool>(field);
    }
    [[nodiscard]] auto pluck_numbers(const FieldRef& field) const
        -> std::vector<std::optional<double>> {
        return pluck_as<double>(field);
    }
    [[nodiscard]] auto pluck_dates(const FieldRef& field) const
        -> std::vector<std::optional<Date>> {
        return pluck_as<Date>(field);
    }
    [[nodiscard]] auto pluck_datetimes(const FieldRef& field) const
        -> std::vector<std::optional<Timestamp>> {
        return pluck_as<Timestamp>(field);
    }
    [[nodiscard]] auto pluck_ids(const FieldRef& field) const -> std::vector<std::optional<Id>> {
        return pluck_as<Id>(field);
    }
    [[nodiscard]] auto pluck_texts(const FieldRef& field) const
        -> std::vector<std::optional<std::string>> {
        return pluck_as<std::string>(field);
    }

    [[nodiscard]] auto as_list() const -> std::vector<RecordPtr> { return records_; }

    /// Records narrowed to `schema`; SchemaAssignabilityError if any is not an instance.
    [[nodiscard]] auto as_list(const Schema& schema) const -> std::vector<RecordPtr>;

    /// Distinct records by identity.
    [[nodiscard]] auto as_set() const -> std::unordered_set<RecordPtr>;

   private:
    Collection(std::vector<RecordPtr> records, SchemaPtr schema)
        : records_(std::move(records)), schema_(std::move(schema)) {}

    template <Extractable T>
    [[nodiscard]] static auto extract_or_throw(const Record& record, const FieldRef& field)
        -> std::optional<T> {
        auto resolved = runtime::resolve(record, field);
        if (!resolved) {
            throw_error(resolved.error());
        }
        auto value = extract_as<T>(resolved->value);
        if (!value) {
            throw_error(value.error());
        }
        return std::move(*value);
    }

    void check_assignable(const Record& record) const;

    std::vector<RecordPtr> records_;
    SchemaPtr schema_;
};

}  // namespace sift::view
