#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sift {

/// A field on the record itself.
struct DirectField {
    std::string name;
    auto operator==(const DirectField&) const -> bool = default;
};

/// A chain of relation fields ending in a terminal field, e.g. Parent.Owner.Name.
struct RelationPath {
    std::vector<std::string> segments;
    auto operator==(const RelationPath&) const -> bool = default;
};

/// Reference to a field, either direct or through relations.
class FieldRef {
   public:
    using Node = std::variant<DirectField, RelationPath>;

    explicit FieldRef(DirectField field) : node_(std::move(field)) {}

    /// Throws std::invalid_argument when fewer than two segments are given.
    explicit FieldRef(RelationPath path);

    /// Parse a dotted path. "Name" yields a DirectField, "Parent.Name" a RelationPath.
    /// Throws std::invalid_argument on empty input or empty segments.
    FieldRef(std::string_view path);
    FieldRef(const char* path) : FieldRef(std::string_view(path)) {}
    FieldRef(const std::string& path) : FieldRef(std::string_view(path)) {}

    [[nodiscard]] static auto parse(std::string_view path) -> FieldRef { return FieldRef(path); }

    [[nodiscard]] auto node() const noexcept -> const Node& { return node_; }

    [[nodiscard]] auto is_direct() const noexcept -> bool {
        return std::holds_alternative<DirectField>(node_);
    }

    /// Name of the field on the record (direct) or of the first relation (path).
    [[nodiscard]] auto head() const -> const std::string&;

    /// Dotted text form.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const FieldRef&) const -> bool = default;

   private:
    Node node_;
};

}  // namespace sift
