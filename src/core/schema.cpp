#include <sift/core/schema.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace sift {

Schema::Schema(std::string name, std::vector<FieldDef> fields)
    : name_(std::move(name)), fields_(std::move(fields)) {
    if (name_.empty()) {
        throw std::invalid_argument("schema name must not be empty");
    }
    index_.reserve(fields_.size());
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        const auto& def = fields_[i];
        if (def.name.empty() || def.name.find('.') != std::string::npos) {
            throw std::invalid_argument(
                fmt::format("schema {}: invalid field name '{}'", name_, def.name));
        }
        if (!index_.emplace(def.name, i).second) {
            throw std::invalid_argument(
                fmt::format("schema {}: duplicate field '{}'", name_, def.name));
        }
    }
}

auto Schema::find_field(std::string_view name) const -> const FieldDef* {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return &fields_[it->second];
    }
    return nullptr;
}

auto Schema::field_index(std::string_view name) const -> std::optional<std::size_t> {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace sift
