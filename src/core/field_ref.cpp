#include <sift/core/field_ref.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <stdexcept>

namespace sift {

namespace {

auto split_path(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        auto dot = path.find('.', start);
        auto segment = path.substr(start, dot == std::string_view::npos ? path.size() - start
                                                                         : dot - start);
        if (segment.empty()) {
            throw std::invalid_argument(fmt::format("invalid field path '{}'", path));
        }
        segments.emplace_back(segment);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return segments;
}

}  // namespace

FieldRef::FieldRef(RelationPath path) : node_(std::move(path)) {
    const auto& segments = std::get<RelationPath>(node_).segments;
    if (segments.size() < 2) {
        throw std::invalid_argument("relation path needs a relation and a terminal field");
    }
    for (const auto& s : segments) {
        if (s.empty()) {
            throw std::invalid_argument("relation path has an empty segment");
        }
    }
}

FieldRef::FieldRef(std::string_view path) : node_(DirectField{}) {
    auto segments = split_path(path);
    if (segments.size() == 1) {
        node_ = DirectField{.name = std::move(segments.front())};
    } else {
        node_ = RelationPath{.segments = std::move(segments)};
    }
}

auto FieldRef::head() const -> const std::string& {
    if (const auto* direct = std::get_if<DirectField>(&node_)) {
        return direct->name;
    }
    return std::get<RelationPath>(node_).segments.front();
}

auto FieldRef::to_string() const -> std::string {
    if (const auto* direct = std::get_if<DirectField>(&node_)) {
        return direct->name;
    }
    return fmt::format("{}", fmt::join(std::get<RelationPath>(node_).segments, "."));
}

}  // namespace sift
