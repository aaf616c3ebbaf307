#pragma once

#include <sift/core/error.hpp>
#include <sift/core/record.hpp>

#include <expected>

namespace sift::match {

/// Partial equality against a prototype record.
///
/// A target matches when every field populated on the prototype holds an
/// equal value on the target. Unpopulated prototype fields are ignored;
/// populated relations are matched recursively.
class RecordMatch {
   public:
    /// Throws std::invalid_argument on a null prototype.
    explicit RecordMatch(RecordPtr prototype);

    [[nodiscard]] auto prototype() const noexcept -> const RecordPtr& { return prototype_; }

    [[nodiscard]] auto evaluate(const Record& record) const -> std::expected<bool, Error>;

    [[nodiscard]] auto matches(const Record& record) const -> bool;

   private:
    RecordPtr prototype_;
};

}  // namespace sift::match
