#pragma once

/// Convenience umbrella header for the Sift library.

#include <sift/core/error.hpp>
#include <sift/core/field_ref.hpp>
#include <sift/core/record.hpp>
#include <sift/core/schema.hpp>
#include <sift/core/value.hpp>
#include <sift/match/predicate.hpp>
#include <sift/runtime/compare.hpp>
#include <sift/runtime/resolve.hpp>
#include <sift/view/collection.hpp>
#include <sift/view/extract.hpp>
#include <sift/view/groups.hpp>
