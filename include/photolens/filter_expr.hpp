#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST for record attribute predicates.
 *
 * Compiled to Roaring bitmaps by metadata::MetadataStore and intersected with
 * the candidate set before ranking. Value-semantic and self-contained.
 */

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace photolens {

/** \brief A simple term equality predicate field == value. */
struct term {
  std::string field; /**< attribute name, e.g. "aspect_name" or "photo_path" */
  std::string value; /**< exact value */
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<term, and_t, or_t, not_t> node; /**< root node */
};

/** \brief Attribute names indexed for every photo record. */
inline constexpr const char* kFieldPhotoPath = "photo_path";
inline constexpr const char* kFieldAspectName = "aspect_name";

inline auto aspect_is(std::string aspect) -> filter_expr {
  return filter_expr{term{kFieldAspectName, std::move(aspect)}};
}

inline auto photo_is(std::string photo_path) -> filter_expr {
  return filter_expr{term{kFieldPhotoPath, std::move(photo_path)}};
}

inline auto all_of(std::vector<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::and_t{std::move(children)}};
}

} // namespace photolens
