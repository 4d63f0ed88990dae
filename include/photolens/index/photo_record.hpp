#pragma once

/** \file photo_record.hpp
 *  \brief Record and result value types of the aspect index.
 */

#include <string>
#include <vector>

namespace photolens::index {

/** \brief One (photo, aspect) entry. Replaced wholesale on upsert. */
struct photo_record {
  std::string entry_id;          /**< derived from (photo_path, aspect_name) */
  std::string photo_path;
  std::string aspect_name;
  std::string description;       /**< generated text */
  std::vector<float> embedding;  /**< store-uniform dimensionality */
};

/** \brief Ranked query hit; ordered ascending by distance. */
struct search_result {
  std::string photo_path;
  std::string aspect_name;
  float distance{};              /**< lower is more similar */
  std::string description;
};

} // namespace photolens::index
