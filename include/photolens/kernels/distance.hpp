#pragma once

/** \file distance.hpp
 *  \brief Scalar distance kernels (L2^2, Inner Product, Cosine) and metric dispatch.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * Every metric is mapped to "lower is more similar" by score().
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

#include "photolens/error.hpp"

namespace photolens::kernels {

enum class metric : std::uint8_t { l2, cosine, ip };

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for better instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i+1] - pb[i+1];
    const float d2 = pa[i+2] - pb[i+2];
    const float d3 = pa[i+3] - pb[i+3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }
  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }
  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Cosine distance 1 - (a.b)/(|a||b|). A zero-norm side yields 1 (orthogonal). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) {
  const std::size_t n = a.size();
  float dot = 0.0f, na = 0.0f, nb = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    dot += a[i] * b[i];
    na += a[i] * a[i];
    nb += b[i] * b[i];
  }
  const float denom = std::sqrt(na) * std::sqrt(nb);
  if (denom == 0.0f) return 1.0f;
  return 1.0f - dot / denom;
}

/** \brief Ranking score for a metric; lower is more similar. */
inline float score(metric m, std::span<const float> a, std::span<const float> b) {
  switch (m) {
    case metric::l2: return l2_sq(a, b);
    case metric::cosine: return cosine_distance(a, b);
    case metric::ip: return -inner_product(a, b);
  }
  return l2_sq(a, b);
}

inline auto parse_metric(std::string_view s) -> std::expected<metric, core::error> {
  if (s == "l2") return metric::l2;
  if (s == "cosine") return metric::cosine;
  if (s == "ip") return metric::ip;
  return std::unexpected(core::error{core::error_code::config_invalid,
                                     "unknown metric", "kernels.distance"});
}

constexpr auto to_string(metric m) noexcept -> std::string_view {
  switch (m) {
    case metric::l2: return "l2";
    case metric::cosine: return "cosine";
    case metric::ip: return "ip";
  }
  return "l2";
}

} // namespace photolens::kernels
