#include "photolens/image/preprocessor.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "photolens/core/log.hpp"
#include "photolens/image/base64.hpp"

namespace photolens::image {

namespace {

constexpr const char* kComponent = "image.preprocessor";

auto read_error(std::string msg) -> core::error {
  return core::error{core::error_code::image_read, std::move(msg), kComponent};
}

auto to_8bit(const cv::Mat& in) -> cv::Mat {
  if (in.depth() == CV_8U) return in;
  cv::Mat out;
  switch (in.depth()) {
    case CV_16U: in.convertTo(out, CV_8U, 1.0 / 257.0); break;
    case CV_32F:
    case CV_64F: in.convertTo(out, CV_8U, 255.0); break;
    default: in.convertTo(out, CV_8U); break;
  }
  return out;
}

// OpenCV keeps channels in BGR order; the encoded PNG is plain RGB.
auto to_colour(const cv::Mat& in) -> std::expected<cv::Mat, core::error> {
  cv::Mat out;
  switch (in.channels()) {
    case 3: return in;
    case 1: cv::cvtColor(in, out, cv::COLOR_GRAY2BGR); return out;
    case 4: cv::cvtColor(in, out, cv::COLOR_BGRA2BGR); return out;
    default: return std::unexpected(read_error("unsupported channel count " + std::to_string(in.channels())));
  }
}

auto fit(const cv::Mat& in, std::uint32_t max_edge) -> cv::Mat {
  const int longest = std::max(in.cols, in.rows);
  if (max_edge == 0 || longest <= static_cast<int>(max_edge)) return in;
  const double scale = static_cast<double>(max_edge) / static_cast<double>(longest);
  const int w = std::max(1, static_cast<int>(std::lround(in.cols * scale)));
  const int h = std::max(1, static_cast<int>(std::lround(in.rows * scale)));
  cv::Mat out;
  cv::resize(in, out, cv::Size(std::min(w, static_cast<int>(max_edge)), std::min(h, static_cast<int>(max_edge))),
             0, 0, cv::INTER_AREA);
  return out;
}

} // namespace

auto normalize(std::span<const std::uint8_t> raw, const preprocess_options& opts)
    -> std::expected<canonical_image, core::error> {
  if (raw.empty()) return std::unexpected(read_error("empty image data"));
  try {
    const cv::Mat buf(1, static_cast<int>(raw.size()), CV_8UC1, const_cast<std::uint8_t*>(raw.data()));
    cv::Mat decoded = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) return std::unexpected(read_error("cannot decode image"));

    auto colour = to_colour(to_8bit(decoded));
    if (!colour) return std::unexpected(colour.error());
    cv::Mat img = fit(*colour, opts.max_edge);

    std::vector<std::uint8_t> png;
    if (!cv::imencode(".png", img, png)) return std::unexpected(read_error("png encode failed"));

    core::get_logger(core::kLogImage)->debug("normalized {}x{} -> {}x{} ({} png bytes)", decoded.cols, decoded.rows,
                                             img.cols, img.rows, png.size());
    return canonical_image{base64_encode(png), img.cols, img.rows};
  } catch (const cv::Exception& e) {
    return std::unexpected(read_error(std::string("opencv: ") + e.what()));
  }
}

auto normalize_file(const std::filesystem::path& path, const preprocess_options& opts)
    -> std::expected<canonical_image, core::error> {
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) return std::unexpected(read_error("cannot open " + path.string()));
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::unexpected(read_error("cannot read " + path.string()));
  auto img = normalize(bytes, opts);
  if (!img) {
    auto e = img.error();
    e.message = path.filename().string() + ": " + e.message;
    return std::unexpected(std::move(e));
  }
  return img;
}

} // namespace photolens::image
