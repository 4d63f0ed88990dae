#include "photolens/index/entry_id.hpp"

namespace photolens::index {

auto make_entry_id(std::string_view photo_path, std::string_view aspect_name) -> std::string {
  static constexpr char kHex[] = "0123456789abcdef";
  std::uint64_t h = entry_hash(photo_path, aspect_name);
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[h & 0xF];
    h >>= 4;
  }
  return out;
}

} // namespace photolens::index
