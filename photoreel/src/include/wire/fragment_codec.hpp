#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

#include "type/gallery_types.hpp"

namespace photoreel {

/**
 * @brief Decoders for the two fragment payloads.
 *
 * Listing: [[timestamp, fragment_id, length], ...]
 * Section: [[timestamp, file_id, width, height], ...]
 *
 * Both throw std::runtime_error on malformed input; nothing partial is returned.
 */
class FragmentCodec {
 public:
  static auto ParseListing(std::string_view text) -> std::vector<SectionEntry>;
  static auto ParseSection(std::string_view text) -> std::vector<ItemEntry>;

  static auto ListingFromJson(const nlohmann::json& j) -> std::vector<SectionEntry>;
  static auto SectionFromJson(const nlohmann::json& j) -> std::vector<ItemEntry>;

  static auto ListingToJson(const std::vector<SectionEntry>& sections) -> nlohmann::json;
  static auto SectionToJson(const std::vector<ItemEntry>& items) -> nlohmann::json;
};
};  // namespace photoreel
