//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "wire/fragment_codec.hpp"

#include <format>
#include <stdexcept>

namespace photoreel {
namespace {
auto Parse(std::string_view text) -> nlohmann::json {
  try {
    return nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::format("Malformed fragment payload: {}", e.what()));
  }
}

void ExpectTuple(const nlohmann::json& entry, size_t arity, size_t index, const char* what) {
  if (!entry.is_array() || entry.size() != arity) {
    throw std::runtime_error(
        std::format("{} entry {} must be an array of {} elements", what, index, arity));
  }
}

// File ids are opaque; integral ids are kept in their decimal spelling.
auto ItemIdOf(const nlohmann::json& value, size_t index) -> item_id_t {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return value.dump();
  }
  throw std::runtime_error(std::format("Section entry {} has a non-scalar file id", index));
}
}  // namespace

auto FragmentCodec::ListingFromJson(const nlohmann::json& j) -> std::vector<SectionEntry> {
  if (!j.is_array()) {
    throw std::runtime_error("Listing must be a JSON array");
  }
  std::vector<SectionEntry> sections;
  sections.reserve(j.size());
  for (size_t i = 0; i < j.size(); ++i) {
    const auto& entry = j[i];
    ExpectTuple(entry, 3, i, "Listing");
    try {
      SectionEntry section;
      section.timestamp_    = entry[0].get<timestamp_t>();
      section.fragment_ref_ = entry[1].get<fragment_ref_t>();
      section.item_count_   = entry[2].get<size_t>();
      sections.push_back(section);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::format("Listing entry {} is malformed: {}", i, e.what()));
    }
  }
  return sections;
}

auto FragmentCodec::SectionFromJson(const nlohmann::json& j) -> std::vector<ItemEntry> {
  if (!j.is_array()) {
    throw std::runtime_error("Section fragment must be a JSON array");
  }
  std::vector<ItemEntry> items;
  items.reserve(j.size());
  for (size_t i = 0; i < j.size(); ++i) {
    const auto& entry = j[i];
    ExpectTuple(entry, 4, i, "Section");
    try {
      ItemEntry item;
      item.timestamp_ = entry[0].get<timestamp_t>();
      item.item_id_   = ItemIdOf(entry[1], i);
      item.width_     = entry[2].get<int>();
      item.height_    = entry[3].get<int>();
      items.push_back(std::move(item));
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::format("Section entry {} is malformed: {}", i, e.what()));
    }
  }
  return items;
}

auto FragmentCodec::ParseListing(std::string_view text) -> std::vector<SectionEntry> {
  return ListingFromJson(Parse(text));
}

auto FragmentCodec::ParseSection(std::string_view text) -> std::vector<ItemEntry> {
  return SectionFromJson(Parse(text));
}

auto FragmentCodec::ListingToJson(const std::vector<SectionEntry>& sections) -> nlohmann::json {
  auto j = nlohmann::json::array();
  for (const auto& s : sections) {
    j.push_back(nlohmann::json::array({s.timestamp_, s.fragment_ref_, s.item_count_}));
  }
  return j;
}

auto FragmentCodec::SectionToJson(const std::vector<ItemEntry>& items) -> nlohmann::json {
  auto j = nlohmann::json::array();
  for (const auto& item : items) {
    j.push_back(nlohmann::json::array({item.timestamp_, item.item_id_, item.width_, item.height_}));
  }
  return j;
}
};  // namespace photoreel
