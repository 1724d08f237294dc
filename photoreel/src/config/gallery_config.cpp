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

#include "config/gallery_config.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <stdexcept>

namespace photoreel {
namespace {
template <typename T>
void ReadField(const nlohmann::json& j, const char* key, T& out) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::format("Config field '{}' has the wrong type: {}", key, e.what()));
  }
}
}  // namespace

auto GalleryConfig::IdealHeightFor(double content_width) const -> double {
  return std::min(max_ideal_height_, content_width / ideal_height_divisor_);
}

void GalleryConfig::Validate() const {
  if (header_height_ < 0.0) {
    throw std::runtime_error("header_height must not be negative");
  }
  if (max_ideal_height_ <= 0.0 || ideal_height_divisor_ <= 0.0) {
    throw std::runtime_error("ideal height parameters must be positive");
  }
  if (partition_.shrink_ratio_ <= 0.0 || partition_.shrink_ratio_ > 1.0) {
    throw std::runtime_error("shrink_ratio must be in (0, 1]");
  }
  if (partition_.stretch_ratio_ < 1.0 || partition_.safe_stretch_ratio_ < partition_.stretch_ratio_) {
    throw std::runtime_error("stretch ratios must satisfy 1 <= stretch <= safe_stretch");
  }
  if (inner_radius_ < 0.0 || outer_radius_ < inner_radius_) {
    throw std::runtime_error(std::format("outer_radius ({}) must be >= inner_radius ({}) >= 0",
                                         outer_radius_, inner_radius_));
  }
  if (quality_radius_ < 0.0 || velocity_factor_ < 0.0) {
    throw std::runtime_error("quality parameters must not be negative");
  }
  if (frame_interval_ms_ < 0 || resize_debounce_ms_ <= 0 || quality_debounce_ms_ <= 0) {
    throw std::runtime_error("debounce intervals must be positive");
  }
  if (drag_fraction_ <= 0.0 || edge_margin_ < 0.0 || edge_margin_ > 0.5) {
    throw std::runtime_error("fullscreen gesture parameters are out of range");
  }
}

auto GalleryConfigFromJson(const nlohmann::json& j) -> GalleryConfig {
  if (!j.is_object()) {
    throw std::runtime_error("Gallery config must be a JSON object");
  }
  GalleryConfig config;
  ReadField(j, "header_height", config.header_height_);
  ReadField(j, "max_ideal_height", config.max_ideal_height_);
  ReadField(j, "ideal_height_divisor", config.ideal_height_divisor_);
  ReadField(j, "shrink_ratio", config.partition_.shrink_ratio_);
  ReadField(j, "stretch_ratio", config.partition_.stretch_ratio_);
  ReadField(j, "safe_stretch_ratio", config.partition_.safe_stretch_ratio_);
  ReadField(j, "outer_radius", config.outer_radius_);
  ReadField(j, "inner_radius", config.inner_radius_);
  ReadField(j, "quality_radius", config.quality_radius_);
  ReadField(j, "velocity_factor", config.velocity_factor_);
  ReadField(j, "frame_interval_ms", config.frame_interval_ms_);
  ReadField(j, "resize_debounce_ms", config.resize_debounce_ms_);
  ReadField(j, "quality_debounce_ms", config.quality_debounce_ms_);
  ReadField(j, "resize_threshold_px", config.resize_threshold_px_);
  ReadField(j, "drag_fraction", config.drag_fraction_);
  ReadField(j, "edge_margin", config.edge_margin_);
  ReadField(j, "anchor_scroll", config.anchor_scroll_);
  config.Validate();
  return config;
}

auto GalleryConfigToJson(const GalleryConfig& config) -> nlohmann::json {
  return {
      {"header_height", config.header_height_},
      {"max_ideal_height", config.max_ideal_height_},
      {"ideal_height_divisor", config.ideal_height_divisor_},
      {"shrink_ratio", config.partition_.shrink_ratio_},
      {"stretch_ratio", config.partition_.stretch_ratio_},
      {"safe_stretch_ratio", config.partition_.safe_stretch_ratio_},
      {"outer_radius", config.outer_radius_},
      {"inner_radius", config.inner_radius_},
      {"quality_radius", config.quality_radius_},
      {"velocity_factor", config.velocity_factor_},
      {"frame_interval_ms", config.frame_interval_ms_},
      {"resize_debounce_ms", config.resize_debounce_ms_},
      {"quality_debounce_ms", config.quality_debounce_ms_},
      {"resize_threshold_px", config.resize_threshold_px_},
      {"drag_fraction", config.drag_fraction_},
      {"edge_margin", config.edge_margin_},
      {"anchor_scroll", config.anchor_scroll_},
  };
}

auto LoadGalleryConfig(const std::filesystem::path& path) -> GalleryConfig {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error(std::format("Cannot open gallery config {}", path.string()));
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::format("Malformed gallery config {}: {}", path.string(), e.what()));
  }
  return GalleryConfigFromJson(j);
}
};  // namespace photoreel
