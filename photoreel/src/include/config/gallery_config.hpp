#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

#include "layout/row_partitioner.hpp"

namespace photoreel {

/// Tunables of the gallery engine. Band radii are multiples of the viewport height.
struct GalleryConfig {
  double          header_height_        = 50.0;
  double          max_ideal_height_     = 350.0;
  double          ideal_height_divisor_ = 3.0;
  PartitionParams partition_{};

  double          outer_radius_         = 6.0;
  double          inner_radius_         = 5.0;
  double          quality_radius_       = 1.0;
  // Scroll speed (px/ms) above which quality evaluation is postponed, per px of ideal height
  double          velocity_factor_      = 0.015;

  int             frame_interval_ms_    = 16;
  int             resize_debounce_ms_   = 500;
  int             quality_debounce_ms_  = 200;
  double          resize_threshold_px_  = 1.0;

  double          drag_fraction_        = 0.1;
  double          edge_margin_          = 0.25;

  bool            anchor_scroll_        = true;

  auto            IdealHeightFor(double content_width) const -> double;
  void            Validate() const;
};

auto GalleryConfigFromJson(const nlohmann::json& j) -> GalleryConfig;
auto GalleryConfigToJson(const GalleryConfig& config) -> nlohmann::json;
auto LoadGalleryConfig(const std::filesystem::path& path) -> GalleryConfig;
};  // namespace photoreel
