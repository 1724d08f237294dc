#pragma once

#include <cstddef>
#include <vector>

#include "type/type.hpp"

namespace photoreel {

/// One entry of the head listing.
struct SectionEntry {
  timestamp_t    timestamp_    = 0;
  size_t         item_count_   = 0;
  fragment_ref_t fragment_ref_ = 0;
};

/// One item of a section fragment. Immutable once fetched.
struct ItemEntry {
  item_id_t   item_id_{};
  int         width_     = 0;
  int         height_    = 0;
  timestamp_t timestamp_ = 0;

  auto        Aspect() const -> double {
    if (width_ <= 0 || height_ <= 0) {
      return 1.0;
    }
    return static_cast<double>(width_) / static_cast<double>(height_);
  }
};

/// A justified row: items [start_, end_) of one section, all drawn at height_.
struct LayoutRow {
  size_t              start_  = 0;
  size_t              end_    = 0;
  double              height_ = 0.0;
  std::vector<double> widths_{};

  auto                Size() const -> size_t { return end_ - start_; }
  auto                Contains(size_t index) const -> bool { return index >= start_ && index < end_; }
};

/// (section, item) address. item_ == kHeader addresses the section header.
struct ItemLocation {
  static constexpr int kHeader  = -1;

  section_idx_t        section_ = 0;
  int                  item_    = kHeader;

  auto                 IsHeader() const -> bool { return item_ == kHeader; }
  auto                 operator==(const ItemLocation& other) const -> bool = default;
};

/// Half-open range of materialized sections.
struct SectionBand {
  section_idx_t low_  = 0;
  section_idx_t high_ = 0;

  auto          Contains(section_idx_t i) const -> bool { return i >= low_ && i < high_; }
  auto          Empty() const -> bool { return low_ >= high_; }
};
};  // namespace photoreel
