#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "gallery/render_surface.hpp"
#include "type/gallery_types.hpp"

namespace photoreel {

using ItemList = std::shared_ptr<const std::vector<ItemEntry>>;

/// Arena slot for one section. The view is only set while the section is bound.
struct SectionSlot {
  SectionEntry                 entry_{};
  double                       height_            = 0.0;
  ItemList                     items_{};
  std::vector<LayoutRow>       rows_{};
  std::vector<QualityTier>     row_tiers_{};
  std::unique_ptr<SectionView> view_{};
  uint64_t                     generation_        = 0;
  bool                         request_in_flight_ = false;
  bool                         failed_            = false;
  std::string                  error_{};
};

/**
 * @brief Owns all sections, their height estimates and the lazy offset table.
 *
 * GetOffset(i) extends the prefix sum only up to i. SetHeight(i) rewinds the
 * computed prefix to i so later reads see the new height. Offsets stay
 * monotonic because heights are clamped to be non-negative.
 */
class SectionStore {
 public:
  using RewindListener = std::function<void(section_idx_t)>;

  void Install(std::vector<SectionEntry> sections, double header_height, double ideal_height,
               double content_width);
  void Reestimate(double ideal_height, double content_width);
  void Clear();

  auto Count() const -> section_idx_t { return static_cast<section_idx_t>(slots_.size()); }
  auto InRange(section_idx_t i) const -> bool { return i >= 0 && i < Count(); }
  auto Entry(section_idx_t i) const -> const SectionEntry& { return slots_.at(i).entry_; }
  auto Slot(section_idx_t i) -> SectionSlot& { return slots_.at(i); }
  auto Slot(section_idx_t i) const -> const SectionSlot& { return slots_.at(i); }

  auto HeaderHeight() const -> double { return header_height_; }
  auto Height(section_idx_t i) const -> double { return slots_.at(i).height_; }
  auto TotalHeight() const -> double { return total_height_; }
  auto GetOffset(section_idx_t i) const -> double;
  void SetHeight(section_idx_t i, double height);
  auto OffsetHead() const -> section_idx_t { return offset_head_; }
  void SetRewindListener(RewindListener listener) { rewind_listener_ = std::move(listener); }

  void SetItems(section_idx_t i, ItemList items);
  auto Items(section_idx_t i) const -> const std::vector<ItemEntry>*;
  auto SharedItems(section_idx_t i) const -> ItemList { return slots_.at(i).items_; }
  auto HasItems(section_idx_t i) const -> bool { return InRange(i) && slots_[i].items_ != nullptr; }
  void SetRows(section_idx_t i, std::vector<LayoutRow> rows);
  auto Rows(section_idx_t i) const -> const std::vector<LayoutRow>& { return slots_.at(i).rows_; }

  void Bind(section_idx_t i, std::unique_ptr<SectionView> view);
  void Release(section_idx_t i);
  void ReleaseAll();
  auto IsBound(section_idx_t i) const -> bool { return InRange(i) && slots_[i].view_ != nullptr; }
  auto View(section_idx_t i) const -> SectionView*;
  auto BoundCount() const -> int;

  void MarkRequested(section_idx_t i);
  void ClearRequest(section_idx_t i);
  auto IsRequestInFlight(section_idx_t i) const -> bool { return slots_.at(i).request_in_flight_; }
  void SetFailed(section_idx_t i, std::string message);
  auto Failed(section_idx_t i) const -> bool { return slots_.at(i).failed_; }
  auto NextGeneration(section_idx_t i) -> uint64_t { return ++slots_.at(i).generation_; }
  auto Generation(section_idx_t i) const -> uint64_t { return slots_.at(i).generation_; }

 private:
  std::vector<SectionSlot>    slots_{};
  double                      header_height_ = 0.0;
  double                      total_height_  = 0.0;

  // offsets_[k] is valid for every k <= offset_head_
  mutable std::vector<double> offsets_{};
  mutable section_idx_t       offset_head_   = 0;

  RewindListener              rewind_listener_{};
};
};  // namespace photoreel
