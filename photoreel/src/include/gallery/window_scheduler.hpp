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

#pragma once

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "app/url_resolver.hpp"
#include "config/gallery_config.hpp"
#include "gallery/render_surface.hpp"
#include "gallery/section_store.hpp"

namespace photoreel {

/// A finished partition waiting in the mailbox for the next frame.
struct LayoutResult {
  section_idx_t          section_    = 0;
  uint64_t               generation_ = 0;
  ItemList               items_{};
  std::vector<LayoutRow> rows_{};
};

/**
 * @brief Keeps the materialized band of sections around the viewport.
 *
 * Sections are created when they come within inner_radius viewport heights and
 * destroyed only once they leave outer_radius, so small scroll reversals never
 * thrash views. Layout results are applied in Tick(), at most once per frame.
 */
class WindowScheduler {
 public:
  using FragmentRequester = std::function<void(section_idx_t, fragment_ref_t, uint64_t)>;
  using FrameRequester    = std::function<void()>;
  using LayoutListener    = std::function<void(section_idx_t)>;

  WindowScheduler(SectionStore& store, RenderSurface& surface, SectionViewHost& host,
                  const GalleryConfig& config, UrlResolver resolver);

  void SetFragmentRequester(FragmentRequester requester) { requester_ = std::move(requester); }
  void SetFrameRequester(FrameRequester requester) { frame_requester_ = std::move(requester); }
  void SetLayoutListener(LayoutListener listener) { layout_listener_ = std::move(listener); }

  void Reset();
  void SetIdealHeight(double ideal_height) { ideal_height_ = ideal_height; }
  auto IdealHeight() const -> double { return ideal_height_; }

  void Tick();

  void Receive(section_idx_t section, uint64_t generation, ItemList items);
  void Fail(section_idx_t section, uint64_t generation, const QString& message);
  void Retry(section_idx_t section);
  void Relayout();
  void ScrollTo(section_idx_t section, int item);

  auto Band() const -> SectionBand { return band_; }
  auto MailboxSize() const -> size_t { return mailbox_.size(); }
  auto LowWaterMark() const -> section_idx_t { return low_water_mark_; }

  /// [top, bottom] of the band radius viewport heights around scroll_top.
  static auto WindowOf(double scroll_top, double viewport_height, double radius)
      -> std::pair<double, double>;

 private:
  void                 CreateSection(section_idx_t i);
  void                 DestroySection(section_idx_t i);
  void                 Request(section_idx_t i);
  void                 Enqueue(section_idx_t i, uint64_t generation, ItemList items);
  auto                 Apply(LayoutResult& result) -> bool;
  auto                 BuildRowContent(const std::vector<LayoutRow>& rows,
                                       const std::vector<ItemEntry>& items) const
      -> std::vector<RowContent>;

  SectionStore&             store_;
  RenderSurface&            surface_;
  SectionViewHost&          host_;
  const GalleryConfig&      config_;
  UrlResolver               resolver_;

  FragmentRequester         requester_{};
  FrameRequester            frame_requester_{};
  LayoutListener            layout_listener_{};

  SectionBand               band_{};
  std::vector<LayoutResult> mailbox_{};
  double                    ideal_height_   = 0.0;
  section_idx_t             low_water_mark_ = 0;
};
};  // namespace photoreel
