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

#include "gallery/window_scheduler.hpp"

#include <QtGlobal>

#include <algorithm>

#include "layout/row_partitioner.hpp"

namespace photoreel {

WindowScheduler::WindowScheduler(SectionStore& store, RenderSurface& surface,
                                 SectionViewHost& host, const GalleryConfig& config,
                                 UrlResolver resolver)
    : store_(store), surface_(surface), host_(host), config_(config), resolver_(std::move(resolver)) {
  store_.SetRewindListener([this](section_idx_t i) {
    if (low_water_mark_ > i) {
      low_water_mark_ = i;
    }
  });
}

void WindowScheduler::Reset() {
  band_           = {};
  low_water_mark_ = 0;
  mailbox_.clear();
}

auto WindowScheduler::WindowOf(double scroll_top, double viewport_height, double radius)
    -> std::pair<double, double> {
  return {scroll_top - radius * viewport_height, scroll_top + (1.0 + radius) * viewport_height};
}

void WindowScheduler::Tick() {
  const section_idx_t count = store_.Count();
  if (count == 0) {
    surface_.SetContentHeight(0.0);
    return;
  }

  const double scroll_top = surface_.ScrollOffset();
  const double vh         = surface_.ViewportHeight();

  auto [i, j]             = band_;

  const auto [outer_top, outer_bottom] = WindowOf(scroll_top, vh, config_.outer_radius_);
  while (j > 0 && store_.GetOffset(j - 1) > outer_bottom) {
    DestroySection(--j);
  }
  while (i < count && store_.GetOffset(i + 1) < outer_top) {
    DestroySection(i++);
  }

  const auto [inner_top, inner_bottom] = WindowOf(scroll_top, vh, config_.inner_radius_);
  while (i > 0 && store_.GetOffset(i) > inner_top) {
    --i;
  }
  while (j < count && store_.GetOffset(j) < inner_bottom) {
    ++j;
  }
  band_ = {i, j};

  // Anchor on the section under the top edge of the viewport.
  section_idx_t sentinel = i;
  while (sentinel < j && store_.GetOffset(sentinel + 1) < scroll_top) {
    ++sentinel;
  }
  double fraction = 0.0;
  if (sentinel < count && store_.Height(sentinel) > 0.0) {
    fraction = (scroll_top - store_.GetOffset(sentinel)) / store_.Height(sentinel);
  }
  low_water_mark_ = j;

  auto pending    = std::move(mailbox_);
  mailbox_.clear();
  for (auto& result : pending) {
    Apply(result);
  }

  for (section_idx_t k = i; k < j; ++k) {
    if (!store_.IsBound(k)) {
      CreateSection(k);
    } else {
      store_.View(k)->SetTop(store_.GetOffset(k));
    }
  }

  // Grow the scroll range first; hosts clamp scroll requests to it.
  surface_.SetContentHeight(store_.TotalHeight());

  if (config_.anchor_scroll_ && sentinel < count && low_water_mark_ <= sentinel && fraction > 0.0) {
    const double anchored = store_.GetOffset(sentinel) + fraction * store_.Height(sentinel);
    if (anchored != scroll_top) {
      surface_.ScrollToOffset(anchored);
    }
  }
}

void WindowScheduler::CreateSection(section_idx_t i) {
  auto view = surface_.CreateSectionView(i, store_.Entry(i), host_);
  if (!view) {
    qWarning("Host surface refused a view for section %d", i);
    return;
  }
  view->SetTop(store_.GetOffset(i));
  view->ShowPlaceholder(std::max(0.0, store_.Height(i) - store_.HeaderHeight()));
  store_.Bind(i, std::move(view));

  if (store_.HasItems(i)) {
    Enqueue(i, store_.NextGeneration(i), store_.SharedItems(i));
  } else if (!store_.IsRequestInFlight(i)) {
    Request(i);
  }
}

void WindowScheduler::DestroySection(section_idx_t i) {
  if (store_.IsBound(i)) {
    store_.Release(i);
  }
}

void WindowScheduler::Request(section_idx_t i) {
  store_.MarkRequested(i);
  const auto generation = store_.NextGeneration(i);
  if (requester_) {
    requester_(i, store_.Entry(i).fragment_ref_, generation);
  }
}

void WindowScheduler::Enqueue(section_idx_t i, uint64_t generation, ItemList items) {
  auto rows = RowPartitioner::Partition(*items, surface_.ContentWidth(), ideal_height_,
                                        config_.partition_);
  mailbox_.push_back(LayoutResult{i, generation, std::move(items), std::move(rows)});
  if (frame_requester_) {
    frame_requester_();
  }
}

void WindowScheduler::Receive(section_idx_t section, uint64_t generation, ItemList items) {
  if (!store_.InRange(section) || !items) {
    return;
  }
  store_.ClearRequest(section);
  if (!store_.HasItems(section)) {
    store_.SetItems(section, items);
  }
  if (!store_.IsBound(section) || store_.Generation(section) != generation) {
    return;
  }
  Enqueue(section, generation, std::move(items));
}

void WindowScheduler::Fail(section_idx_t section, uint64_t generation, const QString& message) {
  if (!store_.InRange(section) || store_.Generation(section) != generation) {
    return;
  }
  store_.SetFailed(section, message.toStdString());
  if (auto* view = store_.View(section)) {
    view->ShowError(std::max(0.0, store_.Height(section) - store_.HeaderHeight()), message);
  }
}

void WindowScheduler::Retry(section_idx_t section) {
  if (!store_.IsBound(section) || store_.IsRequestInFlight(section)) {
    return;
  }
  store_.View(section)->ShowPlaceholder(
      std::max(0.0, store_.Height(section) - store_.HeaderHeight()));
  Request(section);
}

void WindowScheduler::Relayout() {
  for (section_idx_t k = band_.low_; k < band_.high_; ++k) {
    if (store_.IsBound(k) && store_.HasItems(k)) {
      Enqueue(k, store_.NextGeneration(k), store_.SharedItems(k));
    }
  }
}

auto WindowScheduler::Apply(LayoutResult& result) -> bool {
  const auto i = result.section_;
  if (!store_.IsBound(i) || store_.Generation(i) != result.generation_) {
    return false;
  }

  store_.SetItems(i, result.items_);
  auto* view = store_.View(i);
  view->SetRows(BuildRowContent(result.rows_, *result.items_));

  const double height = store_.HeaderHeight() + RowPartitioner::ContentHeight(result.rows_);
  store_.SetRows(i, std::move(result.rows_));
  store_.SetHeight(i, height);

  if (layout_listener_) {
    layout_listener_(i);
  }
  return true;
}

auto WindowScheduler::BuildRowContent(const std::vector<LayoutRow>& rows,
                                      const std::vector<ItemEntry>& items) const
    -> std::vector<RowContent> {
  std::vector<RowContent> content;
  content.reserve(rows.size());
  for (const auto& row : rows) {
    RowContent rc;
    rc.height_ = row.height_;
    rc.tiles_.reserve(row.Size());
    for (size_t k = row.start_; k < row.end_; ++k) {
      const auto& item = items[k];
      TileContent tile;
      tile.index_   = static_cast<int>(k);
      tile.item_id_ = item.item_id_;
      tile.width_   = row.widths_[k - row.start_];
      tile.height_  = row.height_;
      tile.locator_ = resolver_ ? resolver_(item.item_id_, QualityTier::Small) : QString();
      rc.tiles_.push_back(std::move(tile));
    }
    content.push_back(std::move(rc));
  }
  return content;
}

void WindowScheduler::ScrollTo(section_idx_t section, int item) {
  if (!store_.InRange(section)) {
    return;
  }
  const auto& rows = store_.Rows(section);
  double      target;
  if (!store_.IsBound(section) || rows.empty()) {
    const auto count = std::max<size_t>(1, store_.Entry(section).item_count_);
    target           = store_.GetOffset(section) +
             store_.Height(section) * static_cast<double>(std::max(0, item)) /
                 static_cast<double>(count);
  } else {
    const auto index   = static_cast<size_t>(std::max(0, item));
    double     row_top = store_.GetOffset(section) + store_.HeaderHeight();
    size_t     k       = 0;
    while (k + 1 < rows.size() && !rows[k].Contains(index)) {
      row_top += rows[k].height_;
      ++k;
    }
    target = row_top - (surface_.ViewportHeight() - rows[k].height_) / 2.0;
  }
  surface_.ScrollToOffset(target);
  if (frame_requester_) {
    frame_requester_();
  }
}
};  // namespace photoreel
