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

#include "gallery/quality_scheduler.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "gallery/window_scheduler.hpp"

namespace photoreel {

QualityScheduler::QualityScheduler(SectionStore& store, RenderSurface& surface,
                                   const GalleryConfig& config, UrlResolver resolver,
                                   BandProvider band_provider)
    : store_(store),
      surface_(surface),
      config_(config),
      resolver_(std::move(resolver)),
      band_provider_(std::move(band_provider)),
      debouncer_(config.quality_debounce_ms_, [this]() { Evaluate(); }) {}

void QualityScheduler::Reset(double scroll_top, qint64 now_ms) {
  debouncer_.Cancel();
  last_scroll_   = scroll_top;
  last_time_ms_  = now_ms;
  last_velocity_ = 0.0;
}

void QualityScheduler::OnTick(double scroll_top, qint64 now_ms, double ideal_height) {
  const double dy = scroll_top - last_scroll_;
  const auto   dt = now_ms - last_time_ms_;
  if (dt > 0) {
    last_velocity_ = dy / static_cast<double>(dt);
  } else {
    last_velocity_ = dy == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
  }
  last_scroll_  = scroll_top;
  last_time_ms_ = now_ms;

  if (std::abs(last_velocity_) > ideal_height * config_.velocity_factor_) {
    debouncer_.Trigger();
  }
  if (!debouncer_.IsPending()) {
    Evaluate();
  }
}

void QualityScheduler::Evaluate() {
  const auto band = band_provider_ ? band_provider_() : SectionBand{};
  for (section_idx_t i = band.low_; i < band.high_; ++i) {
    EvaluateSection(i);
  }
}

// Visible band of section i in section-relative coordinates.
auto QualityScheduler::RelativeWindow(section_idx_t i) const -> std::pair<double, double> {
  const double rel_top = surface_.ScrollOffset() - store_.GetOffset(i);
  return WindowScheduler::WindowOf(rel_top, surface_.ViewportHeight(), config_.quality_radius_);
}

auto QualityScheduler::TierFor(double row_top, double row_height,
                               const std::pair<double, double>& window) -> QualityTier {
  const bool show = row_top < window.second && row_top + row_height > window.first;
  return show ? QualityTier::Medium : QualityTier::Small;
}

auto QualityScheduler::DesiredTier(section_idx_t i, size_t row) const -> QualityTier {
  const auto& rows = store_.Rows(i);
  if (row >= rows.size()) {
    throw std::out_of_range("QualityScheduler::DesiredTier row out of range");
  }
  double row_top = store_.HeaderHeight();
  for (size_t k = 0; k < row; ++k) {
    row_top += rows[k].height_;
  }
  return TierFor(row_top, rows[row].height_, RelativeWindow(i));
}

void QualityScheduler::EvaluateSection(section_idx_t i) {
  if (!store_.IsBound(i)) {
    return;
  }
  auto&      slot    = store_.Slot(i);
  const auto window  = RelativeWindow(i);

  double     row_top = store_.HeaderHeight();
  for (size_t k = 0; k < slot.rows_.size(); ++k) {
    const auto& row     = slot.rows_[k];
    const auto  desired = TierFor(row_top, row.height_, window);

    if (slot.row_tiers_[k] != desired) {
      slot.row_tiers_[k] = desired;
      std::vector<QString> locators;
      if (slot.items_) {
        locators.reserve(row.Size());
        for (size_t n = row.start_; n < row.end_; ++n) {
          locators.push_back(resolver_ ? resolver_((*slot.items_)[n].item_id_, desired) : QString());
        }
      }
      slot.view_->SetRowSources(k, desired, locators);
    }
    row_top += row.height_;
  }
}
};  // namespace photoreel
