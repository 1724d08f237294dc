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

#include "gallery/section_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace photoreel {

void SectionStore::Install(std::vector<SectionEntry> sections, double header_height,
                           double ideal_height, double content_width) {
  ReleaseAll();
  slots_.clear();
  slots_.resize(sections.size());
  for (size_t i = 0; i < sections.size(); ++i) {
    slots_[i].entry_ = sections[i];
  }
  header_height_ = std::max(0.0, header_height);
  offsets_.assign(slots_.size() + 1, 0.0);
  offset_head_ = 0;
  Reestimate(ideal_height, content_width);
}

void SectionStore::Reestimate(double ideal_height, double content_width) {
  const double per_item =
      content_width > 0.0 ? ideal_height * ideal_height / content_width : ideal_height;

  total_height_ = 0.0;
  for (auto& slot : slots_) {
    if (slot.items_ == nullptr) {
      const double body =
          std::max(ideal_height, per_item * static_cast<double>(slot.entry_.item_count_));
      slot.height_ = std::max(0.0, header_height_ + body);
    }
    total_height_ += slot.height_;
  }
  offset_head_ = 0;
  if (rewind_listener_) {
    rewind_listener_(0);
  }
}

void SectionStore::Clear() {
  ReleaseAll();
  slots_.clear();
  offsets_.assign(1, 0.0);
  offset_head_  = 0;
  total_height_ = 0.0;
}

auto SectionStore::GetOffset(section_idx_t i) const -> double {
  if (i < 0 || i > Count()) {
    throw std::out_of_range("SectionStore::GetOffset index out of range");
  }
  for (; offset_head_ < i; ++offset_head_) {
    const auto x    = offset_head_;
    offsets_[x + 1] = offsets_[x] + slots_[x].height_;
  }
  return offsets_[i];
}

void SectionStore::SetHeight(section_idx_t i, double height) {
  auto&        slot = slots_.at(i);
  const double next = std::max(0.0, height);
  total_height_ += next - slot.height_;
  slot.height_ = next;

  if (offset_head_ > i) {
    offset_head_ = i;
  }
  if (rewind_listener_) {
    rewind_listener_(i);
  }
}

void SectionStore::SetItems(section_idx_t i, ItemList items) {
  auto& slot  = slots_.at(i);
  slot.items_ = std::move(items);
  slot.failed_ = false;
  slot.error_.clear();
}

auto SectionStore::Items(section_idx_t i) const -> const std::vector<ItemEntry>* {
  if (!InRange(i)) {
    return nullptr;
  }
  return slots_[i].items_.get();
}

void SectionStore::SetRows(section_idx_t i, std::vector<LayoutRow> rows) {
  auto& slot = slots_.at(i);
  slot.row_tiers_.assign(rows.size(), QualityTier::Small);
  slot.rows_ = std::move(rows);
}

void SectionStore::Bind(section_idx_t i, std::unique_ptr<SectionView> view) {
  auto& slot = slots_.at(i);
  slot.view_ = std::move(view);
}

void SectionStore::Release(section_idx_t i) {
  auto& slot = slots_.at(i);
  slot.view_.reset();
  slot.rows_.clear();
  slot.row_tiers_.clear();
}

void SectionStore::ReleaseAll() {
  for (auto& slot : slots_) {
    slot.view_.reset();
    slot.rows_.clear();
    slot.row_tiers_.clear();
  }
}

auto SectionStore::View(section_idx_t i) const -> SectionView* {
  if (!InRange(i)) {
    return nullptr;
  }
  return slots_[i].view_.get();
}

auto SectionStore::BoundCount() const -> int {
  return static_cast<int>(
      std::count_if(slots_.begin(), slots_.end(), [](const auto& s) { return s.view_ != nullptr; }));
}

void SectionStore::MarkRequested(section_idx_t i) {
  auto& slot              = slots_.at(i);
  slot.request_in_flight_ = true;
  slot.failed_            = false;
  slot.error_.clear();
}

void SectionStore::ClearRequest(section_idx_t i) { slots_.at(i).request_in_flight_ = false; }

void SectionStore::SetFailed(section_idx_t i, std::string message) {
  auto& slot              = slots_.at(i);
  slot.request_in_flight_ = false;
  slot.failed_            = true;
  slot.error_             = std::move(message);
}
};  // namespace photoreel
