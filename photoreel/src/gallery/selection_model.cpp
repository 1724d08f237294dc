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

#include "gallery/selection_model.hpp"

#include <algorithm>

namespace photoreel {

auto SelectionModel::IsSelected(section_idx_t section) const -> bool {
  const auto it = selected_.find(section);
  return it != selected_.end() && std::holds_alternative<SelectAll>(it->second);
}

auto SelectionModel::IsSelected(section_idx_t section, const item_id_t& item) const -> bool {
  const auto it = selected_.find(section);
  if (it == selected_.end()) {
    return false;
  }
  if (std::holds_alternative<SelectAll>(it->second)) {
    return true;
  }
  return std::get<PartialSelection>(it->second).contains(item);
}

auto SelectionModel::IsSelected(const ItemLocation& location) const -> bool {
  if (location.IsHeader()) {
    return IsSelected(location.section_);
  }
  const auto* items = store_.Items(location.section_);
  if (!items || location.item_ < 0 || static_cast<size_t>(location.item_) >= items->size()) {
    return false;
  }
  return IsSelected(location.section_, (*items)[location.item_].item_id_);
}

auto SelectionModel::State(section_idx_t section) const -> const SectionSelection* {
  const auto it = selected_.find(section);
  return it == selected_.end() ? nullptr : &it->second;
}

auto SelectionModel::SortLocations(const ItemLocation& a, const ItemLocation& b)
    -> std::pair<ItemLocation, ItemLocation> {
  // kHeader is -1, so a header sorts right before item 0 of its section.
  if (a.section_ != b.section_) {
    return a.section_ < b.section_ ? std::pair{a, b} : std::pair{b, a};
  }
  return a.item_ <= b.item_ ? std::pair{a, b} : std::pair{b, a};
}

void SelectionModel::Click(const ItemLocation& location, bool shift) {
  if (!store_.InRange(location.section_)) {
    return;
  }
  if (shift) {
    RangeSet(last_clicked_, location, !IsSelected(location));
  } else {
    Toggle(location);
  }
  last_clicked_ = location;
}

void SelectionModel::Toggle(const ItemLocation& location) {
  const auto section = location.section_;
  if (!store_.InRange(section)) {
    return;
  }
  if (location.IsHeader()) {
    SetSection(section, !IsSelected(section));
    return;
  }

  const auto* items = store_.Items(section);
  if (!items || location.item_ < 0 || static_cast<size_t>(location.item_) >= items->size()) {
    return;
  }
  const auto& id  = (*items)[location.item_].item_id_;
  auto*       set = OpenPartial(section);
  if (set->contains(id)) {
    set->erase(id);
  } else {
    set->insert(id);
  }
  Commit(section);
  Notify({section});
}

void SelectionModel::SetSection(section_idx_t section, bool value) {
  if (!store_.InRange(section)) {
    return;
  }
  SetSectionQuiet(section, value);
  Notify({section});
}

void SelectionModel::RangeSet(const ItemLocation& from, const ItemLocation& to, bool value) {
  auto [s, l] = SortLocations(from, to);

  // A header endpoint pulls the whole section into the range.
  section_idx_t first = s.IsHeader() ? s.section_ - 1 : s.section_;
  section_idx_t last  = l.IsHeader() ? l.section_ + 1 : l.section_;

  std::vector<section_idx_t> touched;
  if (first == last) {
    SubRangeSet(first, s.item_, l.item_, value);
    touched.push_back(first);
  } else {
    if (!s.IsHeader()) {
      const auto* items = store_.Items(first);
      if (items) {
        SubRangeSet(first, s.item_, static_cast<int>(items->size()) - 1, value);
        touched.push_back(first);
      }
    }
    const section_idx_t begin = std::max(first + 1, 0);
    const section_idx_t end   = std::min(last, store_.Count());
    for (section_idx_t k = begin; k < end; ++k) {
      SetSectionQuiet(k, value);
      touched.push_back(k);
    }
    if (!l.IsHeader()) {
      SubRangeSet(last, 0, l.item_, value);
      touched.push_back(last);
    }
  }
  Notify(std::move(touched));
}

void SelectionModel::SubRangeSet(section_idx_t section, int start, int stop, bool value) {
  const auto* items = store_.Items(section);
  if (!items || items->empty()) {
    return;
  }
  start = std::max(start, 0);
  stop  = std::min(stop, static_cast<int>(items->size()) - 1);
  if (start > stop) {
    return;
  }

  auto* set = OpenPartial(section);
  for (int k = start; k <= stop; ++k) {
    const auto& id = (*items)[k].item_id_;
    if (value) {
      set->insert(id);
    } else {
      set->erase(id);
    }
  }
  Commit(section);
}

void SelectionModel::SetSectionQuiet(section_idx_t section, bool value) {
  if (value) {
    selected_[section] = SelectAll{};
  } else {
    selected_.erase(section);
  }
}

auto SelectionModel::OpenPartial(section_idx_t section) -> PartialSelection* {
  auto it = selected_.find(section);
  if (it == selected_.end()) {
    it = selected_.emplace(section, PartialSelection{}).first;
  } else if (std::holds_alternative<SelectAll>(it->second)) {
    PartialSelection expanded;
    if (const auto* items = store_.Items(section)) {
      for (const auto& item : *items) {
        expanded.insert(item.item_id_);
      }
    }
    it->second = std::move(expanded);
  }
  return &std::get<PartialSelection>(it->second);
}

void SelectionModel::Commit(section_idx_t section) {
  auto it = selected_.find(section);
  if (it == selected_.end() || std::holds_alternative<SelectAll>(it->second)) {
    return;
  }
  const auto& set   = std::get<PartialSelection>(it->second);
  const auto* items = store_.Items(section);
  if (set.empty()) {
    selected_.erase(it);
  } else if (items && set.size() == items->size()) {
    it->second = SelectAll{};
  }
}

void SelectionModel::Clear() {
  std::vector<section_idx_t> touched;
  touched.reserve(selected_.size());
  for (const auto& [section, _] : selected_) {
    touched.push_back(section);
  }
  selected_.clear();
  last_clicked_ = {0, ItemLocation::kHeader};
  Notify(std::move(touched));
}

auto SelectionModel::SelectedCount() const -> size_t {
  size_t total = 0;
  for (const auto& [section, state] : selected_) {
    if (std::holds_alternative<SelectAll>(state)) {
      const auto* items = store_.Items(section);
      total += items ? items->size() : store_.Entry(section).item_count_;
    } else {
      total += std::get<PartialSelection>(state).size();
    }
  }
  return total;
}

auto SelectionModel::SelectedItems() const -> std::vector<std::pair<section_idx_t, item_id_t>> {
  std::vector<std::pair<section_idx_t, item_id_t>> out;
  for (const auto& [section, state] : selected_) {
    const auto* items = store_.Items(section);
    if (!items) {
      continue;
    }
    // Emit in listing order rather than hash order.
    for (const auto& item : *items) {
      if (IsSelected(section, item.item_id_)) {
        out.emplace_back(section, item.item_id_);
      }
    }
  }
  return out;
}

void SelectionModel::Notify(std::vector<section_idx_t> sections) {
  if (listener_ && !sections.empty()) {
    listener_(sections);
  }
}
};  // namespace photoreel
