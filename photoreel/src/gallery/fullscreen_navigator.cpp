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

#include "gallery/fullscreen_navigator.hpp"

#include <cmath>

namespace photoreel {

auto FullscreenNavigator::CurrentItem() const -> const ItemEntry* {
  const auto* items = store_.InRange(current_.section_) ? store_.Items(current_.section_) : nullptr;
  if (!items || current_.item_ < 0 || static_cast<size_t>(current_.item_) >= items->size()) {
    return nullptr;
  }
  return &(*items)[current_.item_];
}

auto FullscreenNavigator::Show(section_idx_t section, int item) -> bool {
  if (!MoveTo(section, item)) {
    return false;
  }
  if (!visible_) {
    visible_ = true;
    if (visibility_listener_) {
      visibility_listener_(true);
    }
  }
  return true;
}

void FullscreenNavigator::Hide() {
  press_x_.reset();
  if (!visible_) {
    return;
  }
  visible_ = false;
  if (visibility_listener_) {
    visibility_listener_(false);
  }
}

auto FullscreenNavigator::Next() -> bool {
  if (!visible_) {
    return false;
  }
  const auto* items = store_.Items(current_.section_);
  if (items && static_cast<size_t>(current_.item_ + 1) < items->size()) {
    return MoveTo(current_.section_, current_.item_ + 1);
  }
  const section_idx_t next = current_.section_ + 1;
  if (!store_.HasItems(next) || store_.Items(next)->empty()) {
    return false;
  }
  return MoveTo(next, 0);
}

auto FullscreenNavigator::Previous() -> bool {
  if (!visible_) {
    return false;
  }
  if (current_.item_ > 0) {
    return MoveTo(current_.section_, current_.item_ - 1);
  }
  const section_idx_t prev = current_.section_ - 1;
  if (!store_.HasItems(prev) || store_.Items(prev)->empty()) {
    return false;
  }
  return MoveTo(prev, static_cast<int>(store_.Items(prev)->size()) - 1);
}

auto FullscreenNavigator::HandleKey(int key) -> bool {
  if (!visible_) {
    return false;
  }
  switch (key) {
    case Qt::Key_Left:
      Previous();
      return true;
    case Qt::Key_Right:
      Next();
      return true;
    case Qt::Key_Space:
      Hide();
      return true;
    default:
      return false;
  }
}

void FullscreenNavigator::HandlePress(double x) {
  if (visible_) {
    press_x_ = x;
  }
}

void FullscreenNavigator::HandleRelease(double x, double width) {
  if (!visible_ || width <= 0.0) {
    press_x_.reset();
    return;
  }
  const double start = press_x_.value_or(x);
  press_x_.reset();

  const double drag  = x - start;
  if (std::abs(drag) > config_.drag_fraction_ * width) {
    if (drag > 0.0) {
      Previous();
    } else {
      Next();
    }
    return;
  }

  const double margin = config_.edge_margin_ * width;
  if (x > width - margin) {
    Next();
  } else if (x < margin) {
    Previous();
  } else {
    Hide();
  }
}

auto FullscreenNavigator::MoveTo(section_idx_t section, int item) -> bool {
  const auto* items = store_.InRange(section) ? store_.Items(section) : nullptr;
  if (!items || item < 0 || static_cast<size_t>(item) >= items->size()) {
    return false;
  }
  current_ = {section, item};
  if (page_listener_) {
    page_listener_(current_);
  }
  return true;
}
};  // namespace photoreel
