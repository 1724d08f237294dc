#pragma once

#include <QtCore/qnamespace.h>

#include <functional>
#include <optional>
#include <utility>

#include "config/gallery_config.hpp"
#include "gallery/section_store.hpp"

namespace photoreel {

/**
 * @brief Single-item viewer state with paging across section boundaries.
 *
 * Paging into an adjacent section only happens when that section's items are
 * already loaded. The navigator never issues fetches.
 */
class FullscreenNavigator {
 public:
  using PageListener       = std::function<void(const ItemLocation&)>;
  using VisibilityListener = std::function<void(bool)>;

  FullscreenNavigator(const SectionStore& store, const GalleryConfig& config)
      : store_(store), config_(config) {}

  void SetPageListener(PageListener listener) { page_listener_ = std::move(listener); }
  void SetVisibilityListener(VisibilityListener listener) {
    visibility_listener_ = std::move(listener);
  }

  auto Show(section_idx_t section, int item) -> bool;
  void Hide();
  auto Next() -> bool;
  auto Previous() -> bool;

  auto HandleKey(int key) -> bool;
  void HandlePress(double x);
  void HandleRelease(double x, double width);

  auto IsVisible() const -> bool { return visible_; }
  auto Current() const -> const ItemLocation& { return current_; }
  auto CurrentItem() const -> const ItemEntry*;

 private:
  auto MoveTo(section_idx_t section, int item) -> bool;

  const SectionStore&   store_;
  const GalleryConfig&  config_;

  ItemLocation          current_{0, 0};
  bool                  visible_ = false;
  std::optional<double> press_x_{};

  PageListener          page_listener_{};
  VisibilityListener    visibility_listener_{};
};
};  // namespace photoreel
