#pragma once

#include <QtGlobal>

#include <functional>
#include <utility>

#include "app/url_resolver.hpp"
#include "concurrency/debouncer.hpp"
#include "config/gallery_config.hpp"
#include "gallery/render_surface.hpp"
#include "gallery/section_store.hpp"

namespace photoreel {

/**
 * @brief Promotes rows near the viewport to the medium tier.
 *
 * While the user scrolls faster than idealHeight * velocity_factor px/ms the
 * evaluation is postponed until scrolling has been quiet for the debounce
 * interval. Rows keep the small tier as the always-present baseline.
 */
class QualityScheduler {
 public:
  using BandProvider = std::function<SectionBand()>;

  QualityScheduler(SectionStore& store, RenderSurface& surface, const GalleryConfig& config,
                   UrlResolver resolver, BandProvider band_provider);

  void Reset(double scroll_top, qint64 now_ms);
  void OnTick(double scroll_top, qint64 now_ms, double ideal_height);
  void Evaluate();
  void EvaluateSection(section_idx_t i);
  void Cancel() { debouncer_.Cancel(); }

  auto IsPending() const -> bool { return debouncer_.IsPending(); }
  auto LastVelocity() const -> double { return last_velocity_; }
  auto DesiredTier(section_idx_t i, size_t row) const -> QualityTier;

 private:
  auto                 RelativeWindow(section_idx_t i) const -> std::pair<double, double>;
  static auto          TierFor(double row_top, double row_height,
                               const std::pair<double, double>& window) -> QualityTier;

  SectionStore&        store_;
  RenderSurface&       surface_;
  const GalleryConfig& config_;
  UrlResolver          resolver_;
  BandProvider         band_provider_;
  TrailingDebouncer    debouncer_;

  double               last_scroll_   = 0.0;
  qint64               last_time_ms_  = 0;
  double               last_velocity_ = 0.0;
};
};  // namespace photoreel
