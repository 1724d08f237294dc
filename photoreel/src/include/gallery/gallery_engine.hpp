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

#include <QElapsedTimer>
#include <QMetaObject>
#include <QObject>
#include <QString>

#include <cstdint>
#include <memory>
#include <set>
#include <vector>

#include "app/fragment_service.hpp"
#include "app/url_resolver.hpp"
#include "concurrency/debouncer.hpp"
#include "config/gallery_config.hpp"
#include "gallery/fullscreen_navigator.hpp"
#include "gallery/quality_scheduler.hpp"
#include "gallery/render_surface.hpp"
#include "gallery/section_store.hpp"
#include "gallery/selection_model.hpp"
#include "gallery/window_scheduler.hpp"

namespace photoreel {

/**
 * @brief Drives a virtualized gallery on a host surface.
 *
 * Start() fetches the head listing and installs the sections. From then on the
 * engine reacts to scroll and resize notifications of the surface, fetches
 * fragments for sections entering the band and applies their layouts once per
 * frame. Everything runs on the thread that owns the engine; fetch completions
 * are expected to be delivered back to it.
 *
 * The surface must outlive the engine.
 */
class GalleryEngine final : public QObject, public SectionViewHost {
  Q_OBJECT

 public:
  GalleryEngine(RenderSurface& surface, std::shared_ptr<FragmentService> service,
                UrlResolver resolver, GalleryConfig config = {}, QObject* parent = nullptr);
  ~GalleryEngine() override;

  void Start(fragment_ref_t head);
  void Uninstall();
  auto IsInstalled() const -> bool { return installed_; }

  /// Runs one frame: band maintenance, pending layouts, selection refresh, quality.
  void Tick();
  auto IsFramePending() const -> bool { return frame_.IsPending(); }
  auto IsResizePending() const -> bool { return resize_.IsPending(); }

  void ScrollTo(section_idx_t section, int item);
  void Retry(section_idx_t section);

  auto Store() const -> const SectionStore& { return store_; }
  auto Selection() -> SelectionModel& { return selection_; }
  auto Selection() const -> const SelectionModel& { return selection_; }
  auto Fullscreen() -> FullscreenNavigator& { return fullscreen_; }
  auto Windows() const -> const WindowScheduler& { return windows_; }
  auto Quality() const -> const QualityScheduler& { return quality_; }
  auto Config() const -> const GalleryConfig& { return config_; }

  auto IsSectionSelected(section_idx_t section) const -> bool override;
  auto IsItemSelected(section_idx_t section, const item_id_t& item) const -> bool override;
  void OnSelectorClicked(ItemLocation location, bool shift) override;
  void OnItemActivated(ItemLocation location) override;
  void OnRetryRequested(section_idx_t section) override;

 signals:
  void Installed(int section_count);
  void InstallFailed(const QString& message);
  void SectionFailed(int section, const QString& message);
  void SelectionChanged();
  void FullscreenVisibilityChanged(bool visible);
  void FullscreenSourceChanged(const QString& locator);

 private:
  void                             OnListing(ListingResult result);
  void                             Install(std::vector<SectionEntry> sections);
  void                             OnScrolled();
  void                             OnResized();
  void                             ApplyResize();
  void                             RequestFragment(section_idx_t section, fragment_ref_t ref,
                                                   uint64_t generation);
  void                             OnFragment(section_idx_t section, uint64_t generation,
                                              FragmentResult result);
  void                             RefreshDirtySelection();

  GalleryConfig                    config_;
  RenderSurface&                   surface_;
  std::shared_ptr<FragmentService> service_;
  UrlResolver                      resolver_;

  SectionStore                     store_;
  SelectionModel                   selection_;
  FullscreenNavigator              fullscreen_;
  WindowScheduler                  windows_;
  QualityScheduler                 quality_;
  FrameCoalescer                   frame_;
  TrailingDebouncer                resize_;

  std::vector<QMetaObject::Connection> connections_{};
  std::set<section_idx_t>          dirty_sections_{};
  QElapsedTimer                    clock_;

  // Bumped on every Start() and Uninstall(); callbacks from an older epoch are dropped.
  uint64_t                         epoch_         = 0;
  bool                             installed_     = false;
  double                           content_width_ = 0.0;
};
};  // namespace photoreel
