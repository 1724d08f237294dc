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

#include "gallery/gallery_engine.hpp"

#include <QPointer>
#include <QtGlobal>

#include <cmath>
#include <utility>

namespace photoreel {

GalleryEngine::GalleryEngine(RenderSurface& surface, std::shared_ptr<FragmentService> service,
                             UrlResolver resolver, GalleryConfig config, QObject* parent)
    : QObject(parent),
      config_(std::move(config)),
      surface_(surface),
      service_(std::move(service)),
      resolver_(std::move(resolver)),
      selection_(store_),
      fullscreen_(store_, config_),
      windows_(store_, surface_, *this, config_, resolver_),
      quality_(store_, surface_, config_, resolver_, [this]() { return windows_.Band(); }),
      frame_(config_.frame_interval_ms_, [this]() { Tick(); }),
      resize_(config_.resize_debounce_ms_, [this]() { ApplyResize(); }) {
  config_.Validate();
  clock_.start();

  windows_.SetFragmentRequester([this](section_idx_t section, fragment_ref_t ref,
                                       uint64_t generation) {
    RequestFragment(section, ref, generation);
  });
  windows_.SetFrameRequester([this]() { frame_.Trigger(); });
  windows_.SetLayoutListener([this](section_idx_t section) {
    if (!quality_.IsPending()) {
      quality_.EvaluateSection(section);
    }
  });

  selection_.SetChangeListener([this](const std::vector<section_idx_t>& sections) {
    dirty_sections_.insert(sections.begin(), sections.end());
    if (installed_) {
      frame_.Trigger();
    }
    emit SelectionChanged();
  });

  fullscreen_.SetPageListener([this](const ItemLocation& location) {
    windows_.ScrollTo(location.section_, location.item_);
    const auto* item = fullscreen_.CurrentItem();
    if (item && resolver_) {
      emit FullscreenSourceChanged(resolver_(item->item_id_, QualityTier::Large));
    }
  });
  fullscreen_.SetVisibilityListener([this](bool visible) {
    surface_.SetScrollEnabled(!visible);
    emit FullscreenVisibilityChanged(visible);
  });
}

GalleryEngine::~GalleryEngine() { Uninstall(); }

void GalleryEngine::Start(fragment_ref_t head) {
  Uninstall();
  if (!service_) {
    emit InstallFailed(QStringLiteral("No fragment service"));
    return;
  }

  const uint64_t          epoch = epoch_;
  QPointer<GalleryEngine> self(this);
  service_->FetchListing(head, [self, epoch](ListingResult result) {
    if (!self || self->epoch_ != epoch) {
      return;
    }
    self->OnListing(std::move(result));
  });
}

void GalleryEngine::OnListing(ListingResult result) {
  if (!result.success_) {
    const auto message = QString::fromStdString(result.error_);
    qWarning("Failed to load gallery listing: %s", qUtf8Printable(message));
    emit InstallFailed(message);
    return;
  }
  Install(std::move(result.sections_));
}

void GalleryEngine::Install(std::vector<SectionEntry> sections) {
  content_width_    = surface_.ContentWidth();
  const double ideal = config_.IdealHeightFor(content_width_);
  store_.Install(std::move(sections), config_.header_height_, ideal, content_width_);
  windows_.Reset();
  windows_.SetIdealHeight(ideal);
  quality_.Reset(surface_.ScrollOffset(), clock_.elapsed());

  if (auto* notifier = surface_.Notifier()) {
    connections_.push_back(
        connect(notifier, &SurfaceNotifier::Scrolled, this, &GalleryEngine::OnScrolled));
    connections_.push_back(
        connect(notifier, &SurfaceNotifier::Resized, this, &GalleryEngine::OnResized));
  }

  installed_ = true;
  emit Installed(store_.Count());
  Tick();
}

void GalleryEngine::Uninstall() {
  ++epoch_;
  for (auto& connection : connections_) {
    disconnect(connection);
  }
  connections_.clear();

  frame_.Cancel();
  resize_.Cancel();
  quality_.Cancel();

  if (!installed_) {
    return;
  }
  installed_ = false;
  fullscreen_.Hide();
  selection_.Clear();
  dirty_sections_.clear();
  store_.ReleaseAll();
  store_.Clear();
  windows_.Reset();
  surface_.SetContentHeight(0.0);
}

void GalleryEngine::Tick() {
  if (!installed_) {
    return;
  }
  windows_.Tick();
  RefreshDirtySelection();
  quality_.OnTick(surface_.ScrollOffset(), clock_.elapsed(), windows_.IdealHeight());
}

void GalleryEngine::OnScrolled() { frame_.Trigger(); }

void GalleryEngine::OnResized() {
  resize_.Trigger();
  // Viewport height changes only need a new band.
  frame_.Trigger();
}

void GalleryEngine::ApplyResize() {
  if (!installed_) {
    return;
  }
  const double width = surface_.ContentWidth();
  if (std::abs(width - content_width_) <= config_.resize_threshold_px_) {
    return;
  }
  content_width_     = width;
  const double ideal = config_.IdealHeightFor(width);
  store_.Reestimate(ideal, width);
  windows_.SetIdealHeight(ideal);
  windows_.Relayout();
  frame_.Trigger();
}

void GalleryEngine::RequestFragment(section_idx_t section, fragment_ref_t ref,
                                    uint64_t generation) {
  if (!service_) {
    return;
  }
  const uint64_t          epoch = epoch_;
  QPointer<GalleryEngine> self(this);
  service_->FetchFragment(ref, [self, epoch, section, generation](FragmentResult result) {
    if (!self || self->epoch_ != epoch) {
      return;
    }
    self->OnFragment(section, generation, std::move(result));
  });
}

void GalleryEngine::OnFragment(section_idx_t section, uint64_t generation, FragmentResult result) {
  if (!store_.InRange(section)) {
    return;
  }
  if (!result.success_) {
    const auto message = QString::fromStdString(result.error_);
    qWarning("Failed to load section %d: %s", section, qUtf8Printable(message));
    if (store_.Generation(section) == generation) {
      windows_.Fail(section, generation, message);
      emit SectionFailed(section, message);
    }
    return;
  }
  windows_.Receive(section, generation,
                   std::make_shared<const std::vector<ItemEntry>>(std::move(result.items_)));
}

void GalleryEngine::RefreshDirtySelection() {
  for (const auto section : dirty_sections_) {
    if (auto* view = store_.View(section)) {
      view->RefreshSelection();
    }
  }
  dirty_sections_.clear();
}

void GalleryEngine::ScrollTo(section_idx_t section, int item) {
  if (installed_) {
    windows_.ScrollTo(section, item);
  }
}

void GalleryEngine::Retry(section_idx_t section) {
  if (installed_) {
    windows_.Retry(section);
  }
}

auto GalleryEngine::IsSectionSelected(section_idx_t section) const -> bool {
  return selection_.IsSelected(section);
}

auto GalleryEngine::IsItemSelected(section_idx_t section, const item_id_t& item) const -> bool {
  return selection_.IsSelected(section, item);
}

void GalleryEngine::OnSelectorClicked(ItemLocation location, bool shift) {
  selection_.Click(location, shift);
}

void GalleryEngine::OnItemActivated(ItemLocation location) {
  fullscreen_.Show(location.section_, location.item_);
}

void GalleryEngine::OnRetryRequested(section_idx_t section) { Retry(section); }
};  // namespace photoreel
