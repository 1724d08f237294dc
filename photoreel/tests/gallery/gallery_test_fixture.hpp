/// @file gallery_test_fixture.hpp
/// @brief Fakes and helpers shared by the gallery tests.
///
/// FakeSurface stands in for the Qt widget host and records what each section
/// view was told. FakeFragmentService holds every fetch until the test resolves
/// it, so delivery order is under test control.

#pragma once

#include <gtest/gtest.h>

#include <QEventLoop>
#include <QSignalSpy>
#include <QString>
#include <QTimer>

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "app/fragment_service.hpp"
#include "app/url_resolver.hpp"
#include "gallery/render_surface.hpp"
#include "type/gallery_types.hpp"

namespace photoreel::test {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Process the Qt event loop for up to @p ms milliseconds.
inline void ProcessEvents(int ms = 50) {
  QEventLoop loop;
  QTimer::singleShot(ms, &loop, &QEventLoop::quit);
  loop.exec();
}

inline bool WaitForSignal(QSignalSpy& spy, int timeoutMs = 2000) {
  if (!spy.isEmpty()) return true;
  return spy.wait(timeoutMs);
}

/// @p count items of identical size with ids "<prefix><index>".
inline auto MakeItems(size_t count, int width, int height, const std::string& prefix = "img")
    -> std::vector<ItemEntry> {
  std::vector<ItemEntry> items;
  items.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    items.push_back(ItemEntry{prefix + std::to_string(i), width, height,
                              static_cast<timestamp_t>(1'700'000'000 + i)});
  }
  return items;
}

inline auto MakeSections(const std::vector<size_t>& counts) -> std::vector<SectionEntry> {
  std::vector<SectionEntry> sections;
  for (size_t i = 0; i < counts.size(); ++i) {
    sections.push_back(SectionEntry{static_cast<timestamp_t>(1'700'000'000 - 86'400 * i),
                                    counts[i], static_cast<fragment_ref_t>(100 + i)});
  }
  return sections;
}

inline auto TestResolver() -> UrlResolver { return MakeTemplateUrlResolver("{quality}/{id}"); }

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

/// What a section view was told, kept after the view is destroyed.
struct ViewRecord {
  bool                     alive_             = false;
  int                      created_           = 0;
  int                      destroyed_         = 0;
  double                   top_               = 0.0;
  int                      placeholder_count_ = 0;
  int                      error_count_       = 0;
  QString                  error_{};
  int                      set_rows_count_    = 0;
  std::vector<RowContent>  rows_{};
  std::map<size_t, QualityTier> tiers_{};
  int                      source_updates_    = 0;
  int                      refresh_count_     = 0;
};

class FakeSectionView final : public SectionView {
 public:
  explicit FakeSectionView(ViewRecord& record) : record_(record) {
    record_.alive_ = true;
    ++record_.created_;
  }
  ~FakeSectionView() override {
    record_.alive_ = false;
    ++record_.destroyed_;
  }

  void SetTop(double top) override { record_.top_ = top; }
  void ShowPlaceholder(double) override {
    ++record_.placeholder_count_;
    record_.rows_.clear();
  }
  void ShowError(double, const QString& message) override {
    ++record_.error_count_;
    record_.error_ = message;
  }
  void SetRows(const std::vector<RowContent>& rows) override {
    ++record_.set_rows_count_;
    record_.rows_ = rows;
    record_.tiers_.clear();
  }
  void SetRowSources(size_t row, QualityTier tier, const std::vector<QString>& locators) override {
    ++record_.source_updates_;
    record_.tiers_[row] = tier;
    if (row < record_.rows_.size()) {
      auto& tiles = record_.rows_[row].tiles_;
      for (size_t k = 0; k < tiles.size() && k < locators.size(); ++k) {
        tiles[k].locator_ = locators[k];
      }
    }
  }
  void RefreshSelection() override { ++record_.refresh_count_; }

 private:
  ViewRecord& record_;
};

class FakeSurface final : public RenderSurface {
 public:
  FakeSurface(double width = 1000.0, double viewport_height = 800.0)
      : width_(width), viewport_height_(viewport_height) {}

  auto ContentWidth() const -> double override { return width_; }
  auto ViewportHeight() const -> double override { return viewport_height_; }
  auto ScrollOffset() const -> double override { return scroll_; }
  void ScrollToOffset(double offset) override {
    if (clamp_scroll_) {
      // Same limit a scroll bar applies: [0, content - viewport].
      offset = std::clamp(offset, 0.0, std::max(0.0, content_height_ - viewport_height_));
    }
    scroll_ = offset;
    scroll_requests_.push_back(offset);
  }
  void SetContentHeight(double height) override { content_height_ = height; }
  void SetScrollEnabled(bool enabled) override { scroll_enabled_ = enabled; }
  auto CreateSectionView(section_idx_t index, const SectionEntry&, SectionViewHost&)
      -> std::unique_ptr<SectionView> override {
    return std::make_unique<FakeSectionView>(records_[index]);
  }
  auto Notifier() -> SurfaceNotifier* override { return &notifier_; }

  /// Moves the viewport the way a user scroll would.
  void UserScroll(double offset) {
    scroll_ = offset;
    emit notifier_.Scrolled();
  }
  void UserResize(double width, double viewport_height) {
    width_           = width;
    viewport_height_ = viewport_height;
    emit notifier_.Resized();
  }

  auto Record(section_idx_t index) -> ViewRecord& { return records_[index]; }
  auto AliveCount() const -> int {
    int n = 0;
    for (const auto& [_, record] : records_) {
      n += record.alive_ ? 1 : 0;
    }
    return n;
  }

  double                          width_;
  double                          viewport_height_;
  double                          scroll_          = 0.0;
  double                          content_height_  = 0.0;
  bool                            scroll_enabled_  = true;
  bool                            clamp_scroll_    = false;
  std::vector<double>             scroll_requests_{};
  std::map<section_idx_t, ViewRecord> records_{};
  SurfaceNotifier                 notifier_;
};

/// Host stub for schedulers driven without a GalleryEngine.
class FakeHost final : public SectionViewHost {
 public:
  auto IsSectionSelected(section_idx_t) const -> bool override { return false; }
  auto IsItemSelected(section_idx_t, const item_id_t&) const -> bool override { return false; }
  void OnSelectorClicked(ItemLocation, bool) override {}
  void OnItemActivated(ItemLocation) override {}
  void OnRetryRequested(section_idx_t) override {}
};

/// Holds fetches until the test resolves them.
class FakeFragmentService final : public FragmentService {
 public:
  void FetchListing(fragment_ref_t ref, ListingCallback callback) override {
    listing_requests_.push_back(ref);
    listing_callbacks_.push_back(std::move(callback));
  }
  void FetchFragment(fragment_ref_t ref, FragmentCallback callback) override {
    fragment_requests_.push_back(ref);
    pending_fragments_.emplace_back(ref, std::move(callback));
  }

  void ResolveListing(std::vector<SectionEntry> sections) {
    auto callbacks = std::move(listing_callbacks_);
    listing_callbacks_.clear();
    for (auto& cb : callbacks) {
      cb(ListingResult{true, {}, sections});
    }
  }
  void FailListing(const std::string& message) {
    auto callbacks = std::move(listing_callbacks_);
    listing_callbacks_.clear();
    for (auto& cb : callbacks) {
      cb(ListingResult{false, message, {}});
    }
  }

  /// Resolves the oldest pending fetch of @p ref. Returns false if none is pending.
  bool ResolveFragment(fragment_ref_t ref, std::vector<ItemEntry> items) {
    return Complete(ref, FragmentResult{true, {}, std::move(items)});
  }
  bool FailFragment(fragment_ref_t ref, const std::string& message) {
    return Complete(ref, FragmentResult{false, message, {}});
  }

  /// Resolves every pending fetch from @p data, keyed by fragment ref.
  int ResolveAll(const std::map<fragment_ref_t, std::vector<ItemEntry>>& data) {
    auto pending = std::move(pending_fragments_);
    pending_fragments_.clear();
    int resolved = 0;
    for (auto& [ref, cb] : pending) {
      const auto it = data.find(ref);
      if (it == data.end()) {
        pending_fragments_.emplace_back(ref, std::move(cb));
        continue;
      }
      cb(FragmentResult{true, {}, it->second});
      ++resolved;
    }
    return resolved;
  }

  auto PendingFragments() const -> size_t { return pending_fragments_.size(); }
  auto PendingListings() const -> size_t { return listing_callbacks_.size(); }

  std::vector<fragment_ref_t> listing_requests_{};
  std::vector<fragment_ref_t> fragment_requests_{};

 private:
  bool Complete(fragment_ref_t ref, FragmentResult result) {
    for (auto it = pending_fragments_.begin(); it != pending_fragments_.end(); ++it) {
      if (it->first != ref) continue;
      auto cb = std::move(it->second);
      pending_fragments_.erase(it);
      cb(std::move(result));
      return true;
    }
    return false;
  }

  std::vector<ListingCallback>                                listing_callbacks_{};
  std::vector<std::pair<fragment_ref_t, FragmentCallback>>    pending_fragments_{};
};

}  // namespace photoreel::test
