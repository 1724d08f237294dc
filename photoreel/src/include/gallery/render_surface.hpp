#pragma once

#include <QObject>
#include <QString>

#include <memory>
#include <vector>

#include "type/gallery_types.hpp"

namespace photoreel {

/// One tile of a materialized row.
struct TileContent {
  int       index_  = 0;
  item_id_t item_id_{};
  double    width_  = 0.0;
  double    height_ = 0.0;
  QString   locator_{};
};

struct RowContent {
  double                   height_ = 0.0;
  std::vector<TileContent> tiles_{};
};

/// Callbacks a section view uses to reach the engine.
class SectionViewHost {
 public:
  virtual ~SectionViewHost()                                                           = default;
  virtual auto IsSectionSelected(section_idx_t section) const -> bool                  = 0;
  virtual auto IsItemSelected(section_idx_t section, const item_id_t& item) const -> bool = 0;
  virtual void OnSelectorClicked(ItemLocation location, bool shift)                    = 0;
  virtual void OnItemActivated(ItemLocation location)                                  = 0;
  virtual void OnRetryRequested(section_idx_t section)                                 = 0;
};

/// Render handle of one bound section. Owned exclusively by SectionStore.
class SectionView {
 public:
  virtual ~SectionView()                                      = default;

  virtual void SetTop(double top)                             = 0;
  virtual void ShowPlaceholder(double body_height)            = 0;
  virtual void ShowError(double body_height, const QString& message) = 0;
  virtual void SetRows(const std::vector<RowContent>& rows)   = 0;
  virtual void SetRowSources(size_t row, QualityTier tier, const std::vector<QString>& locators) = 0;
  virtual void RefreshSelection()                             = 0;
};

/// Emits the host notifications the engine subscribes to.
class SurfaceNotifier : public QObject {
  Q_OBJECT

 public:
  using QObject::QObject;

 signals:
  void Scrolled();
  void Resized();
};

/**
 * @brief The container the engine renders into.
 *
 * Offsets are measured from the top of the container. ScrollOffset() may be
 * negative when the container starts below the top of the viewport.
 */
class RenderSurface {
 public:
  virtual ~RenderSurface()                                 = default;

  virtual auto ContentWidth() const -> double              = 0;
  virtual auto ViewportHeight() const -> double            = 0;
  virtual auto ScrollOffset() const -> double              = 0;
  virtual void ScrollToOffset(double offset)               = 0;
  virtual void SetContentHeight(double height)             = 0;
  virtual void SetScrollEnabled(bool enabled)              = 0;
  virtual auto CreateSectionView(section_idx_t index, const SectionEntry& entry,
                                 SectionViewHost& host) -> std::unique_ptr<SectionView> = 0;
  virtual auto Notifier() -> SurfaceNotifier*              = 0;
};
};  // namespace photoreel
