#pragma once

#include <QPixmap>
#include <QString>
#include <QWidget>

#include <optional>
#include <vector>

#include "gallery/render_surface.hpp"
#include "utils/cache/lru_cache.hpp"

class QLabel;
class QPushButton;

namespace photoreel::ui {

using PixmapCache = LruCache<QString, QPixmap>;

/// Header with date and selector above a justified grid of tiles.
class SectionWidget final : public QWidget {
 public:
  SectionWidget(section_idx_t index, const SectionEntry& entry, double header_height,
                SectionViewHost& host, PixmapCache& cache, QWidget* parent = nullptr);

  void SetTop(double top);
  void ShowPlaceholder(double body_height);
  void ShowError(double body_height, const QString& message);
  void SetRows(const std::vector<RowContent>& rows);
  void SetRowSources(size_t row, QualityTier tier, const std::vector<QString>& locators);
  void RefreshSelection() { update(); }

 protected:
  void paintEvent(QPaintEvent*) override;
  void mouseReleaseEvent(QMouseEvent* event) override;

 private:
  enum class Mode { Placeholder, Error, Rows };

  struct Hit {
    ItemLocation location_{};
    bool         selector_ = false;
  };

  void                     SetBodyHeight(double body_height);
  auto                     HitTest(const QPointF& pos) const -> std::optional<Hit>;
  auto                     TileRect(size_t row, size_t tile) const -> QRectF;
  auto                     PixmapFor(const QString& locator, const QSize& size) -> QPixmap;

  section_idx_t            index_;
  SectionEntry             entry_;
  double                   header_height_;
  SectionViewHost&         host_;
  PixmapCache&             cache_;

  Mode                     mode_ = Mode::Placeholder;
  std::vector<RowContent>  rows_{};
  QString                  date_text_{};
  QLabel*                  error_label_  = nullptr;
  QPushButton*             retry_button_ = nullptr;
};
};  // namespace photoreel::ui
