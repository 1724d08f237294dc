#pragma once

#include <QScrollArea>

#include <memory>

#include "gallery/render_surface.hpp"
#include "ui/gallery_view/section_widget.hpp"

namespace photoreel::ui {

/**
 * @brief Scroll area hosting the gallery canvas.
 *
 * Section widgets are absolutely positioned children of the canvas; the
 * canvas height follows SetContentHeight().
 */
class GalleryWidget final : public QScrollArea, public RenderSurface {
 public:
  explicit GalleryWidget(double header_height, QWidget* parent = nullptr);

  auto ContentWidth() const -> double override;
  auto ViewportHeight() const -> double override;
  auto ScrollOffset() const -> double override;
  void ScrollToOffset(double offset) override;
  void SetContentHeight(double height) override;
  void SetScrollEnabled(bool enabled) override;
  auto CreateSectionView(section_idx_t index, const SectionEntry& entry, SectionViewHost& host)
      -> std::unique_ptr<SectionView> override;
  auto Notifier() -> SurfaceNotifier* override { return notifier_; }

  auto Pixmaps() -> PixmapCache& { return pixmaps_; }

 protected:
  void resizeEvent(QResizeEvent* event) override;
  void wheelEvent(QWheelEvent* event) override;
  void keyPressEvent(QKeyEvent* event) override;

 private:
  QWidget*         canvas_         = nullptr;
  SurfaceNotifier* notifier_       = nullptr;
  double           header_height_;
  bool             scroll_enabled_ = true;
  PixmapCache      pixmaps_{512};
};
};  // namespace photoreel::ui
