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

#include "ui/gallery_view/gallery_widget.hpp"

#include <QKeyEvent>
#include <QPointer>
#include <QResizeEvent>
#include <QScrollBar>
#include <QWheelEvent>

#include <algorithm>
#include <cmath>

namespace photoreel::ui {
namespace {
/// Owns a section widget on behalf of the engine. The canvas may already have
/// deleted the widget when the handle goes away.
class SectionHandle final : public SectionView {
 public:
  explicit SectionHandle(SectionWidget* widget) : widget_(widget) {}
  ~SectionHandle() override {
    if (widget_) {
      widget_->hide();
      widget_->deleteLater();
    }
  }

  void SetTop(double top) override {
    if (widget_) widget_->SetTop(top);
  }
  void ShowPlaceholder(double body_height) override {
    if (widget_) widget_->ShowPlaceholder(body_height);
  }
  void ShowError(double body_height, const QString& message) override {
    if (widget_) widget_->ShowError(body_height, message);
  }
  void SetRows(const std::vector<RowContent>& rows) override {
    if (widget_) widget_->SetRows(rows);
  }
  void SetRowSources(size_t row, QualityTier tier, const std::vector<QString>& locators) override {
    if (widget_) widget_->SetRowSources(row, tier, locators);
  }
  void RefreshSelection() override {
    if (widget_) widget_->RefreshSelection();
  }

 private:
  QPointer<SectionWidget> widget_;
};
}  // namespace

GalleryWidget::GalleryWidget(double header_height, QWidget* parent)
    : QScrollArea(parent), header_height_(header_height) {
  setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
  setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOn);
  setWidgetResizable(false);
  setFrameShape(QFrame::NoFrame);

  canvas_ = new QWidget();
  canvas_->setAutoFillBackground(true);
  canvas_->resize(viewport()->width(), 0);
  setWidget(canvas_);

  notifier_ = new SurfaceNotifier(this);
  connect(verticalScrollBar(), &QScrollBar::valueChanged, notifier_,
          [this](int) { emit notifier_->Scrolled(); });
}

auto GalleryWidget::ContentWidth() const -> double { return viewport()->width(); }

auto GalleryWidget::ViewportHeight() const -> double { return viewport()->height(); }

auto GalleryWidget::ScrollOffset() const -> double { return verticalScrollBar()->value(); }

void GalleryWidget::ScrollToOffset(double offset) {
  verticalScrollBar()->setValue(static_cast<int>(std::lround(offset)));
}

void GalleryWidget::SetContentHeight(double height) {
  const int h = static_cast<int>(std::ceil(std::max(0.0, height)));
  if (canvas_->height() != h || canvas_->width() != viewport()->width()) {
    canvas_->resize(viewport()->width(), h);
  }
}

void GalleryWidget::SetScrollEnabled(bool enabled) {
  scroll_enabled_ = enabled;
  verticalScrollBar()->setEnabled(enabled);
}

auto GalleryWidget::CreateSectionView(section_idx_t index, const SectionEntry& entry,
                                      SectionViewHost& host) -> std::unique_ptr<SectionView> {
  auto* widget = new SectionWidget(index, entry, header_height_, host, pixmaps_, canvas_);
  return std::make_unique<SectionHandle>(widget);
}

void GalleryWidget::resizeEvent(QResizeEvent* event) {
  QScrollArea::resizeEvent(event);
  canvas_->resize(viewport()->width(), canvas_->height());
  emit notifier_->Resized();
}

void GalleryWidget::wheelEvent(QWheelEvent* event) {
  if (!scroll_enabled_) {
    event->accept();
    return;
  }
  QScrollArea::wheelEvent(event);
}

void GalleryWidget::keyPressEvent(QKeyEvent* event) {
  if (!scroll_enabled_) {
    event->ignore();
    return;
  }
  QScrollArea::keyPressEvent(event);
}
};  // namespace photoreel::ui
