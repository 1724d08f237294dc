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

#include "ui/gallery_view/fullscreen_widget.hpp"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>

#include "gallery/fullscreen_navigator.hpp"

namespace photoreel::ui {

FullscreenWidget::FullscreenWidget(FullscreenNavigator& navigator, QWidget* parent)
    : QWidget(parent), navigator_(navigator) {
  setFocusPolicy(Qt::StrongFocus);
  setAttribute(Qt::WA_OpaquePaintEvent);
  hide();
}

void FullscreenWidget::SetVisibleState(bool visible) {
  if (visible) {
    show();
    raise();
    setFocus(Qt::OtherFocusReason);
  } else {
    hide();
    pixmap_  = QPixmap();
    locator_.clear();
  }
}

void FullscreenWidget::SetSource(const QString& locator) {
  if (locator == locator_) {
    return;
  }
  locator_ = locator;
  pixmap_  = QPixmap(locator);
  if (pixmap_.isNull()) {
    qWarning("Failed to load image %s", qUtf8Printable(locator));
  }
  update();
}

void FullscreenWidget::paintEvent(QPaintEvent*) {
  QPainter painter(this);
  painter.fillRect(rect(), Qt::black);
  if (pixmap_.isNull()) {
    return;
  }
  const auto scaled = pixmap_.size().scaled(size(), Qt::KeepAspectRatio);
  const QRect target((width() - scaled.width()) / 2, (height() - scaled.height()) / 2,
                     scaled.width(), scaled.height());
  painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
  painter.drawPixmap(target, pixmap_);
}

void FullscreenWidget::keyPressEvent(QKeyEvent* event) {
  if (!navigator_.HandleKey(event->key())) {
    QWidget::keyPressEvent(event);
  }
}

void FullscreenWidget::mousePressEvent(QMouseEvent* event) {
  navigator_.HandlePress(event->position().x());
}

void FullscreenWidget::mouseReleaseEvent(QMouseEvent* event) {
  navigator_.HandleRelease(event->position().x(), width());
}
};  // namespace photoreel::ui
